#include "codeexec/config.h"
#include "codeexec/proc.h"
#include "codeexec/util.h"

#include <cmath>
#include <cstdlib>

#include <unistd.h>

namespace codeexec {

Profile detect_profile() {
    std::string val = lower_ascii(getenv_str("CODEEXEC_PROFILE"));
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("CODEEXEC_STORE_FSYNC", "0",     NO_OVERWRITE);
            setenv("CODEEXEC_LOG_LEVEL",   "debug", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("CODEEXEC_STORE_FSYNC", "1",    NO_OVERWRITE);
            setenv("CODEEXEC_LOG_LEVEL",   "info", NO_OVERWRITE);
            setenv("CODEEXEC_EVENT_LOG",   "/var/log/codeexec/events.jsonl", NO_OVERWRITE);
            break;
    }
}

std::string parse_queue_url(const std::string& url, std::string* dir) {
    static const std::string kFile = "file://";
    std::string path = url;
    if (url.compare(0, kFile.size(), kFile) == 0) {
        path = url.substr(kFile.size());
    } else if (url.find("://") != std::string::npos) {
        return "unsupported queue URL scheme: " + url;
    }
    if (path.empty() || path[0] != '/') return "queue URL must name an absolute path: " + url;
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    *dir = path;
    return "";
}

std::string default_worker_id() {
    std::string id = getenv_str("CODEEXEC_WORKER_ID");
    if (!id.empty()) return id;
    id = getenv_str("HOSTNAME");
    if (!id.empty()) return id;
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) == 0 && host[0]) return host;
    return "worker-001";
}

std::string visibility_budget_warning(const WorkerConfig& c) {
    int64_t budget_ms = (int64_t)std::ceil(c.limits.max_timeout_sec * 1000.0);
    for (int a = 1; a < c.write_retry.max_attempts; a++) {
        budget_ms += backoff_delay_ms(a, c.write_retry.base_delay_ms, c.write_retry.max_delay_ms);
    }
    const int64_t visibility_ms = (int64_t)c.receive.visibility_timeout_seconds * 1000;
    if (visibility_ms >= budget_ms) return "";
    return "visibility timeout " + std::to_string(c.receive.visibility_timeout_seconds) +
           "s is shorter than max execution plus write retries (" + std::to_string(budget_ms) +
           "ms); messages may be redelivered while still in progress";
}

// Reads an integer variable, failing when it is set but out of [lo, hi].
static bool int_in_range(const char* key, int64_t defv, int64_t lo, int64_t hi, int64_t* out, std::string* err) {
    int64_t v = getenv_i64(key, defv);
    if (v < lo || v > hi) {
        *err = std::string(key) + " must be in [" + std::to_string(lo) + ", " + std::to_string(hi) +
               "] (got " + std::to_string(v) + ")";
        return false;
    }
    *out = v;
    return true;
}

std::optional<WorkerConfig> load_worker_config(std::string* err) {
    std::string dummy;
    if (!err) err = &dummy;
    err->clear();

    WorkerConfig c;
    c.profile = detect_profile();

    c.queue_url = getenv_str("CODEEXEC_QUEUE_URL");
    if (c.queue_url.empty()) {
        *err = "CODEEXEC_QUEUE_URL environment variable is required";
        return std::nullopt;
    }
    std::string qerr = parse_queue_url(c.queue_url, &c.queue_dir);
    if (!qerr.empty()) { *err = qerr; return std::nullopt; }

    int64_t v = 0;
    if (!int_in_range("CODEEXEC_POLL_WAIT_SEC", 20, 0, 20, &v, err)) return std::nullopt;
    c.receive.wait_seconds = (int)v;
    if (!int_in_range("CODEEXEC_VISIBILITY_TIMEOUT_SEC", 30, 1, 43200, &v, err)) return std::nullopt;
    c.receive.visibility_timeout_seconds = (int)v;
    if (!int_in_range("CODEEXEC_MAX_MESSAGES", 1, 1, 10, &v, err)) return std::nullopt;
    c.receive.max_messages = (int)v;
    if (!int_in_range("CODEEXEC_QUEUE_MAX_RECEIVES", 0, 0, 1000, &v, err)) return std::nullopt;
    c.queue_max_receives = (int)v;

    c.store_root = getenv_str("CODEEXEC_STORE_ROOT", c.store_root);
    c.store_table = getenv_str("CODEEXEC_STORE_TABLE", c.store_table);
    if (c.store_table.find('/') != std::string::npos || c.store_table.front() == '.') {
        *err = "CODEEXEC_STORE_TABLE must be a plain name: " + c.store_table;
        return std::nullopt;
    }
    c.store_fsync = getenv_bool("CODEEXEC_STORE_FSYNC", false);
    if (!int_in_range("CODEEXEC_STORE_SWEEP_SEC", 3600, 0, 7 * 24 * 3600, &c.sweep_interval_sec, err)) return std::nullopt;

    c.worker_id = default_worker_id();

    c.limits = default_limits();
    std::string limits_file = getenv_str("CODEEXEC_LIMITS_FILE");
    if (!limits_file.empty()) {
        std::string lerr = load_limits_file(limits_file, &c.limits);
        if (!lerr.empty()) { *err = lerr; return std::nullopt; }
    }
    std::string perr = check_sandbox_policy(c.limits.policy);
    if (!perr.empty()) { *err = perr; return std::nullopt; }

    c.runtime = split_argv_quoted(getenv_str("CODEEXEC_CONTAINER_RUNTIME", "docker"));
    if (c.runtime.empty()) {
        *err = "CODEEXEC_CONTAINER_RUNTIME is not a valid command";
        return std::nullopt;
    }

    if (!int_in_range("CODEEXEC_WRITE_ATTEMPTS", 3, 1, 10, &v, err)) return std::nullopt;
    c.write_retry.max_attempts = (int)v;
    if (!int_in_range("CODEEXEC_WRITE_BACKOFF_MS", 1000, 0, 60000, &c.write_retry.base_delay_ms, err)) return std::nullopt;
    c.write_retry.max_delay_ms = c.write_retry.base_delay_ms * 8;

    if (!int_in_range("CODEEXEC_BREAKER_THRESHOLD", 5, 1, 1000, &v, err)) return std::nullopt;
    c.breaker_threshold = (int)v;
    if (!int_in_range("CODEEXEC_ERROR_BACKOFF_MS", 5000, 0, 600000, &c.error_backoff_ms, err)) return std::nullopt;

    c.heartbeat_path = getenv_str("CODEEXEC_HEARTBEAT_PATH", c.heartbeat_path);
    if (!int_in_range("CODEEXEC_HEARTBEAT_SEC", 30, 1, 3600, &v, err)) return std::nullopt;
    c.heartbeat_sec = (int)v;

    c.event_log = getenv_str("CODEEXEC_EVENT_LOG");
    c.log_level = parse_log_level(getenv_str("CODEEXEC_LOG_LEVEL", "info"));
    return c;
}

} // namespace codeexec
