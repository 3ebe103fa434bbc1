#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "codeexec/limits.h"
#include "codeexec/log.h"
#include "codeexec/queue.h"
#include "codeexec/result_writer.h"

namespace codeexec {

enum class Profile { DEV, PROD };

// Detect profile from CODEEXEC_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: no fsync, debug console log, no event journal
// PROD: fsync on, info console log, event journal under /var/log/codeexec
void apply_profile_defaults(Profile p);

struct WorkerConfig {
    Profile profile{Profile::DEV};

    std::string queue_url;
    std::string queue_dir;
    ReceiveOptions receive;
    int queue_max_receives{0};

    std::string store_root{"/var/lib/codeexec/store"};
    std::string store_table{"code-executions"};
    bool store_fsync{false};
    int64_t sweep_interval_sec{3600};

    std::string worker_id;

    LimitsTable limits;
    std::vector<std::string> runtime{"docker"};

    RetryPolicy write_retry;
    int breaker_threshold{5};
    int64_t error_backoff_ms{5000};

    std::string heartbeat_path{"/tmp/worker-heartbeat"};
    int heartbeat_sec{30};

    std::string event_log;
    LogLevel log_level{LogLevel::INFO};
};

// "file:///abs/dir" or "/abs/dir" -> directory. Empty string on success.
std::string parse_queue_url(const std::string& url, std::string* dir);

// $CODEEXEC_WORKER_ID, else $HOSTNAME, else gethostname(), else "worker-001".
std::string default_worker_id();

// Non-empty when a message could become visible again while its job is still
// executing or its result is still being retried.
std::string visibility_budget_warning(const WorkerConfig& c);

// Read the CODEEXEC_* environment (after apply_profile_defaults).
// Returns nullopt with *err set on any fatal configuration problem.
std::optional<WorkerConfig> load_worker_config(std::string* err);

} // namespace codeexec
