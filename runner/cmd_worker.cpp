#include "cmd_worker.h"

#include "codeexec/config.h"
#include "codeexec/consumer.h"
#include "codeexec/lifecycle.h"
#include "codeexec/log.h"
#include "codeexec/queue.h"
#include "codeexec/result_writer.h"
#include "codeexec/sandbox.h"
#include "codeexec/store.h"

#include <iostream>

using namespace codeexec;

static void log_banner(const WorkerConfig& c) {
    log_info("worker", "worker " + c.worker_id + " started (profile=" + profile_name(c.profile) + ")");
    log_info("worker", "queue=" + c.queue_url + " store=" + c.store_root + "/" + c.store_table +
             " languages=" + c.limits.supported_list());
    log_info("worker", "poll wait=" + std::to_string(c.receive.wait_seconds) + "s visibility=" +
             std::to_string(c.receive.visibility_timeout_seconds) + "s max_messages=" +
             std::to_string(c.receive.max_messages));
}

int cmd_check_config(int argc, char** argv) {
    (void)argc; (void)argv;
    std::string err;
    auto cfg = load_worker_config(&err);
    if (!cfg) {
        std::cerr << "config error: " << err << "\n";
        return kExitConfig;
    }
    std::cout << "profile=" << profile_name(cfg->profile) << "\n"
              << "worker_id=" << cfg->worker_id << "\n"
              << "queue_dir=" << cfg->queue_dir << "\n"
              << "store=" << cfg->store_root << "/" << cfg->store_table << "\n"
              << "languages=" << cfg->limits.supported_list() << "\n"
              << "max_timeout_sec=" << cfg->limits.max_timeout_sec << "\n"
              << "config: OK\n";
    return kExitOk;
}

int cmd_worker(int argc, char** argv) {
    (void)argc; (void)argv;

    std::string err;
    auto loaded = load_worker_config(&err);
    if (!loaded) {
        log_error("worker", "fatal configuration error: " + err);
        return kExitConfig;
    }
    const WorkerConfig& cfg = *loaded;
    set_log_level(cfg.log_level);

    FileQueue queue(cfg.queue_dir, cfg.queue_max_receives);
    err = queue.init();
    if (!err.empty()) {
        log_error("worker", "cannot open queue " + cfg.queue_url + ": " + err);
        return kExitConfig;
    }
    FileRecordStore store(cfg.store_root, cfg.store_table, cfg.store_fsync);

    SandboxOptions sopts;
    sopts.runtime = cfg.runtime;
    SandboxExecutor executor(cfg.limits, sopts);

    ResultWriter writer(store, cfg.worker_id, cfg.write_retry);
    EventLog events(cfg.worker_id, cfg.event_log);
    QueueConsumer consumer(queue, executor, writer, cfg.limits, cfg.receive, &events);

    WorkerOptions wopts;
    wopts.breaker_threshold = cfg.breaker_threshold;
    wopts.error_backoff_ms = cfg.error_backoff_ms;
    wopts.sweep_interval_ms = cfg.sweep_interval_sec * 1000;
    Worker worker(consumer, wopts);
    worker.set_sweeper([&store](int64_t now) { return store.sweep_expired(now); });

    log_banner(cfg);
    std::string vwarn = visibility_budget_warning(cfg);
    if (!vwarn.empty()) log_warn("worker", vwarn);

    CancellationToken token;
    Heartbeat heartbeat(cfg.heartbeat_path, std::chrono::seconds(cfg.heartbeat_sec));
    heartbeat.start();
    int rc;
    {
        SignalWatcher signals(token);
        rc = worker.run(token);
    }
    heartbeat.stop();
    log_info("worker", "exit code " + std::to_string(rc));
    return rc;
}
