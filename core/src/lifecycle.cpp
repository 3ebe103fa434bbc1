#include "codeexec/lifecycle.h"
#include "codeexec/log.h"
#include "codeexec/util.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>

#include <pthread.h>
#include <time.h>

namespace codeexec {

static sigset_t shutdown_sigset() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGINT);
    return set;
}

std::string SignalWatcher::block_shutdown_signals() {
    sigset_t set = shutdown_sigset();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) return std::string("pthread_sigmask: ") + std::strerror(rc);
    return "";
}

SignalWatcher::SignalWatcher(CancellationToken& token) : token_(token) {
    th_ = std::thread([this] { loop(); });
}

SignalWatcher::~SignalWatcher() {
    stop_.store(true);
    if (th_.joinable()) th_.join();
}

void SignalWatcher::loop() {
    const sigset_t set = shutdown_sigset();
    const struct timespec slice{0, 250 * 1000 * 1000};
    while (!stop_.load()) {
        siginfo_t info;
        int sig = sigtimedwait(&set, &info, &slice);
        if (sig < 0) continue; // EAGAIN (slice elapsed) or EINTR
        log_info("signal", std::string("received ") + (sig == SIGTERM ? "SIGTERM" : "SIGINT") +
                 "; finishing current job before shutdown");
        token_.cancel();
    }
}

Heartbeat::Heartbeat(std::string path, std::chrono::milliseconds interval)
    : path_(std::move(path)), interval_(interval) {}

Heartbeat::~Heartbeat() {
    stop();
}

std::string Heartbeat::beat() {
    std::string err = write_atomic_file(path_, iso_utc_now() + "\n");
    if (err.empty()) {
        beats_++;
    } else {
        failures_++;
        log_warn("heartbeat", "write to " + path_ + " failed: " + err);
    }
    return err;
}

void Heartbeat::start() {
    if (th_.joinable()) return;
    th_ = std::thread([this] {
        do {
            (void)beat(); // failures are counted and logged, never fatal
        } while (!stop_.wait_for(interval_));
    });
}

void Heartbeat::stop() {
    stop_.cancel();
    if (th_.joinable()) th_.join();
}

Worker::Worker(QueueConsumer& consumer, WorkerOptions opts)
    : consumer_(consumer), opts_(opts), breaker_(opts.breaker_threshold) {}

void Worker::maybe_sweep() {
    if (!sweep_ || opts_.sweep_interval_ms <= 0) return;
    int64_t now = now_ms();
    if (now < next_sweep_ms_) return;
    next_sweep_ms_ = now + opts_.sweep_interval_ms;
    try {
        size_t n = sweep_(now / 1000);
        if (n) log_info("worker", "swept " + std::to_string(n) + " expired record(s)");
    } catch (const std::exception& e) {
        log_warn("worker", std::string("record sweep failed: ") + e.what());
    }
}

int Worker::run(CancellationToken& token) {
    while (!token.cancelled()) {
        maybe_sweep();

        std::string err;
        try {
            err = consumer_.poll_once(token);
        } catch (const std::exception& e) {
            err = std::string("unexpected error: ") + e.what();
        }
        if (err.empty()) {
            breaker_.record_success();
            continue;
        }

        bool tripped = breaker_.record_failure();
        log_error("worker", "queue error (" + std::to_string(breaker_.failures()) + "/" +
                  std::to_string(breaker_.threshold()) + "): " + err);
        if (tripped) {
            log_error("worker", "too many consecutive errors; shutting down worker");
            return kExitBreaker;
        }
        token.wait_for(std::chrono::milliseconds(opts_.error_backoff_ms));
    }
    log_info("worker", "worker shutting down gracefully");
    return kExitOk;
}

} // namespace codeexec
