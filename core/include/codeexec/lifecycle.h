#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

#include "codeexec/cancel.h"
#include "codeexec/consumer.h"

namespace codeexec {

inline constexpr int kExitOk = 0;
inline constexpr int kExitConfig = 2;
inline constexpr int kExitBreaker = 3;

// Consecutive-failure counter over poll cycles.
class CircuitBreaker {
public:
    explicit CircuitBreaker(int threshold = 5) : threshold_(threshold < 1 ? 1 : threshold) {}

    void record_success() { failures_ = 0; }
    // True once failures reach the threshold.
    bool record_failure() { return ++failures_ >= threshold_; }

    int failures() const { return failures_; }
    int threshold() const { return threshold_; }
    bool tripped() const { return failures_ >= threshold_; }

private:
    int threshold_;
    int failures_{0};
};

// Turns SIGTERM/SIGINT into token.cancel() on a dedicated thread.
//
// block_shutdown_signals() must run in main() before any thread is created so
// every thread inherits the blocked mask; the watcher collects the signals
// synchronously with sigtimedwait.
class SignalWatcher {
public:
    static std::string block_shutdown_signals();

    explicit SignalWatcher(CancellationToken& token);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void loop();

    CancellationToken& token_;
    std::atomic<bool> stop_{false};
    std::thread th_;
};

// Periodic liveness timestamp written to a file by an independent thread.
// Shares nothing with the main loop but the file it writes.
class Heartbeat {
public:
    Heartbeat(std::string path, std::chrono::milliseconds interval);
    ~Heartbeat();

    Heartbeat(const Heartbeat&) = delete;
    Heartbeat& operator=(const Heartbeat&) = delete;

    void start();
    void stop();

    // One write. Empty string on success.
    std::string beat();

    uint64_t beats() const { return beats_.load(); }
    uint64_t failures() const { return failures_.load(); }

private:
    std::string path_;
    std::chrono::milliseconds interval_;
    CancellationToken stop_;
    std::thread th_;
    std::atomic<uint64_t> beats_{0};
    std::atomic<uint64_t> failures_{0};
};

struct WorkerOptions {
    int breaker_threshold{5};
    int64_t error_backoff_ms{5000};
    int64_t sweep_interval_ms{3600 * 1000}; // 0 disables
};

// Main run loop: poll until cancelled, counting infrastructure errors.
class Worker {
public:
    Worker(QueueConsumer& consumer, WorkerOptions opts);

    // Called at loop boundaries every sweep_interval_ms with now (epoch sec).
    void set_sweeper(std::function<size_t(int64_t)> fn) { sweep_ = std::move(fn); }

    // kExitOk on cancellation, kExitBreaker when the breaker trips.
    int run(CancellationToken& token);

    const CircuitBreaker& breaker() const { return breaker_; }

private:
    void maybe_sweep();

    QueueConsumer& consumer_;
    WorkerOptions opts_;
    CircuitBreaker breaker_;
    std::function<size_t(int64_t)> sweep_;
    int64_t next_sweep_ms_{0};
};

} // namespace codeexec
