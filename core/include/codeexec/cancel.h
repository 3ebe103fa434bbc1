#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace codeexec {

// Explicit stop context handed to every loop that must honor shutdown.
// Loops check it only at their safe points.
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            flag_.store(true);
        }
        cv_.notify_all();
    }

    bool cancelled() const { return flag_.load(); }

    // Sleep up to d. Returns true if the token was (or became) cancelled.
    template <class Rep, class Period>
    bool wait_for(std::chrono::duration<Rep, Period> d) {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_for(lk, d, [this] { return flag_.load(); });
    }

private:
    std::atomic<bool> flag_{false};
    std::mutex mu_;
    std::condition_variable cv_;
};

} // namespace codeexec
