#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "codeexec/job.h"
#include "codeexec/store.h"

namespace codeexec {

struct RetryPolicy {
    int max_attempts{3};
    int64_t base_delay_ms{1000}; // delay before attempt n+1 is base * 2^(n-1)
    int64_t max_delay_ms{8000};
};

struct JobMetadata {
    std::string language;     // "unknown" when the job carried none
    std::string submitted_at;
};

inline constexpr int64_t kRecordTtlSec = 7 * 24 * 3600;

class ResultWriter {
public:
    ResultWriter(IRecordStore& store, std::string worker_id, RetryPolicy policy = {});

    // Build the terminal record and put it, retrying transient store failures.
    // Returns false once every attempt failed; never throws for store errors.
    bool write(const std::string& job_id, const Outcome& outcome, const JobMetadata& meta);

    JobRecord build_record(const std::string& job_id, const Outcome& outcome, const JobMetadata& meta) const;

    const std::string& last_error() const { return last_error_; }

    // Replaceable for tests; defaults to std::this_thread::sleep_for.
    void set_sleeper(std::function<void(int64_t ms)> fn) { sleep_ = std::move(fn); }

private:
    IRecordStore& store_;
    std::string worker_id_;
    RetryPolicy policy_;
    std::string last_error_;
    std::function<void(int64_t)> sleep_;
};

} // namespace codeexec
