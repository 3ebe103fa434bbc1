#include "codeexec/result_writer.h"
#include "codeexec/log.h"
#include "codeexec/util.h"

#include <chrono>
#include <thread>

namespace codeexec {

ResultWriter::ResultWriter(IRecordStore& store, std::string worker_id, RetryPolicy policy)
    : store_(store), worker_id_(std::move(worker_id)), policy_(policy) {
    sleep_ = [](int64_t ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); };
}

JobRecord ResultWriter::build_record(const std::string& job_id, const Outcome& outcome, const JobMetadata& meta) const {
    const int64_t now = now_ms();
    JobRecord r;
    r.job_id = job_id;
    r.status = outcome.status;
    r.language = meta.language.empty() ? "unknown" : meta.language;
    r.submitted_at = meta.submitted_at;
    r.output = outcome.output;
    r.error = outcome.error;
    r.exit_code = outcome.exit_code;
    r.execution_time_ms = outcome.execution_time_ms;
    r.worker_id = worker_id_;
    r.timestamp = iso_utc(now);
    r.ttl = now / 1000 + kRecordTtlSec;
    return r;
}

bool ResultWriter::write(const std::string& job_id, const Outcome& outcome, const JobMetadata& meta) {
    last_error_.clear();
    const JobRecord rec = build_record(job_id, outcome, meta);
    const int attempts = policy_.max_attempts < 1 ? 1 : policy_.max_attempts;

    for (int attempt = 1; attempt <= attempts; attempt++) {
        std::string err = store_.put(rec);
        if (err.empty()) {
            if (attempt > 1) log_info("writer", "result for " + job_id + " stored on attempt " + std::to_string(attempt));
            return true;
        }
        last_error_ = err;
        if (attempt == attempts) break;

        int64_t delay = backoff_delay_ms(attempt, policy_.base_delay_ms, policy_.max_delay_ms);
        log_warn("writer", "store write for " + job_id + " failed (attempt " + std::to_string(attempt) + "/" +
                 std::to_string(attempts) + "): " + err + "; retrying in " + std::to_string(delay) + "ms");
        sleep_(delay);
    }
    log_error("writer", "giving up on result for " + job_id + " after " + std::to_string(attempts) +
              " attempts: " + last_error_);
    return false;
}

} // namespace codeexec
