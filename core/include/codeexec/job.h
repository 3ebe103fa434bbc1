#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "codeexec/limits.h"

namespace codeexec {

enum class Status { PENDING, SUCCESS, ERROR, TIMEOUT };

const char* status_name(Status s);
bool parse_status(const std::string& s, Status* out);

// A job as decoded from a queue message. Untrusted until validate_job()
// returns empty.
struct Job {
    std::string job_id;
    std::string language;
    std::string code;
    double timeout_sec{0};
    bool timeout_numeric{true};
    std::string submitted_at;

    // First missing / ill-typed required field found while decoding.
    std::string field_error;
};

struct ParseResult {
    bool malformed{true}; // payload not JSON, or not a JSON object
    Job job;
};

// Decode a message body. Absent timeout defaults to default_timeout_sec.
ParseResult parse_job(const std::string& body, double default_timeout_sec);

// Empty string when job_id is usable as a storage key.
std::string check_job_id(const std::string& job_id);

// Empty string = valid; otherwise a message naming the offending field.
std::string validate_job(const Job& job, const LimitsTable& limits);

struct Outcome {
    Status status{Status::ERROR};
    std::string output;
    std::string error;
    int exit_code{-1};
    int64_t execution_time_ms{0};
};

// Durable state for one job; full replace keyed by job_id.
struct JobRecord {
    std::string job_id;
    Status status{Status::PENDING};
    std::string language;
    std::string submitted_at;
    std::string output;
    std::string error;
    int exit_code{-1};
    int64_t execution_time_ms{0};
    std::string worker_id;
    std::string timestamp;
    int64_t ttl{0};
};

std::string record_to_json(const JobRecord& r);
bool record_from_json(const std::string& body, JobRecord* out, std::string* err);

std::string outcome_to_json(const std::string& job_id, const Outcome& o);

} // namespace codeexec
