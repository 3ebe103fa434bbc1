#include "codeexec/job.h"
#include "codeexec/json_mini.h"

#include <cmath>
#include <sstream>
#include <utility>

namespace codeexec {

const char* status_name(Status s) {
    switch (s) {
        case Status::PENDING: return "PENDING";
        case Status::SUCCESS: return "SUCCESS";
        case Status::ERROR:   return "ERROR";
        case Status::TIMEOUT: return "TIMEOUT";
    }
    return "ERROR";
}

bool parse_status(const std::string& s, Status* out) {
    if (s == "PENDING") { *out = Status::PENDING; return true; }
    if (s == "SUCCESS") { *out = Status::SUCCESS; return true; }
    if (s == "ERROR")   { *out = Status::ERROR;   return true; }
    if (s == "TIMEOUT") { *out = Status::TIMEOUT; return true; }
    return false;
}

static std::string read_required(json_object* root, const char* key, std::string* out) {
    if (!json_mini::has_key(root, key) || !json_mini::field(root, key)) {
        return std::string("Missing required field: ") + key;
    }
    auto v = json_mini::get_string(root, key);
    if (!v) return std::string("Field '") + key + "' must be a string";
    *out = *v;
    return "";
}

ParseResult parse_job(const std::string& body, double default_timeout_sec) {
    ParseResult pr;
    auto doc = json_mini::parse(body);
    if (!doc || !json_mini::is_object(doc.root)) return pr;
    pr.malformed = false;

    Job& j = pr.job;
    const std::pair<const char*, std::string*> required[] = {
        {"job_id", &j.job_id}, {"language", &j.language}, {"code", &j.code}};
    for (const auto& f : required) {
        std::string err = read_required(doc.root, f.first, f.second);
        if (!err.empty() && j.field_error.empty()) j.field_error = err;
    }

    const char* tkey = json_mini::field(doc.root, "timeout") ? "timeout"
                     : json_mini::field(doc.root, "timeout_seconds") ? "timeout_seconds"
                     : nullptr;
    if (!tkey) {
        j.timeout_sec = default_timeout_sec;
    } else if (auto t = json_mini::get_number(doc.root, tkey)) {
        j.timeout_sec = *t;
    } else {
        j.timeout_numeric = false;
    }

    if (auto s = json_mini::get_string(doc.root, "submitted_at")) {
        j.submitted_at = *s;
    } else if (auto n = json_mini::get_int(doc.root, "submitted_at")) {
        j.submitted_at = std::to_string(*n);
    }
    return pr;
}

std::string check_job_id(const std::string& job_id) {
    if (job_id.empty() || job_id.size() > 128) return "Field 'job_id' must be 1-128 characters";
    if (job_id[0] == '.') return "Field 'job_id' must not start with '.'";
    for (char c : job_id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '-' || c == '_' || c == '.';
        if (!ok) return "Field 'job_id' contains invalid characters";
    }
    return "";
}

static std::string fmt_seconds(double v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

std::string validate_job(const Job& job, const LimitsTable& limits) {
    if (!job.field_error.empty()) return job.field_error;

    std::string id_err = check_job_id(job.job_id);
    if (!id_err.empty()) return id_err;

    if (!limits.find(job.language)) {
        return "Unsupported language: " + job.language + ". Supported: " + limits.supported_list();
    }

    if (job.code.size() > limits.max_code_bytes) {
        return "Field 'code' exceeds size limit of " + std::to_string(limits.max_code_bytes) + " bytes";
    }
    // argv strings end at the first NUL; the program would run truncated
    if (job.code.find('\0') != std::string::npos) return "Field 'code' must not contain NUL bytes";

    if (!job.timeout_numeric || !std::isfinite(job.timeout_sec) ||
        job.timeout_sec <= 0 || job.timeout_sec > limits.max_timeout_sec) {
        return "Invalid timeout. Must be 1-" + fmt_seconds(limits.max_timeout_sec) + " seconds";
    }
    return "";
}

std::string record_to_json(const JobRecord& r) {
    json_mini::Doc d(json_object_new_object());
    json_mini::set_string(d.root, "job_id", r.job_id);
    json_mini::set_string(d.root, "status", status_name(r.status));
    json_mini::set_string(d.root, "language", r.language);
    json_mini::set_string(d.root, "submitted_at", r.submitted_at);
    json_mini::set_string(d.root, "output", r.output);
    json_mini::set_string(d.root, "error", r.error);
    json_mini::set_int(d.root, "exit_code", r.exit_code);
    json_mini::set_int(d.root, "execution_time_ms", r.execution_time_ms);
    json_mini::set_string(d.root, "worker_id", r.worker_id);
    json_mini::set_string(d.root, "timestamp", r.timestamp);
    json_mini::set_int(d.root, "ttl", r.ttl);
    return json_mini::to_string(d.root);
}

bool record_from_json(const std::string& body, JobRecord* out, std::string* err) {
    auto doc = json_mini::parse(body);
    if (!doc || !json_mini::is_object(doc.root)) {
        if (err) *err = "record is not a JSON object";
        return false;
    }
    JobRecord r;
    auto id = json_mini::get_string(doc.root, "job_id");
    auto st = json_mini::get_string(doc.root, "status");
    if (!id || !st || !parse_status(*st, &r.status)) {
        if (err) *err = "record missing job_id/status";
        return false;
    }
    r.job_id = *id;
    r.language = json_mini::get_string(doc.root, "language").value_or("");
    r.submitted_at = json_mini::get_string(doc.root, "submitted_at").value_or("");
    r.output = json_mini::get_string(doc.root, "output").value_or("");
    r.error = json_mini::get_string(doc.root, "error").value_or("");
    r.exit_code = (int)json_mini::get_int(doc.root, "exit_code").value_or(-1);
    r.execution_time_ms = json_mini::get_int(doc.root, "execution_time_ms").value_or(0);
    r.worker_id = json_mini::get_string(doc.root, "worker_id").value_or("");
    r.timestamp = json_mini::get_string(doc.root, "timestamp").value_or("");
    r.ttl = json_mini::get_int(doc.root, "ttl").value_or(0);
    *out = std::move(r);
    return true;
}

std::string outcome_to_json(const std::string& job_id, const Outcome& o) {
    json_mini::Doc d(json_object_new_object());
    if (!job_id.empty()) json_mini::set_string(d.root, "job_id", job_id);
    json_mini::set_string(d.root, "status", status_name(o.status));
    json_mini::set_string(d.root, "output", o.output);
    json_mini::set_string(d.root, "error", o.error);
    json_mini::set_int(d.root, "exit_code", o.exit_code);
    json_mini::set_int(d.root, "execution_time_ms", o.execution_time_ms);
    return json_mini::to_string(d.root);
}

} // namespace codeexec
