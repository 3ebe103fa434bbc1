#include "codeexec/log.h"
#include "codeexec/json_mini.h"
#include "codeexec/util.h"

#include <json-c/json.h>

#include <atomic>
#include <exception>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace codeexec {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_console_mu;

LogLevel parse_log_level(const std::string& s) {
    std::string v = lower_ascii(s);
    if (v == "error") return LogLevel::ERROR;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "debug") return LogLevel::DEBUG;
    return LogLevel::INFO;
}

const char* log_level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

void set_log_level(LogLevel lvl) {
    g_level.store(static_cast<int>(lvl));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

void log_line(LogLevel lvl, const char* tag, const std::string& msg) {
    if (static_cast<int>(lvl) > g_level.load()) return;
    try {
        std::ostringstream ss;
        ss << "[" << iso_utc_now() << "] [" << log_level_name(lvl) << "] [" << (tag ? tag : "-") << "] " << msg;
        std::lock_guard<std::mutex> lk(g_console_mu);
        std::cerr << ss.str() << std::endl;
    } catch (const std::exception&) {
        // stderr is gone; nothing left to report to
    }
}

EventLog::EventLog(std::string worker_id, const std::string& path)
    : worker_id_(std::move(worker_id)), path_(path) {
    if (path_.empty()) return;
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        log_warn("events", "cannot open event log " + path_ + "; journal disabled");
    }
}

void EventLog::event(const std::string& name,
                     const std::string& job_id,
                     const std::string& message_id,
                     const std::vector<std::pair<std::string, std::string>>& fields,
                     const std::vector<std::pair<std::string, int64_t>>& numbers) {
    if (!out_.is_open()) return;

    json_mini::Doc rec(json_object_new_object());
    json_mini::set_string(rec.root, "ts", iso_utc_now());
    json_mini::set_string(rec.root, "event", name);
    json_mini::set_string(rec.root, "worker_id", worker_id_);
    if (!job_id.empty()) json_mini::set_string(rec.root, "job_id", job_id);
    if (!message_id.empty()) json_mini::set_string(rec.root, "message_id", message_id);
    for (const auto& kv : fields) json_mini::set_string(rec.root, kv.first.c_str(), kv.second);
    for (const auto& kv : numbers) json_mini::set_int(rec.root, kv.first.c_str(), kv.second);

    std::string line = json_mini::to_string(rec.root);
    std::lock_guard<std::mutex> lk(mu_);
    out_ << line << "\n";
    out_.flush();
}

} // namespace codeexec
