#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace codeexec {

enum class LogLevel : int { ERROR = 0, WARN = 1, INFO = 2, DEBUG = 3 };

// Parses "error|warn|warning|info|debug" (case-insensitive). Unknown -> INFO.
LogLevel parse_log_level(const std::string& s);
const char* log_level_name(LogLevel lvl);

void set_log_level(LogLevel lvl);
LogLevel log_level();

// One line on stderr: "[<UTC ts>] [LEVEL] [tag] msg". Never throws.
void log_line(LogLevel lvl, const char* tag, const std::string& msg);

inline void log_error(const char* tag, const std::string& msg) { log_line(LogLevel::ERROR, tag, msg); }
inline void log_warn(const char* tag, const std::string& msg)  { log_line(LogLevel::WARN, tag, msg); }
inline void log_info(const char* tag, const std::string& msg)  { log_line(LogLevel::INFO, tag, msg); }
inline void log_debug(const char* tag, const std::string& msg) { log_line(LogLevel::DEBUG, tag, msg); }

// Append-only JSONL journal of job lifecycle events.
//
// Each line: {"ts":..., "event":..., "worker_id":..., "job_id":...,
//             "message_id":..., <string fields...>}
// A default-constructed or path-less EventLog is disabled (event() is a no-op).
class EventLog {
public:
    EventLog() = default;
    EventLog(std::string worker_id, const std::string& path);

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    bool enabled() const { return out_.is_open(); }
    const std::string& path() const { return path_; }

    void event(const std::string& name,
               const std::string& job_id,
               const std::string& message_id,
               const std::vector<std::pair<std::string, std::string>>& fields = {},
               const std::vector<std::pair<std::string, int64_t>>& numbers = {});

private:
    std::string worker_id_;
    std::string path_;
    std::ofstream out_;
    std::mutex mu_;
};

} // namespace codeexec
