#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace codeexec {

struct ProcLimits {
    int timeout_ms{2000};               // wall-clock bound owned by the supervisor; <=0 disables
    size_t stdout_max_bytes{64 * 1024}; // captured prefix; the rest is read and discarded
    size_t stderr_max_bytes{64 * 1024};
    bool no_new_privs{true};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::string out;
    std::string err;
    std::string error;      // internal runner error, not child stderr
    int64_t elapsed_ms{0};
};

// Run argv[0] (PATH lookup) in its own process group with separate
// stdout/stderr pipes, feeding stdin_data on stdin and closing it afterwards.
// On timeout the whole process group is SIGKILLed and reaped.
//
// Returns false if the process could not be started (pipe/fork failure or
// exec failure reported through a close-on-exec pipe); res->error says why.
bool proc_run_supervised(const std::vector<std::string>& argv,
                         const std::string& stdin_data,
                         const ProcLimits& lim,
                         ProcResult* res);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace codeexec
