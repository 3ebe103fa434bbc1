#include "codeexec/sandbox.h"
#include "codeexec/log.h"
#include "codeexec/proc.h"
#include "codeexec/util.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <sstream>

namespace codeexec {

namespace {

// Exit statuses the runtime client reserves for its own failures
// (daemon error, container command not invokable / not found). User code can
// exit with the same values, so they only mean a runtime failure when the
// container was never created.
bool is_runtime_failure(int exit_code) {
    return exit_code == 125 || exit_code == 126 || exit_code == 127;
}

std::string fmt_num(double v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

Outcome internal_error(const std::string& what, int64_t elapsed_ms) {
    Outcome o;
    o.status = Status::ERROR;
    o.error = "Internal execution error: " + what;
    o.exit_code = -1;
    o.execution_time_ms = elapsed_ms;
    return o;
}

} // namespace

SandboxExecutor::SandboxExecutor(LimitsTable limits, SandboxOptions opts)
    : limits_(std::move(limits)), opts_(std::move(opts)) {}

std::vector<std::string> SandboxExecutor::build_argv(const LanguageSpec& lang,
                                                     const std::string& container_name,
                                                     const std::string& code,
                                                     const std::string& cidfile) const {
    const SandboxPolicy& p = limits_.policy;
    const std::string mem = std::to_string(p.memory_mb) + "m";

    std::vector<std::string> argv = opts_.runtime;
    const std::vector<std::string> run = {
        "run", "--rm", "--interactive",
        "--name", container_name,
    };
    argv.insert(argv.end(), run.begin(), run.end());
    if (!cidfile.empty()) argv.insert(argv.end(), {"--cidfile", cidfile});
    const std::vector<std::string> controls = {
        "--network", p.network,
        "--cpus", fmt_num(p.cpus),
        "--memory", mem,
        "--memory-swap", mem,
        "--pids-limit", std::to_string(p.pids_limit),
        "--read-only",
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        lang.image,
    };
    argv.insert(argv.end(), controls.begin(), controls.end());
    argv.insert(argv.end(), lang.command.begin(), lang.command.end());
    if (!lang.code_via_stdin) argv.push_back(code);
    return argv;
}

std::filesystem::path SandboxExecutor::cidfile_dir() const {
    if (!opts_.cidfile_dir.empty()) return opts_.cidfile_dir;
    std::error_code ec;
    std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::path("/tmp") : tmp;
}

void SandboxExecutor::remove_container(const std::string& name) {
    std::vector<std::string> argv = opts_.runtime;
    argv.insert(argv.end(), {"rm", "-f", name});

    ProcLimits lim;
    lim.timeout_ms = opts_.cleanup_timeout_ms;
    lim.stdout_max_bytes = 4096;
    lim.stderr_max_bytes = 4096;
    ProcResult pr;
    if (!proc_run_supervised(argv, "", lim, &pr)) {
        log_warn("sandbox", "container cleanup for " + name + " not started: " + pr.error);
    } else if (pr.timed_out || pr.exit_code != 0) {
        log_warn("sandbox", "container cleanup for " + name + " exited " + std::to_string(pr.exit_code) +
                 (pr.timed_out ? " (timed out)" : ""));
    }
}

Outcome SandboxExecutor::execute(const std::string& language, const std::string& code, double timeout_sec) {
    std::string perr = check_sandbox_policy(limits_.policy);
    if (!perr.empty()) {
        log_error("sandbox", "refusing to launch: " + perr);
        return internal_error("sandbox policy rejected: " + perr, 0);
    }
    const LanguageSpec* lang = limits_.find(language);
    if (!lang) return internal_error("unsupported language " + language, 0);
    if (opts_.runtime.empty()) return internal_error("no container runtime configured", 0);

    const std::string name = opts_.name_prefix + random_hex(6);
    const std::filesystem::path cidfile = cidfile_dir() / (name + ".cid");
    std::vector<std::string> argv = build_argv(*lang, name, code, cidfile.string());

    ProcLimits lim;
    lim.timeout_ms = (int)std::ceil(std::min(timeout_sec, kMaxTimeoutSec) * 1000.0);
    lim.stdout_max_bytes = opts_.capture_max_bytes;
    lim.stderr_max_bytes = opts_.capture_max_bytes;

    log_debug("sandbox", "run " + language + " in " + lang->image + " as " + name +
              " (timeout=" + fmt_num(timeout_sec) + "s)");

    ProcResult pr;
    const bool launched = proc_run_supervised(argv, lang->code_via_stdin ? code : "", lim, &pr);
    std::error_code ec;
    const bool created = std::filesystem::exists(cidfile, ec);
    std::filesystem::remove(cidfile, ec);
    if (!launched) {
        log_error("sandbox", "runtime launch failed: " + pr.error);
        return internal_error("container runtime unavailable (" + pr.error + ")", pr.elapsed_ms);
    }

    if (pr.timed_out) {
        // Killing the client does not stop a container the daemon already started.
        remove_container(name);
        Outcome o;
        o.status = Status::TIMEOUT;
        o.output = truncate_utf8(pr.out, limits_.output_max_bytes);
        o.error = "Execution exceeded time limit of " + fmt_num(timeout_sec) + "s";
        o.exit_code = -1;
        o.execution_time_ms = pr.elapsed_ms;
        log_warn("sandbox", name + " exceeded " + fmt_num(timeout_sec) + "s; killed");
        return o;
    }

    if (is_runtime_failure(pr.exit_code) && !created) {
        std::string detail = truncate_utf8(pr.err, 200);
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) detail.pop_back();
        log_error("sandbox", "runtime exit " + std::to_string(pr.exit_code) + ": " + detail);
        return internal_error("container runtime exited " + std::to_string(pr.exit_code) +
                              (detail.empty() ? "" : ": " + detail), pr.elapsed_ms);
    }

    Outcome o;
    o.status = pr.exit_code == 0 ? Status::SUCCESS : Status::ERROR;
    o.output = truncate_utf8(pr.out, limits_.output_max_bytes);
    o.error = truncate_utf8(pr.err, limits_.output_max_bytes);
    o.exit_code = pr.exit_code;
    o.execution_time_ms = pr.elapsed_ms;
    return o;
}

} // namespace codeexec
