#include "cmd_exec.h"
#include "cmd_worker.h"

#include "codeexec/config.h"
#include "codeexec/lifecycle.h"
#include "codeexec/log.h"
#include "codeexec/util.h"

#include <csignal>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    using namespace codeexec;

    std::string cmd = argc >= 2 ? argv[1] : "run";
    if (cmd == "-h" || cmd == "--help") {
        std::cerr << "codeexec_worker [run|exec <language> <file> [--timeout S]|check-config]\n";
        return kExitOk;
    }

    // Before any thread exists: profile defaults use setenv(), and the
    // shutdown-signal mask must be inherited by every thread.
    apply_profile_defaults(detect_profile());
    set_log_level(parse_log_level(getenv_str("CODEEXEC_LOG_LEVEL", "info")));
    if (cmd == "run") {
        std::string err = SignalWatcher::block_shutdown_signals();
        if (!err.empty()) {
            log_error("main", err);
            return kExitConfig;
        }
    }
    // Writes to a runtime client that already exited must fail with EPIPE.
    std::signal(SIGPIPE, SIG_IGN);

    if (cmd == "run") return cmd_worker(argc, argv);
    if (cmd == "exec") return cmd_exec(argc, argv);
    if (cmd == "check-config") return cmd_check_config(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return kExitConfig;
}
