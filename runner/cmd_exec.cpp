#include "cmd_exec.h"

#include "codeexec/job.h"
#include "codeexec/lifecycle.h"
#include "codeexec/limits.h"
#include "codeexec/log.h"
#include "codeexec/proc.h"
#include "codeexec/sandbox.h"
#include "codeexec/util.h"

#include <cstdlib>
#include <iostream>

using namespace codeexec;

int cmd_exec(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: codeexec_worker exec <language> <file> [--timeout S]\n";
        return kExitConfig;
    }

    Job job;
    job.job_id = "exec-" + random_hex(4);
    job.language = argv[2];
    const std::string file = argv[3];
    LimitsTable limits = default_limits();
    bool timeout_given = false;

    for (int i = 4; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--timeout" && i + 1 < argc) {
            char* end = nullptr;
            job.timeout_sec = std::strtod(argv[++i], &end);
            job.timeout_numeric = end && *end == '\0';
            timeout_given = true;
            continue;
        }
        std::cerr << "unknown argument: " << a << "\n";
        return kExitConfig;
    }

    std::string limits_file = getenv_str("CODEEXEC_LIMITS_FILE");
    if (!limits_file.empty()) {
        std::string err = load_limits_file(limits_file, &limits);
        if (!err.empty()) {
            std::cerr << "config error: " << err << "\n";
            return kExitConfig;
        }
    }
    if (!timeout_given) job.timeout_sec = limits.max_timeout_sec;

    SandboxOptions sopts;
    sopts.runtime = split_argv_quoted(getenv_str("CODEEXEC_CONTAINER_RUNTIME", "docker"));
    if (sopts.runtime.empty()) {
        std::cerr << "config error: CODEEXEC_CONTAINER_RUNTIME is not a valid command\n";
        return kExitConfig;
    }

    if (!read_file(file, &job.code)) {
        std::cerr << "cannot read " << file << "\n";
        return kExitConfig;
    }

    std::string verr = validate_job(job, limits);
    if (!verr.empty()) {
        std::cerr << "Validation error: " << verr << "\n";
        return kExitConfig;
    }

    SandboxExecutor executor(limits, sopts);
    Outcome o = executor.execute(job.language, job.code, job.timeout_sec);
    std::cout << outcome_to_json(job.job_id, o) << "\n";
    return o.status == Status::SUCCESS ? 0 : 1;
}
