#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "codeexec/job.h"
#include "codeexec/limits.h"

namespace codeexec {

// Runs one piece of untrusted code to completion or timeout. Never throws for
// execution problems: every failure is classified into the returned Outcome.
class IExecutor {
public:
    virtual ~IExecutor() = default;
    virtual Outcome execute(const std::string& language, const std::string& code, double timeout_sec) = 0;
};

struct SandboxOptions {
    std::vector<std::string> runtime{"docker"}; // OCI runtime client argv prefix
    std::string name_prefix{"codeexec-"};
    int cleanup_timeout_ms{10000};              // bound on "<runtime> rm -f"
    size_t capture_max_bytes{64 * 1024};        // read before truncating to output_max_bytes
    std::string cidfile_dir;                    // empty: system temp dir
};

// One container per call, created with every control of the limits policy.
class SandboxExecutor : public IExecutor {
public:
    SandboxExecutor(LimitsTable limits, SandboxOptions opts);

    Outcome execute(const std::string& language, const std::string& code, double timeout_sec) override;

    // Full runtime argv for one run (exposed for inspection and tests).
    // With a cidfile the runtime writes the container id there once the
    // container exists.
    std::vector<std::string> build_argv(const LanguageSpec& lang,
                                        const std::string& container_name,
                                        const std::string& code,
                                        const std::string& cidfile = "") const;

    const LimitsTable& limits() const { return limits_; }

private:
    std::filesystem::path cidfile_dir() const;
    void remove_container(const std::string& name);

    LimitsTable limits_;
    SandboxOptions opts_;
};

} // namespace codeexec
