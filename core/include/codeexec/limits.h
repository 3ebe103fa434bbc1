#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace codeexec {

// Container-level isolation controls. Every field is mandatory; a policy that
// relaxes any of them is rejected by check_sandbox_policy().
struct SandboxPolicy {
    std::string network{"none"};
    double cpus{0.5};
    int memory_mb{256};
    int pids_limit{50};
    bool read_only_rootfs{true};
    bool drop_all_caps{true};
    bool no_new_privileges{true};
};

// Hard caps a policy may never exceed.
inline constexpr double kMaxCpus = 0.5;
inline constexpr int kMaxMemoryMb = 256;
inline constexpr int kMaxPids = 50;
inline constexpr double kMaxTimeoutSec = 3600.0;

struct LanguageSpec {
    std::string name;                 // whitelist key, e.g. "python"
    std::string image;                // pre-provisioned runtime image
    std::vector<std::string> command; // argv inside the container; code appended unless code_via_stdin
    bool code_via_stdin{false};
};

struct LimitsTable {
    std::vector<LanguageSpec> languages; // whitelist, in declaration order
    SandboxPolicy policy;
    double max_timeout_sec{10.0};
    size_t max_code_bytes{10240};
    size_t output_max_bytes{4000};

    const LanguageSpec* find(const std::string& language) const;
    // "[python, javascript, ruby, go]"
    std::string supported_list() const;
};

// python / javascript / ruby / go with the fixed minimal images.
LimitsTable default_limits();

// Empty string when the policy stays within every mandatory control.
std::string check_sandbox_policy(const SandboxPolicy& p);

// Overlay a JSON limits document onto *out (which should start from
// default_limits()). A "languages" object replaces the whole whitelist.
// Returns empty string on success; the resulting policy is checked.
std::string parse_limits_json(const std::string& body, LimitsTable* out);
std::string load_limits_file(const std::string& path, LimitsTable* out);

} // namespace codeexec
