#include "codeexec/limits.h"
#include "codeexec/json_mini.h"
#include "codeexec/util.h"

#include <sstream>

namespace codeexec {

const LanguageSpec* LimitsTable::find(const std::string& language) const {
    for (const auto& l : languages) {
        if (l.name == language) return &l;
    }
    return nullptr;
}

std::string LimitsTable::supported_list() const {
    std::string s = "[";
    for (size_t i = 0; i < languages.size(); i++) {
        if (i) s += ", ";
        s += languages[i].name;
    }
    s += "]";
    return s;
}

LimitsTable default_limits() {
    LimitsTable t;
    t.languages = {
        {"python",     "python:3.11-alpine", {"python", "-c"}, false},
        {"javascript", "node:20-alpine",     {"node", "-e"},   false},
        {"ruby",       "ruby:3.2-alpine",    {"ruby", "-e"},   false},
        // go has no eval flag; the source is read from stdin
        {"go",         "golang:1.21-alpine", {"go", "run", "/dev/stdin"}, true},
    };
    return t;
}

std::string check_sandbox_policy(const SandboxPolicy& p) {
    if (p.network != "none") return "sandbox network must be 'none' (got '" + p.network + "')";
    if (!(p.cpus > 0.0 && p.cpus <= kMaxCpus)) {
        std::ostringstream ss;
        ss << "sandbox cpus must be in (0, " << kMaxCpus << "] (got " << p.cpus << ")";
        return ss.str();
    }
    if (p.memory_mb <= 0 || p.memory_mb > kMaxMemoryMb) {
        return "sandbox memory_mb must be in (0, " + std::to_string(kMaxMemoryMb) + "] (got " + std::to_string(p.memory_mb) + ")";
    }
    if (p.pids_limit <= 0 || p.pids_limit > kMaxPids) {
        return "sandbox pids_limit must be in (0, " + std::to_string(kMaxPids) + "] (got " + std::to_string(p.pids_limit) + ")";
    }
    if (!p.read_only_rootfs) return "sandbox root filesystem must be read-only";
    if (!p.drop_all_caps) return "sandbox must drop all capabilities";
    if (!p.no_new_privileges) return "sandbox must set no-new-privileges";
    return "";
}

static std::string parse_language(const char* name, json_object* v, LanguageSpec* out) {
    if (!json_mini::is_object(v)) return std::string("languages.") + name + ": expected object";
    out->name = name;
    auto image = json_mini::get_string(v, "image");
    if (!image || image->empty()) return std::string("languages.") + name + ": missing image";
    out->image = *image;
    out->command = json_mini::get_array_strings(v, "command");
    if (out->command.empty()) return std::string("languages.") + name + ": missing command";
    out->code_via_stdin = json_mini::get_bool(v, "stdin").value_or(false);
    return "";
}

std::string parse_limits_json(const std::string& body, LimitsTable* out) {
    if (!out) return "null output";
    auto doc = json_mini::parse(body);
    if (!doc || !json_mini::is_object(doc.root)) return "limits: expected a JSON object";

    LimitsTable t = *out;

    if (json_mini::has_key(doc.root, "max_timeout_sec")) {
        auto v = json_mini::get_number(doc.root, "max_timeout_sec");
        if (!v || !(*v > 0 && *v <= kMaxTimeoutSec)) {
            std::ostringstream ss;
            ss << "limits: max_timeout_sec must be in (0, " << kMaxTimeoutSec << "]";
            return ss.str();
        }
        t.max_timeout_sec = *v;
    }
    if (json_mini::has_key(doc.root, "max_code_bytes")) {
        auto v = json_mini::get_int(doc.root, "max_code_bytes");
        if (!v || *v <= 0) return "limits: max_code_bytes must be a positive integer";
        t.max_code_bytes = (size_t)*v;
    }
    if (json_mini::has_key(doc.root, "output_max_bytes")) {
        auto v = json_mini::get_int(doc.root, "output_max_bytes");
        if (!v || *v <= 0) return "limits: output_max_bytes must be a positive integer";
        t.output_max_bytes = (size_t)*v;
    }

    if (json_object* sb = json_mini::field(doc.root, "sandbox")) {
        if (!json_mini::is_object(sb)) return "limits: sandbox must be an object";
        if (auto v = json_mini::get_string(sb, "network")) t.policy.network = *v;
        if (auto v = json_mini::get_number(sb, "cpus")) t.policy.cpus = *v;
        if (auto v = json_mini::get_int(sb, "memory_mb")) t.policy.memory_mb = (int)*v;
        if (auto v = json_mini::get_int(sb, "pids_limit")) t.policy.pids_limit = (int)*v;
        if (auto v = json_mini::get_bool(sb, "read_only")) t.policy.read_only_rootfs = *v;
        if (auto v = json_mini::get_bool(sb, "cap_drop_all")) t.policy.drop_all_caps = *v;
        if (auto v = json_mini::get_bool(sb, "no_new_privileges")) t.policy.no_new_privileges = *v;
    }

    if (json_object* langs = json_mini::field(doc.root, "languages")) {
        if (!json_mini::is_object(langs)) return "limits: languages must be an object";
        std::vector<LanguageSpec> table;
        json_object_object_foreach(langs, key, val) {
            LanguageSpec spec;
            std::string err = parse_language(key, val, &spec);
            if (!err.empty()) return "limits: " + err;
            table.push_back(std::move(spec));
        }
        if (table.empty()) return "limits: languages must not be empty";
        t.languages = std::move(table);
    }

    std::string perr = check_sandbox_policy(t.policy);
    if (!perr.empty()) return "limits: " + perr;

    *out = std::move(t);
    return "";
}

std::string load_limits_file(const std::string& path, LimitsTable* out) {
    std::string body;
    if (!read_file(path, &body)) return "cannot read limits file: " + path;
    return parse_limits_json(body, out);
}

} // namespace codeexec
