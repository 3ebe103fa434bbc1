#include "test_common.h"

#include "codeexec/sandbox.h"
#include "codeexec/util.h"

#include <csignal>
#include <fstream>

using namespace codeexec;
namespace fs = std::filesystem;

// Stands in for the container CLI: logs its argv, writes the cidfile as the
// container "starts", then runs the command that follows the image name on the
// host. Unknown images exit 125 and broken-image exits 127 before creation.
static fs::path write_fake_runtime(const fs::path& dir) {
    fs::path script = dir / "fake-runtime";
    fs::path log = dir / "runtime.log";
    std::ofstream f(script);
    f << "#!/bin/sh\n"
      << "echo \"$*\" >> '" << log.string() << "'\n"
      << "case \"$1\" in\n"
      << "  rm) exit 0 ;;\n"
      << "  run) ;;\n"
      << "  *) echo 'unknown command' >&2; exit 125 ;;\n"
      << "esac\n"
      << "cid=''; prev=''\n"
      << "for a in \"$@\"; do [ \"$prev\" = --cidfile ] && cid=\"$a\"; prev=\"$a\"; done\n"
      << "while [ $# -gt 0 ] && [ \"$1\" != fake-image ] && [ \"$1\" != broken-image ]; do shift; done\n"
      << "[ $# -gt 0 ] || { echo 'image not found' >&2; exit 125; }\n"
      << "[ \"$1\" = broken-image ] && { echo 'exec: not found' >&2; exit 127; }\n"
      << "shift\n"
      << "[ -n \"$cid\" ] && echo fake-container-id > \"$cid\"\n"
      << "exec \"$@\"\n";
    f.close();
    fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);
    return script;
}

static LimitsTable fake_limits() {
    LimitsTable t = default_limits();
    t.languages = {
        {"shell", "fake-image", {"sh", "-c"}, false},
        {"shell-stdin", "fake-image", {"sh"}, true},
        {"missing", "no-such-image", {"sh", "-c"}, false},
        {"broken", "broken-image", {"sh", "-c"}, false},
    };
    return t;
}

static std::string runtime_log(const fs::path& dir) {
    std::string s;
    (void)read_file(dir / "runtime.log", &s);
    return s;
}

int main() {
    std::signal(SIGPIPE, SIG_IGN);
    auto dir = fresh_dir("codeexec_test_sandbox");
    fs::path rt = write_fake_runtime(dir);

    // Container argv carries every isolation control, in order
    {
        SandboxExecutor ex(default_limits(), SandboxOptions{});
        const LanguageSpec* py = ex.limits().find("python");
        expect_true(py != nullptr, "python in default table");
        auto argv = ex.build_argv(*py, "codeexec-abc", "print('hi')");
        std::vector<std::string> want = {
            "docker", "run", "--rm", "--interactive", "--name", "codeexec-abc",
            "--network", "none", "--cpus", "0.5", "--memory", "256m", "--memory-swap", "256m",
            "--pids-limit", "50", "--read-only", "--cap-drop", "ALL",
            "--security-opt", "no-new-privileges", "python:3.11-alpine", "python", "-c", "print('hi')"};
        expect_eq_ll((long long)argv.size(), (long long)want.size(), "argv length");
        for (size_t i = 0; i < want.size(); i++) expect_eq_str(argv[i], want[i], "argv[" + std::to_string(i) + "]");

        auto cargv = ex.build_argv(*py, "codeexec-abc", "print('hi')", "/tmp/codeexec-abc.cid");
        expect_eq_ll((long long)cargv.size(), (long long)want.size() + 2, "cidfile adds two arguments");
        expect_eq_str(cargv[6], "--cidfile", "cidfile flag after the name");
        expect_eq_str(cargv[7], "/tmp/codeexec-abc.cid", "cidfile path");

        const LanguageSpec* go = ex.limits().find("go");
        auto gargv = ex.build_argv(*go, "n", "package main");
        expect_eq_str(gargv.back(), "/dev/stdin", "go code is not passed as an argument");
    }

    SandboxOptions opts;
    opts.runtime = {rt.string()};
    opts.cleanup_timeout_ms = 2000;
    SandboxExecutor ex(fake_limits(), opts);

    // SUCCESS
    {
        Outcome o = ex.execute("shell", "echo hello world", 5);
        expect_true(o.status == Status::SUCCESS, "echo succeeds: " + o.error);
        expect_true(contains(o.output, "hello world"), "stdout captured");
        expect_eq_ll(o.exit_code, 0, "exit 0");
        expect_true(o.execution_time_ms >= 0, "time recorded");
    }

    // ERROR with diagnostics on stderr
    {
        Outcome o = ex.execute("shell", "echo oops >&2; exit 3", 5);
        expect_true(o.status == Status::ERROR, "non-zero exit is ERROR");
        expect_eq_ll(o.exit_code, 3, "exit code kept");
        expect_true(contains(o.error, "oops"), "stderr in error");
    }

    // Code streamed on stdin
    {
        Outcome o = ex.execute("shell-stdin", "echo from-stdin", 5);
        expect_true(o.status == Status::SUCCESS, "stdin language succeeds: " + o.error);
        expect_true(contains(o.output, "from-stdin"), "stdin code ran");
        expect_true(!contains(runtime_log(dir), "echo from-stdin"), "stdin code not on the command line");
    }

    // TIMEOUT: client killed, container removed
    {
        auto start = std::chrono::steady_clock::now();
        Outcome o = ex.execute("shell", "while :; do :; done", 1);
        auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
        expect_true(o.status == Status::TIMEOUT, "spinner times out");
        expect_eq_str(o.error, "Execution exceeded time limit of 1s", "timeout message names the limit");
        expect_eq_ll(o.exit_code, -1, "no exit code on timeout");
        expect_true(o.execution_time_ms >= 1000, "elapsed recorded");
        expect_true(took < 4000, "bounded overshoot: " + std::to_string(took) + "ms");
        expect_true(contains(runtime_log(dir), "rm -f codeexec-"), "named container force-removed");
    }

    // User code exiting 125/126/127 after the container started is an ordinary failure
    for (int code : {125, 126, 127}) {
        const std::string n = std::to_string(code);
        Outcome o = ex.execute("shell", "echo user-output; echo user-diag >&2; exit " + n, 5);
        expect_true(o.status == Status::ERROR, n + " is ERROR");
        expect_eq_ll(o.exit_code, code, n + ": exit code kept");
        expect_eq_str(o.output, "user-output\n", n + ": stdout kept");
        expect_true(contains(o.error, "user-diag"), n + ": stderr kept: " + o.error);
        expect_true(!contains(o.error, "Internal execution error"), n + ": not internal: " + o.error);
    }

    // Runtime failing before the container exists is an internal error
    {
        Outcome o = ex.execute("missing", "echo never", 5);
        expect_true(o.status == Status::ERROR, "unknown image is ERROR");
        expect_true(contains(o.error, "Internal execution error"), "125 before creation is internal: " + o.error);
        expect_true(contains(o.error, "image not found"), "runtime diagnostic kept: " + o.error);
        expect_eq_ll(o.exit_code, -1, "internal error exit -1");
        expect_eq_str(o.output, "", "no user output");

        o = ex.execute("broken", "echo never", 5);
        expect_true(contains(o.error, "Internal execution error: container runtime exited 127"),
                    "127 before creation is internal: " + o.error);
        expect_eq_ll(o.exit_code, -1, "internal error exit -1");
    }

    // cidfile is passed to the runtime and cleaned up afterwards
    {
        fs::path cids = dir / "cids";
        fs::create_directories(cids);
        SandboxOptions with_dir = opts;
        with_dir.cidfile_dir = cids.string();
        SandboxExecutor tracked(fake_limits(), with_dir);
        Outcome o = tracked.execute("shell", "echo hi", 5);
        expect_true(o.status == Status::SUCCESS, "runs with a cidfile dir: " + o.error);
        expect_true(contains(runtime_log(dir), "--cidfile " + cids.string() + "/codeexec-"), "cidfile argument passed");
        expect_true(fs::is_empty(cids), "cidfile removed after the run");
    }

    // Runtime missing entirely
    {
        SandboxOptions bad;
        bad.runtime = {"/nonexistent/docker"};
        SandboxExecutor missing(fake_limits(), bad);
        Outcome o = missing.execute("shell", "echo hi", 5);
        expect_true(o.status == Status::ERROR, "missing runtime is ERROR");
        expect_true(contains(o.error, "Internal execution error"), "missing runtime is internal: " + o.error);
        expect_eq_ll(o.exit_code, -1, "exit -1");
    }

    // Output truncated to 4000 bytes, never splitting a UTF-8 sequence
    {
        Outcome o = ex.execute("shell", "printf '%5000s' x", 5);
        expect_true(o.status == Status::SUCCESS, "big output succeeds");
        expect_eq_ll((long long)o.output.size(), 4000, "truncated to 4000");

        o = ex.execute("shell", "printf a; i=0; while [ $i -lt 2500 ]; do printf '\\303\\251'; i=$((i+1)); done", 5);
        expect_true(o.status == Status::SUCCESS, "utf8 output succeeds");
        expect_eq_ll((long long)o.output.size(), 3999, "split sequence dropped");
        expect_eq_str(o.output.substr(o.output.size() - 2), "\xC3\xA9", "last kept char is whole");
    }

    // Fail closed: a relaxed policy never launches anything
    {
        LimitsTable relaxed = fake_limits();
        relaxed.policy.network = "bridge";
        std::error_code ec;
        fs::remove(dir / "runtime.log", ec);
        SandboxExecutor open_net(relaxed, opts);
        Outcome o = open_net.execute("shell", "echo hi", 5);
        expect_true(o.status == Status::ERROR, "relaxed policy is ERROR");
        expect_true(contains(o.error, "network"), "names the violated control: " + o.error);
        expect_eq_str(runtime_log(dir), "", "runtime never invoked");

        relaxed = fake_limits();
        relaxed.policy.memory_mb = 512;
        SandboxExecutor big_mem(relaxed, opts);
        expect_true(big_mem.execute("shell", "echo hi", 5).status == Status::ERROR, "memory above cap refused");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cerr << "test_sandbox: ALL PASSED" << std::endl;
    return 0;
}
