#include "codeexec/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace codeexec {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (have) out.push_back(cur);
                cur.clear();
                have = false;
                continue;
            }
            if (c == '\'') { st = SQ; have = true; continue; }
            if (c == '"') { st = DQ; esc = false; have = true; continue; }
            cur.push_back(c);
            have = true;
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (esc) { cur.push_back(c); esc = false; continue; }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    if (have) out.push_back(cur);
    return out;
}

namespace {

struct Sink {
    int fd{-1};
    std::string* buf{nullptr};
    size_t cap{0};
    bool* truncated{nullptr};
};

void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Read whatever is available. Closes the fd and marks it -1 on EOF/error.
void pump(Sink& s) {
    if (s.fd < 0) return;
    char buf[4096];
    while (true) {
        ssize_t n = read(s.fd, buf, sizeof(buf));
        if (n > 0) {
            size_t can = s.cap > s.buf->size() ? s.cap - s.buf->size() : 0;
            size_t take = std::min(can, (size_t)n);
            if (take < (size_t)n) *s.truncated = true;
            s.buf->append(buf, take);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        close(s.fd);
        s.fd = -1;
        return;
    }
}

void close_pair(int p[2]) {
    if (p[0] >= 0) close(p[0]);
    if (p[1] >= 0) close(p[1]);
}

} // namespace

bool proc_run_supervised(const std::vector<std::string>& argv,
                         const std::string& stdin_data,
                         const ProcLimits& lim,
                         ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};
    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    // Everything the child needs is prepared before fork(): the parent may be
    // multi-threaded, so the child only makes async-signal-safe calls.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);
    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    if (maxfd > 65536) maxfd = 65536;

    int in_pipe[2] = {-1, -1}, out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
    if (pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe(err_pipe) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        close_pair(in_pipe); close_pair(out_pipe); close_pair(err_pipe); close_pair(exec_pipe);
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close_pair(in_pipe); close_pair(out_pipe); close_pair(err_pipe); close_pair(exec_pipe);
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);
        int report_fd = exec_pipe[1];
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != report_fd) (void)close(fd);
        }

        // isolate process group so timeout can kill the whole subtree
        (void)setpgid(0, 0);

        // the worker blocks its shutdown signals and ignores SIGPIPE; neither
        // may leak into the runtime client
        sigset_t none;
        sigemptyset(&none);
        (void)sigprocmask(SIG_SETMASK, &none, nullptr);
        (void)signal(SIGPIPE, SIG_DFL);

#ifdef __linux__
        if (lim.no_new_privs) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        execvp(cargv[0], cargv.data());
        int e = errno;
        (void)!write(report_fd, &e, sizeof(e));
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t got;
    do {
        got = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    close(exec_pipe[0]);
    if (got == (ssize_t)sizeof(exec_errno)) {
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(err_pipe[0]);
        int st = 0;
        (void)waitpid(pid, &st, 0);
        res->error = "exec " + argv[0] + ": " + std::strerror(exec_errno);
        return false;
    }

    int in_fd = in_pipe[1];
    if (stdin_data.empty()) {
        close(in_fd);
        in_fd = -1;
    } else {
        set_nonblock(in_fd);
    }
    size_t write_off = 0;

    Sink so{out_pipe[0], &res->out, lim.stdout_max_bytes, &res->stdout_truncated};
    Sink se{err_pipe[0], &res->err, lim.stderr_max_bytes, &res->stderr_truncated};
    set_nonblock(so.fd);
    set_nonblock(se.fd);

    auto elapsed = [&]() {
        return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };

    int status = 0;

    // Interleave stdin writes with output reads so neither side can fill a
    // pipe and deadlock the other.
    while (true) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;

        int64_t el = elapsed();
        if (lim.timeout_ms > 0 && el >= lim.timeout_ms) {
            res->timed_out = true;
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            break;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1;
        if (in_fd >= 0) {
            in_idx = (int)nfds;
            fds[nfds++] = {in_fd, POLLOUT, 0};
        }
        if (so.fd >= 0) fds[nfds++] = {so.fd, POLLIN, 0};
        if (se.fd >= 0) fds[nfds++] = {se.fd, POLLIN, 0};

        int slice = 50;
        if (lim.timeout_ms > 0) {
            slice = (int)std::max<int64_t>(1, std::min<int64_t>(slice, lim.timeout_ms - el));
        }
        int pr = nfds ? poll(fds, nfds, slice) : poll(nullptr, 0, slice);
        if (pr < 0 && errno != EINTR) {
            res->error = std::string("poll failed: ") + std::strerror(errno);
        }

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data.size()) {
                ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n < 0 && errno == EINTR) continue;
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data.size(); // reader went away (EPIPE)
                break;
            }
            if (write_off >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }

        pump(so);
        pump(se);
    }

    if (in_fd >= 0) close(in_fd);

    // Collect what the child wrote before it exited. Descendants that kept the
    // pipes open are not waited for.
    pump(so);
    pump(se);
    if (so.fd >= 0) close(so.fd);
    if (se.fd >= 0) close(se.fd);

    res->elapsed_ms = elapsed();
    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;
    return true;
}

} // namespace codeexec
