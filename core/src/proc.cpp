#include "codebox/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

extern char** environ;

namespace codebox {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have_token = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    for (char c : cmd) {
        switch (st) {
        case NORM:
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (have_token) out.push_back(cur);
                cur.clear();
                have_token = false;
            } else if (c == '\'') {
                st = SQ; have_token = true;
            } else if (c == '"') {
                st = DQ; esc = false; have_token = true;
            } else {
                cur.push_back(c); have_token = true;
            }
            break;
        case SQ:
            if (c == '\'') st = NORM;
            else cur.push_back(c);
            break;
        case DQ:
            if (esc) { cur.push_back(c); esc = false; }
            else if (c == '\\') esc = true;
            else if (c == '"') st = NORM;
            else cur.push_back(c);
            break;
        }
    }
    if (st != NORM) return {};
    if (have_token) out.push_back(cur);
    return out;
}

namespace {

// Everything the child needs is prepared before fork(): the host may be
// running capability threads, so the child must not allocate.
struct ExecPlan {
    std::vector<std::string> argv_store;
    std::vector<std::string> env_store;
    std::vector<char*> argv;
    std::vector<char*> envp;
    long maxfd{256};

    explicit ExecPlan(const std::vector<std::string>& args) : argv_store(args) {
        for (auto& s : argv_store) argv.push_back(const_cast<char*>(s.c_str()));
        argv.push_back(nullptr);

        // scrub loader injection variables
        for (char** e = environ; e && *e; ++e) {
            if (std::strncmp(*e, "LD_PRELOAD=", 11) == 0) continue;
            if (std::strncmp(*e, "LD_LIBRARY_PATH=", 16) == 0) continue;
            env_store.emplace_back(*e);
        }
        for (auto& s : env_store) envp.push_back(const_cast<char*>(s.c_str()));
        envp.push_back(nullptr);

        maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
    }
};

void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

// Child side, after the standard descriptors are in place. Never returns.
[[noreturn]] void exec_child(const ExecPlan& plan, const std::string& cwd, const ProcLimits& lim) {
    // own process group so a timeout can kill the whole subtree
    (void)setpgid(0, 0);
    (void)umask(077);

    for (int fd = 3; fd < plan.maxfd; fd++) (void)close(fd);

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);

#ifdef __linux__
    if (lim.no_new_privs) (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

    if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
    if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);
#ifdef RLIMIT_NPROC
    if (lim.rlimit_nproc > 0) set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc);
#endif

    // restore default dispositions the host may have changed
    (void)signal(SIGPIPE, SIG_DFL);

    execvpe(plan.argv[0], plan.argv.data(), plan.envp.data());
    _exit(127);
}

void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

int exit_code_from_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 128;
}

// Read whatever is available on a non-blocking fd. Returns false on EOF/error.
bool drain_fd(int fd, std::string& out, size_t cap, bool* truncated) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            size_t can = cap > out.size() ? cap - out.size() : 0;
            size_t take = std::min(can, (size_t)n);
            if (take < (size_t)n) *truncated = true;
            out.append(buf, take);
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        return false;
    }
}

} // namespace

bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    ExecPlan plan(argv);

    int in_pipe[2], out_pipe[2], err_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) != 0) {
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        res->error = std::string("pipe(err) failed: ") + std::strerror(errno);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);
        exec_child(plan, cwd, lim);
    }

    // parent
    (void)setpgid(pid, pid);
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);

    int in_fd = in_pipe[1];
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    set_nonblock(out_fd);
    set_nonblock(err_fd);
    if (stdin_data.empty()) {
        close(in_fd);
        in_fd = -1;
    } else {
        set_nonblock(in_fd);
    }
    size_t write_off = 0;

    // Interleave stdin writes with stdout/stderr reads so a child that
    // answers before consuming all input cannot deadlock us.
    auto start = std::chrono::steady_clock::now();
    bool child_exited = false;
    int status = 0;

    while (true) {
        struct pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) { in_idx = (int)nfds; fds[nfds++] = {in_fd, POLLOUT, 0}; }
        if (out_fd >= 0) { out_idx = (int)nfds; fds[nfds++] = {out_fd, POLLIN, 0}; }
        if (err_fd >= 0) { err_idx = (int)nfds; fds[nfds++] = {err_fd, POLLIN, 0}; }

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining <= 0) {
                res->timed_out = true;
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
                child_exited = true;
                break;
            }
            slice = std::min(slice, remaining);
        }

        int pr = nfds ? poll(fds, nfds, slice) : poll(nullptr, 0, slice);
        if (pr < 0 && errno != EINTR) {
            res->error = std::string("poll failed: ") + std::strerror(errno);
            (void)kill(-pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            child_exited = true;
            break;
        }

        if (pr > 0 && in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data.size()) {
                ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data.size(); // EPIPE: child stopped reading
                break;
            }
            if (write_off >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }
        if (pr > 0 && out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
            if (!drain_fd(out_fd, res->output, lim.stdout_max_bytes, &res->output_truncated)) {
                close(out_fd);
                out_fd = -1;
            }
        }
        if (pr > 0 && err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
            bool ignored = false;
            if (!drain_fd(err_fd, res->stderr_output, lim.stderr_max_bytes, &ignored)) {
                close(err_fd);
                err_fd = -1;
            }
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);
    if (out_fd >= 0) {
        (void)drain_fd(out_fd, res->output, lim.stdout_max_bytes, &res->output_truncated);
        close(out_fd);
    }
    if (err_fd >= 0) {
        bool ignored = false;
        (void)drain_fd(err_fd, res->stderr_output, lim.stderr_max_bytes, &ignored);
        close(err_fd);
    }

    res->exit_code = child_exited ? exit_code_from_status(status) : 128;
    return true;
}

// --- ChildProcess ---

ChildProcess::~ChildProcess() {
    dispose();
}

bool ChildProcess::spawn(const std::vector<std::string>& argv, const ProcLimits& lim, std::string* error) {
    auto fail = [&](const std::string& msg) {
        if (error) *error = msg;
        return false;
    };
    if (pid_ > 0) return fail("child already running");
    if (argv.empty() || argv[0].empty()) return fail("empty argv");

    ExecPlan plan(argv);

    int sv[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
        return fail(std::string("socketpair failed: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(sv[0]); close(sv[1]);
        return fail(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        (void)dup2(sv[1], STDIN_FILENO);
        (void)dup2(sv[1], STDOUT_FILENO);
        exec_child(plan, "", lim);
    }

    (void)setpgid(pid, pid);
    close(sv[1]);
    set_cloexec(sv[0]);
    set_nonblock(sv[0]);

    pid_ = pid;
    chan_fd_ = sv[0];
    reaped_ = false;
    exit_code_ = -1;
    term_signal_ = 0;
    return true;
}

void ChildProcess::record_status(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) exit_code_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) term_signal_ = WTERMSIG(status);
}

bool ChildProcess::poll_exit() {
    if (pid_ <= 0 || reaped_) return reaped_;
    int status = 0;
    pid_t w = waitpid(pid_, &status, WNOHANG);
    if (w == pid_) record_status(status);
    return reaped_;
}

void ChildProcess::kill_group() {
    if (pid_ <= 0 || reaped_) return;
    (void)kill(-pid_, SIGKILL);
    (void)kill(pid_, SIGKILL);
}

void ChildProcess::dispose() {
    if (pid_ > 0 && !reaped_) {
        kill_group();
        int status = 0;
        pid_t w;
        do {
            w = waitpid(pid_, &status, 0);
        } while (w < 0 && errno == EINTR);
        if (w == pid_) record_status(status);
        else reaped_ = true; // reaped elsewhere; nothing left to wait for
    }
    if (chan_fd_ >= 0) {
        close(chan_fd_);
        chan_fd_ = -1;
    }
}

} // namespace codebox
