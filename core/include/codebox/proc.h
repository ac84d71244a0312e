#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

namespace codebox {

struct ProcLimits {
    int timeout_ms{2000};
    size_t stdout_max_bytes{1024 * 1024};
    size_t stderr_max_bytes{64 * 1024};

    int rlimit_cpu_sec{0};          // CPU time seconds (0 = unlimited)
    size_t rlimit_as_mb{512};       // virtual memory MB
    size_t rlimit_fsize_mb{10};     // max file size MB
    int rlimit_nofile{64};          // max open fds
    int rlimit_nproc{0};            // max processes per uid (0 = leave as is)

    bool no_new_privs{true};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output;         // child stdout
    std::string stderr_output;  // child stderr, capped separately
    std::string error;          // internal runner error, not child stderr
};

// Run a process (argv[0] is looked up on PATH) with `stdin_data` on stdin,
// capture stdout and stderr separately, enforce timeout and rlimits.
// Returns true if the process started.
bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

// A long-lived child connected through one end of a socketpair, which it sees
// as both stdin and stdout. stderr is inherited. The child runs in its own
// process group with rlimits applied, and dies with its parent.
//
// dispose() (also run by the destructor) kills the group, reaps the child and
// closes the channel, in that order. It is idempotent.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool spawn(const std::vector<std::string>& argv, const ProcLimits& lim, std::string* error);

    int channel_fd() const { return chan_fd_; }
    pid_t pid() const { return pid_; }

    // Non-blocking reap. True once the child has been reaped.
    bool poll_exit();
    bool exited() const { return reaped_; }
    // Exit status when the child exited normally, -1 otherwise.
    int exit_code() const { return exit_code_; }
    // Terminating signal when the child was killed, 0 otherwise.
    int term_signal() const { return term_signal_; }

    void kill_group();
    void dispose();

private:
    pid_t pid_{-1};
    int chan_fd_{-1};
    bool reaped_{false};
    int exit_code_{-1};
    int term_signal_{0};

    void record_status(int status);
};

} // namespace codebox
