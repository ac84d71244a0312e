#include "codebox/isolate_sandbox.h"
#include "codebox/extract.h"
#include "codebox/isolate_protocol.h"
#include "codebox/log.h"
#include "codebox/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace codebox {

namespace {

const char* const kTimeoutMessage = "Script execution timed out.";
const char* const kMemoryMessage = "Isolate was disposed during execution due to memory limit";

// Shared between the run and the worker thread executing one capability.
// Whoever finishes last frees it.
struct PendingCall {
    std::mutex mu;
    bool done{false};
    bool abandoned{false};
    CapabilityResult result;
};

int64_t elapsed_ms(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
}

// All state for one run. The destructor is the single teardown path:
// abandon outstanding calls and drop queued replies first, then kill, reap
// and close the isolate process.
class RunSession {
public:
    RunSession(const SandboxOptions& opt, const CapabilitySet& caps)
        : opt_(opt),
          caps_(std::make_shared<const CapabilitySet>(caps)),
          stdout_(opt.max_output_chars),
          stderr_(opt.max_output_chars) {}

    ~RunSession() { teardown(); }

    RunSession(const RunSession&) = delete;
    RunSession& operator=(const RunSession&) = delete;

    void execute(const std::string& code, int timeout_ms, RunResult* res);

private:
    const SandboxOptions& opt_;
    std::shared_ptr<const CapabilitySet> caps_;
    std::set<std::string> installed_;

    ChildProcess child_;
    LineBuffer lines_;
    std::string outbox_;
    std::map<int64_t, std::shared_ptr<PendingCall>> pending_;

    CappedLines stdout_;
    CappedLines stderr_;
    std::optional<std::string> final_;
    bool ready_{false};
    bool done_{false};
    IsolateMessage done_msg_;
    std::optional<std::string> failure_;
    int calls_{0};
    bool torn_down_{false};

    void queue_line(const std::string& line);
    bool flush_outbox();
    // false on EOF or a read error
    bool read_channel();
    void handle_line(const std::string& line);
    void start_call(const IsolateMessage& m);
    void collect_finished_calls();
    void describe_unexpected_exit(RunResult* res);
    void teardown();
};

void RunSession::queue_line(const std::string& line) {
    outbox_ += line;
    outbox_ += '\n';
}

bool RunSession::flush_outbox() {
    while (!outbox_.empty()) {
        ssize_t n = send(child_.channel_fd(), outbox_.data(), outbox_.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n > 0) {
            outbox_.erase(0, (size_t)n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        // EPIPE/ECONNRESET: the isolate is gone; the read side reports it
        outbox_.clear();
        return false;
    }
    return true;
}

bool RunSession::read_channel() {
    char buf[16384];
    while (true) {
        ssize_t n = read(child_.channel_fd(), buf, sizeof(buf));
        if (n > 0) {
            lines_.append(buf, (size_t)n);
            if (lines_.overflow()) return true;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        return false;
    }
}

void RunSession::handle_line(const std::string& line) {
    if (done_ || failure_) return;
    IsolateMessage m = decode_isolate_message(line);
    switch (m.type) {
    case IsolateMessage::Type::READY:
        ready_ = true;
        break;
    case IsolateMessage::Type::OUT:
        (m.stream == "stderr" ? stderr_ : stdout_).push(m.text);
        break;
    case IsolateMessage::Type::FINAL:
        if (!final_) final_ = m.text;
        else log_warn("finalAnswer called more than once. Subsequent calls are ignored.");
        break;
    case IsolateMessage::Type::CALL:
        start_call(m);
        break;
    case IsolateMessage::Type::DONE:
        done_ = true;
        done_msg_ = std::move(m);
        break;
    case IsolateMessage::Type::INVALID:
        failure_ = "isolate protocol violation: unrecognized message";
        break;
    }
}

void RunSession::start_call(const IsolateMessage& m) {
    ++calls_;
    if (pending_.count(m.id)) {
        failure_ = "isolate protocol violation: duplicate call id " + std::to_string(m.id);
        return;
    }
    if (!installed_.count(m.name)) {
        // The isolate only installs what we sent, so this is a confused
        // or hostile isolate; answer without touching the host.
        log_warn("isolate asked for capability '" + m.name + "' which was not installed");
        CallReply r;
        r.id = m.id;
        r.error = m.name + " is not available";
        queue_line(encode_reply(r));
        return;
    }

    auto call = std::make_shared<PendingCall>();
    pending_[m.id] = call;
    std::thread([call, caps = caps_, name = m.name, args = m.args_json]() {
        CapabilityResult r = invoke_capability(*caps, name, args);
        std::lock_guard<std::mutex> lk(call->mu);
        call->result = std::move(r);
        call->done = true;
        if (call->abandoned) log_debug("capability '" + name + "' finished after its run ended; result dropped");
    }).detach();
}

void RunSession::collect_finished_calls() {
    for (auto it = pending_.begin(); it != pending_.end();) {
        CallReply r;
        {
            std::lock_guard<std::mutex> lk(it->second->mu);
            if (!it->second->done) { ++it; continue; }
            r.id = it->first;
            r.ok = it->second->result.ok;
            r.value_json = std::move(it->second->result.value_json);
            r.error = std::move(it->second->result.error);
        }
        if (r.ok && r.value_json.size() + 64 > kMaxProtocolLine) {
            r.ok = false;
            r.error = "capability result too large";
        }
        queue_line(encode_reply(r));
        it = pending_.erase(it);
    }
}

void RunSession::describe_unexpected_exit(RunResult* res) {
    child_.dispose();
    if (child_.exit_code() == 127 && !ready_) {
        res->error = "failed to start isolate: exec " + opt_.isolate_bin + " failed";
    } else if (child_.term_signal() == SIGXCPU) {
        res->timed_out = true;
        res->error = kTimeoutMessage;
    } else if (child_.term_signal() != 0) {
        res->error = "isolate terminated by signal " + std::to_string(child_.term_signal());
    } else {
        res->error = "isolate exited with code " + std::to_string(child_.exit_code()) + " before finishing";
    }
}

void RunSession::execute(const std::string& code, int timeout_ms, RunResult* res) {
    const auto t0 = std::chrono::steady_clock::now();

    IsolateRequest req;
    req.capabilities = bridgeable_names(*caps_);
    installed_.insert(req.capabilities.begin(), req.capabilities.end());
    req.code = opt_.lazy_return ? apply_lazy_return(code) : code;
    if (req.code != code) log_debug("lazy return applied to last expression");
    req.memory_limit_mb = opt_.memory_limit_mb;
    req.seccomp = opt_.enable_seccomp;

    if (opt_.isolate_bin.empty() || access(opt_.isolate_bin.c_str(), X_OK) != 0) {
        res->error = "isolate binary not executable: " + opt_.isolate_bin;
        return;
    }

    ProcLimits lim;
    lim.rlimit_as_mb = opt_.memory_limit_mb + opt_.process_overhead_mb;
    lim.rlimit_cpu_sec = timeout_ms / 1000 + 2;
    lim.rlimit_fsize_mb = 1;
    lim.rlimit_nofile = 16;

    std::string err;
    if (!child_.spawn({opt_.isolate_bin}, lim, &err)) {
        res->error = "failed to start isolate: " + err;
        return;
    }
    // The engine stops itself at the same deadline; the kill below is the backstop.
    req.timeout_ms = (int)std::max<int64_t>(1, timeout_ms - elapsed_ms(t0));
    queue_line(encode_request(req));

    bool eof = false;
    while (!done_ && !failure_) {
        int64_t remaining = timeout_ms - elapsed_ms(t0);
        if (remaining <= 0) {
            child_.kill_group();
            res->timed_out = true;
            break;
        }

        collect_finished_calls();

        struct pollfd pfd{child_.channel_fd(), (short)(POLLIN | (outbox_.empty() ? 0 : POLLOUT)), 0};
        int slice = pending_.empty() ? 50 : 5;
        slice = (int)std::min<int64_t>(slice, remaining);
        int pr = poll(&pfd, 1, slice);
        if (pr < 0) {
            if (errno == EINTR) continue;
            failure_ = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (pr == 0) continue;

        if (pfd.revents & POLLOUT) (void)flush_outbox();
        if (pfd.revents & (POLLIN | POLLHUP | POLLERR)) {
            eof = !read_channel();
            std::string line;
            while (!done_ && !failure_ && lines_.next_line(&line)) handle_line(line);
            if (lines_.overflow()) failure_ = "isolate protocol violation: line exceeds 16 MiB";
            if (eof) break;
        }
    }

    res->capability_calls = calls_;

    if (res->timed_out) {
        res->error = kTimeoutMessage;
    } else if (failure_) {
        res->error = *failure_;
    } else if (done_) {
        if (!done_msg_.ok) {
            if (done_msg_.kind == kFailMemory) {
                res->memory_exceeded = true;
                res->error = kMemoryMessage;
            } else if (done_msg_.kind == kFailTimeout) {
                res->timed_out = true;
                res->error = kTimeoutMessage;
            } else {
                res->error = done_msg_.error;
            }
        } else if (!final_ && done_msg_.value_json) {
            res->raw_return_json = done_msg_.value_json;
        }
    } else if (eof) {
        describe_unexpected_exit(res);
    }

    if (res->error) {
        log_error("Error executing code in sandbox: " + *res->error);
        if (final_) log_warn("finalAnswer was called but the run failed; the answer is discarded");
    } else {
        res->terminal_answer = final_;
    }
    teardown();
    res->stdout_lines = stdout_.take();
    res->stderr_lines = stderr_.take();
    res->output_truncated = stdout_.truncated() || stderr_.truncated();
}

void RunSession::teardown() {
    if (torn_down_) return;
    torn_down_ = true;
    for (auto& kv : pending_) {
        std::lock_guard<std::mutex> lk(kv.second->mu);
        kv.second->abandoned = true;
    }
    if (!pending_.empty()) log_debug("abandoning " + std::to_string(pending_.size()) + " capability call(s)");
    pending_.clear();
    outbox_.clear();
    child_.dispose();
}

} // namespace

IsolateSandbox::IsolateSandbox(SandboxOptions opt) : opt_(std::move(opt)) {}

RunResult IsolateSandbox::run(const std::string& code, const CapabilitySet& caps, int timeout_ms) {
    const auto t0 = std::chrono::steady_clock::now();
    RunResult res;

    if (timeout_ms <= 0) {
        res.timed_out = true;
        res.error = kTimeoutMessage;
        return res;
    }

    try {
        RunSession session(opt_, caps);
        session.execute(code, timeout_ms, &res);
    } catch (const std::exception& e) {
        log_error(std::string("sandbox run failed: ") + e.what());
        res.error = std::string("sandbox failure: ") + e.what();
    }

    res.duration_ms = (int)elapsed_ms(t0);
    return res;
}

} // namespace codebox
