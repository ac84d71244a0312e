#pragma once
#include "proc.h"
#include "types.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace codebox {

struct ModelReply {
    bool ok{false};
    std::string content;
    std::string error;
};

// Model invocation collaborator. `timeout_ms` is the most the caller can
// wait; implementations should give up by then and report an error.
class IModel {
public:
    virtual ~IModel() = default;
    virtual ModelReply invoke(const std::vector<ChatMessage>& messages, int timeout_ms) = 0;
};

struct ExternalModelOptions {
    std::string cmd;                 // split with split_argv_quoted, no shell
    int timeout_ms{60000};
    size_t stdout_max_bytes{4 * 1024 * 1024};
    size_t rlimit_as_mb{4096};

    // Circuit breaker: after fail_threshold consecutive failures the model
    // is reported unavailable for cooldown_ms, then retried.
    int fail_threshold{5};
    int64_t cooldown_ms{30000};
};

// Runs an external program per invocation.
//   stdin:  {"messages":[{"role":"system","content":"..."}, ...]}
//   stdout: {"content":"..."}  or  {"error":"..."}
// The first stdout line that parses as a JSON object is used; if none does,
// the whole of stdout is tried.
class ExternalProcessModel final : public IModel {
public:
    explicit ExternalProcessModel(ExternalModelOptions opt);
    ModelReply invoke(const std::vector<ChatMessage>& messages, int timeout_ms) override;

    bool configured() const { return !argv_.empty(); }

private:
    ExternalModelOptions opt_;
    std::vector<std::string> argv_;
    std::atomic<int> consecutive_fail_{0};
    std::atomic<int64_t> disabled_until_ms_{0};

    ModelReply invoke_once(const std::vector<ChatMessage>& messages, int timeout_ms);
};

// Pulls {"content"} / {"error"} out of a model program's stdout.
ModelReply parse_model_output(const std::string& stdout_text);

} // namespace codebox
