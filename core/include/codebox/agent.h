#pragma once
#include "capability.h"
#include "config.h"
#include "isolate_sandbox.h"
#include "log.h"
#include "model.h"
#include "prompt.h"
#include "types.h"

#include <functional>
#include <optional>
#include <string>

namespace codebox {

extern const char* const kNoCodeMessage;
extern const char* const kExhaustedMessage;
extern const char* const kTimeoutMessage;

// Collaborators are borrowed and must outlive the agent. classifier_model and
// events are optional; capabilities is called once per attempt and may be empty.
struct AgentContext {
    EngineConfig config;
    IModel* model{nullptr};
    IModel* classifier_model{nullptr};  // null: use model
    IPromptBuilder* prompts{nullptr};
    ISandbox* sandbox{nullptr};
    std::function<CapabilitySet()> capabilities;
    EventLog* events{nullptr};
};

// Turns one user request into one reply: classify, generate a script, run it
// in the sandbox, retry with feedback until an answer, the attempt budget or
// the total deadline runs out. handle() never throws.
class CodeAgent {
public:
    // Throws std::invalid_argument when model, prompts or sandbox is missing.
    explicit CodeAgent(AgentContext ctx);

    AgentReply handle(const InvocationRequest& req);

private:
    struct Turn;

    AgentContext ctx_;

    bool fast_path(Turn& t, const InvocationRequest& req);
    void generation_loop(Turn& t, const InvocationRequest& req);
    bool run_attempt(Turn& t, const std::string& code, const CapabilitySet& caps, bool fallback);

    CapabilitySet supply_capabilities();
    ModelReply call_model(IModel& m, const std::vector<ChatMessage>& prompt, int64_t remaining_ms);
    void emit(const Turn& t, const char* event, const std::string& payload_json);
    void conclude(Turn& t, AgentStatus status, const std::string& message);
};

// Nothing when the run failed; otherwise the terminal answer, else the raw
// return value. Empty answers and a null return do not count.
std::optional<std::string> answer_from_result(const RunResult& r);

// Feedback for the next prompt, each text field cut to max_chars.
AttemptFeedback make_attempt_feedback(int attempt, const std::string& code,
                                      const std::string& error, const RunResult& r,
                                      size_t max_chars);

} // namespace codebox
