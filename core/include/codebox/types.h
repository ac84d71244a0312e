#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codebox {

struct ChatMessage {
    std::string role;     // "system" | "user" | "assistant"
    std::string content;
};

// One user turn as seen by the controller. Read-only for the core.
struct InvocationRequest {
    std::string user_input;
    std::vector<ChatMessage> history;
};

// Outcome of one isolate run. At most one of terminal_answer / error is
// authoritative; raw_return_json is a best-effort fallback.
struct RunResult {
    std::optional<std::string> terminal_answer;
    std::optional<std::string> raw_return_json; // compact JSON text
    std::vector<std::string> stdout_lines;
    std::vector<std::string> stderr_lines;
    std::optional<std::string> error;

    // diagnostics only
    bool output_truncated{false};
    bool timed_out{false};
    bool memory_exceeded{false};
    int duration_ms{0};
    int capability_calls{0};
};

// Attempt/time budget owned by the controller. The deadline is fixed at
// construction and never extended.
struct ExecutionBudget {
    int attempts_remaining{0};
    std::chrono::steady_clock::time_point total_deadline;
    int step_timeout_ms{0};

    static ExecutionBudget start(int max_attempts, int step_timeout_ms, int total_timeout_ms);

    int64_t remaining_ms() const;
    // min(step timeout, remaining total budget); <= 0 means the budget is spent.
    int next_timeout_ms() const;
    bool expired() const { return remaining_ms() <= 0; }
};

// What the previous failed attempt left behind, for the next prompt.
struct AttemptFeedback {
    int attempt{0};
    std::string code;
    std::string error;
    std::string stdout_text;
    std::string stderr_text;
};

enum class AgentStatus {
    ANSWERED,   // terminal answer (or raw return value) from the sandbox
    DIRECT,     // fast path: model answered without tools
    NO_CODE,    // model never produced runnable code
    EXHAUSTED,  // attempts used up without an answer
    TIMED_OUT,  // total deadline reached
};

const char* agent_status_name(AgentStatus s);

struct AgentReply {
    AgentStatus status{AgentStatus::EXHAUSTED};
    std::string message;    // the only text shown to the user
    int attempts{0};        // sandbox-or-generation attempts consumed
    int generations{0};     // code generation model calls
};

} // namespace codebox
