#include "codebox/types.h"

#include <algorithm>

namespace codebox {

ExecutionBudget ExecutionBudget::start(int max_attempts, int step_timeout_ms, int total_timeout_ms) {
    ExecutionBudget b;
    b.attempts_remaining = std::max(0, max_attempts);
    b.step_timeout_ms = step_timeout_ms;
    b.total_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(total_timeout_ms);
    return b;
}

int64_t ExecutionBudget::remaining_ms() const {
    using namespace std::chrono;
    return duration_cast<milliseconds>(total_deadline - steady_clock::now()).count();
}

int ExecutionBudget::next_timeout_ms() const {
    int64_t rem = remaining_ms();
    if (rem <= 0) return 0;
    return (int)std::min<int64_t>(step_timeout_ms, rem);
}

const char* agent_status_name(AgentStatus s) {
    switch (s) {
        case AgentStatus::ANSWERED:  return "answered";
        case AgentStatus::DIRECT:    return "direct";
        case AgentStatus::NO_CODE:   return "no_code";
        case AgentStatus::EXHAUSTED: return "exhausted";
        case AgentStatus::TIMED_OUT: return "timed_out";
    }
    return "exhausted";
}

} // namespace codebox
