#pragma once
#include "model.h"
#include "prompt.h"
#include "types.h"

#include <string>

namespace codebox {

enum class ToolNeed { NONE, TOOLS };

const char* tool_need_name(ToolNeed n);

// Trigger phrases (explicit notification tools, notes/library search,
// task and scheduling intent) that always take the tools path.
bool forces_tools(const std::string& user_input);

// Uppercased reply containing NONE -> NONE, else TOOLS.
ToolNeed parse_classifier_reply(const std::string& reply);

struct ClassifierDecision {
    ToolNeed need{ToolNeed::TOOLS};
    bool forced{false};        // trigger phrase matched, no model call
    bool model_failed{false};  // model error; defaulted to TOOLS
    std::string reply;         // raw model text
};

ClassifierDecision classify_tool_need(IModel& model, IPromptBuilder& prompts,
                                      const InvocationRequest& req, int timeout_ms);

} // namespace codebox
