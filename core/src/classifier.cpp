#include "codebox/classifier.h"
#include "codebox/log.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace codebox {

const char* tool_need_name(ToolNeed n) {
    return n == ToolNeed::NONE ? "NONE" : "TOOLS";
}

bool forces_tools(const std::string& user_input) {
    static const std::regex kTrigger(
        R"((\bsendsignal\b|\bsignal_notify\b|send\s+via\s+signal|via\s+signal|signal\s+message|)"
        R"(search\s+library|search\s+notes|my\s+notes|recall|what\s+does\s+.*mean|next\s+action|)"
        R"(add\s+task|new\s+task|todo|remind\s+me|schedule|capture))",
        std::regex::ECMAScript | std::regex::icase);
    return std::regex_search(user_input, kTrigger);
}

ToolNeed parse_classifier_reply(const std::string& reply) {
    std::string up = reply;
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });
    if (up.find("NONE") != std::string::npos) return ToolNeed::NONE;
    return ToolNeed::TOOLS;
}

ClassifierDecision classify_tool_need(IModel& model, IPromptBuilder& prompts,
                                      const InvocationRequest& req, int timeout_ms) {
    ClassifierDecision d;
    if (forces_tools(req.user_input)) {
        d.forced = true;
        return d;
    }

    ModelReply r;
    try {
        r = model.invoke(prompts.classifier_prompt(req), timeout_ms);
    } catch (const std::exception& e) {
        r.ok = false;
        r.error = e.what();
    }
    if (!r.ok) {
        log_warn("pre-classifier failed, defaulting to TOOLS: " + r.error);
        d.model_failed = true;
        return d;
    }
    d.reply = r.content;
    d.need = parse_classifier_reply(r.content);
    return d;
}

} // namespace codebox
