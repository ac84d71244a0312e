#include "codebox/agent.h"
#include "codebox/classifier.h"
#include "codebox/extract.h"
#include "codebox/json_mini.h"
#include "codebox/serialization.h"

#include <algorithm>
#include <stdexcept>

namespace codebox {

const char* const kNoCodeMessage =
    "I couldn't generate the right code to answer your request. Please try rephrasing.";
const char* const kExhaustedMessage =
    "I tried my best but couldn't get a final answer. Please check the logs for more details.";
const char* const kTimeoutMessage =
    "I took too long to think and could not complete the request.";

struct CodeAgent::Turn {
    std::string run_id;
    ExecutionBudget budget;
    AgentReply reply;
    int attempt{0};
    bool done{false};
    bool last_no_code{false};
    std::optional<AttemptFeedback> feedback;
};

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t a = s.find_first_not_of(ws);
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(ws);
    return s.substr(a, b - a + 1);
}

std::string error_payload(const std::string& message, const std::string& error) {
    std::string p = "{\"message\":" + json_quote(message);
    if (!error.empty()) p += ",\"error\":" + json_quote(error);
    return p + "}";
}

} // namespace

std::optional<std::string> answer_from_result(const RunResult& r) {
    if (r.error) return std::nullopt;
    if (r.terminal_answer && !r.terminal_answer->empty()) return r.terminal_answer;
    if (!r.raw_return_json) return std::nullopt;
    if (*r.raw_return_json == "null") return std::nullopt;
    std::string v = json_mini::unquote_if_string(*r.raw_return_json);
    if (v.empty()) return std::nullopt;
    return v;
}

AttemptFeedback make_attempt_feedback(int attempt, const std::string& code,
                                      const std::string& error, const RunResult& r,
                                      size_t max_chars) {
    AttemptFeedback f;
    f.attempt = attempt;
    f.code = code;
    f.error = error;
    f.stdout_text = join_lines(r.stdout_lines);
    f.stderr_text = join_lines(r.stderr_lines);
    truncate_output(f.code, max_chars);
    truncate_output(f.error, max_chars);
    truncate_output(f.stdout_text, max_chars);
    truncate_output(f.stderr_text, max_chars);
    return f;
}

CodeAgent::CodeAgent(AgentContext ctx) : ctx_(std::move(ctx)) {
    if (!ctx_.model) throw std::invalid_argument("CodeAgent: model is required");
    if (!ctx_.prompts) throw std::invalid_argument("CodeAgent: prompt builder is required");
    if (!ctx_.sandbox) throw std::invalid_argument("CodeAgent: sandbox is required");
}

AgentReply CodeAgent::handle(const InvocationRequest& req) {
    Turn t;
    t.run_id = gen_run_id();
    t.budget = ExecutionBudget::start(ctx_.config.max_attempts, ctx_.config.step_timeout_ms,
                                      ctx_.config.total_timeout_ms);
    emit(t, "start", "{\"user_input\":" + json_quote(req.user_input) + "}");

    try {
        if (!(ctx_.config.classifier_enabled && fast_path(t, req))) generation_loop(t, req);
    } catch (const std::exception& e) {
        log_error(std::string("code agent failed: ") + e.what());
        emit(t, "error", error_payload("Code agent failed.", e.what()));
        conclude(t, AgentStatus::EXHAUSTED, kExhaustedMessage);
    }
    if (!t.done) conclude(t, t.last_no_code ? AgentStatus::NO_CODE : AgentStatus::EXHAUSTED,
                          t.last_no_code ? kNoCodeMessage : kExhaustedMessage);

    emit(t, "finish", "{\"final_answer\":" + json_quote(t.reply.message) +
                          ",\"status\":" + json_quote(agent_status_name(t.reply.status)) + "}");
    log_debug("run " + t.run_id + " finished: " + agent_status_name(t.reply.status) +
              " after " + std::to_string(t.reply.attempts) + " attempt(s)");
    return t.reply;
}

// True when the turn was concluded here.
bool CodeAgent::fast_path(Turn& t, const InvocationRequest& req) {
    if (t.budget.expired()) {
        conclude(t, AgentStatus::TIMED_OUT, kTimeoutMessage);
        return true;
    }

    IModel& cm = ctx_.classifier_model ? *ctx_.classifier_model : *ctx_.model;
    ClassifierDecision d = classify_tool_need(cm, *ctx_.prompts, req, (int)t.budget.remaining_ms());
    emit(t, "classifier", std::string("{\"decision\":") + json_quote(tool_need_name(d.need)) +
                              ",\"forced\":" + (d.forced ? "true" : "false") +
                              ",\"model_failed\":" + (d.model_failed ? "true" : "false") + "}");
    if (d.need != ToolNeed::NONE) return false;

    if (t.budget.expired()) {
        conclude(t, AgentStatus::TIMED_OUT, kTimeoutMessage);
        return true;
    }
    CapabilitySet caps = supply_capabilities();
    ModelReply r = call_model(*ctx_.model, ctx_.prompts->direct_prompt(req, bridgeable_names(caps)),
                              t.budget.remaining_ms());
    if (!r.ok) {
        log_warn("direct answer failed, continuing with tools: " + r.error);
        emit(t, "error", error_payload("Direct answer failed.", r.error));
        return false;
    }
    emit(t, "llm_response", "{\"direct\":true,\"response\":" + json_quote(r.content) + "}");

    std::optional<std::string> code = extract_code(r.content);
    if (!code) {
        std::string answer = trim(r.content);
        if (answer.empty()) {
            log_warn("direct answer was empty, continuing with tools");
            return false;
        }
        emit(t, "final_answer", "{\"final_answer\":" + json_quote(answer) + "}");
        conclude(t, AgentStatus::DIRECT, answer);
        return true;
    }

    log_warn("Classifier said NONE, but model outputted code. Falling back to execution.");
    return run_attempt(t, *code, caps, true);
}

void CodeAgent::generation_loop(Turn& t, const InvocationRequest& req) {
    while (!t.done && t.budget.attempts_remaining > 0) {
        if (t.budget.expired()) {
            log_warn("Code agent execution timed out.");
            conclude(t, AgentStatus::TIMED_OUT, kTimeoutMessage);
            return;
        }

        CapabilitySet caps = supply_capabilities();
        std::vector<ChatMessage> prompt = ctx_.prompts->code_prompt(
            req, bridgeable_names(caps), t.feedback ? &*t.feedback : nullptr);
        t.attempt = t.reply.attempts + 1;

        if (ctx_.events) {
            json_object* msgs = messages_to_json(prompt);
            emit(t, "llm_request", "{\"messages\":" + json_mini::to_compact(msgs) + "}");
            json_object_put(msgs);
        }
        ModelReply r = call_model(*ctx_.model, prompt, t.budget.remaining_ms());
        t.reply.generations++;

        if (!r.ok) {
            t.budget.attempts_remaining--;
            t.reply.attempts++;
            t.last_no_code = true;
            emit(t, "error", error_payload("Model invocation failed.", r.error));
            log_warn("Attempt " + std::to_string(t.attempt) + ": model invocation failed: " + r.error);
            continue;
        }
        emit(t, "llm_response", "{\"response\":" + json_quote(r.content) + "}");

        std::optional<std::string> code = extract_code(r.content);
        if (!code) {
            t.budget.attempts_remaining--;
            t.reply.attempts++;
            t.last_no_code = true;
            emit(t, "error", error_payload("No code block found in LLM response.", ""));
            log_warn("Attempt " + std::to_string(t.attempt) + ": No code block found in LLM response.");
            continue;
        }

        run_attempt(t, *code, caps, false);
    }
}

// Consumes one attempt. True when the turn was concluded.
bool CodeAgent::run_attempt(Turn& t, const std::string& code, const CapabilitySet& caps, bool fallback) {
    t.budget.attempts_remaining--;
    t.reply.attempts++;
    t.attempt = t.reply.attempts;
    t.last_no_code = false;
    emit(t, "code_extracted", "{\"code\":" + json_quote(code) +
                                  ",\"fallback\":" + (fallback ? "true" : "false") + "}");

    const int timeout_ms = t.budget.next_timeout_ms();
    if (timeout_ms <= 0) {
        log_warn("Code agent execution timed out.");
        conclude(t, AgentStatus::TIMED_OUT, kTimeoutMessage);
        return true;
    }

    emit(t, "sandbox_run", "{\"code\":" + json_quote(code) +
                               ",\"timeout_ms\":" + std::to_string(timeout_ms) + "}");
    RunResult res = ctx_.sandbox->run(code, caps, timeout_ms);
    emit(t, "sandbox_result", run_result_to_json(res));

    std::optional<std::string> answer = answer_from_result(res);
    if (answer) {
        emit(t, "final_answer", "{\"final_answer\":" + json_quote(*answer) + "}");
        conclude(t, AgentStatus::ANSWERED, *answer);
        return true;
    }

    std::string err = res.error ? *res.error : "The script finished without calling finalAnswer.";
    emit(t, "error", error_payload("Sandbox execution failed.", err));
    log_warn("Attempt " + std::to_string(t.attempt) + ": Sandbox execution failed: " + err);
    t.feedback = make_attempt_feedback(t.attempt, code, err, res, ctx_.config.max_output_chars);
    return false;
}

CapabilitySet CodeAgent::supply_capabilities() {
    if (!ctx_.capabilities) return {};
    try {
        return ctx_.capabilities();
    } catch (const std::exception& e) {
        log_error(std::string("capability supplier failed, running without capabilities: ") + e.what());
        return {};
    }
}

ModelReply CodeAgent::call_model(IModel& m, const std::vector<ChatMessage>& prompt, int64_t remaining_ms) {
    ModelReply r;
    if (remaining_ms <= 0) {
        r.error = "no time left for the model call";
        return r;
    }
    try {
        r = m.invoke(prompt, (int)std::min<int64_t>(remaining_ms, 0x7fffffff));
    } catch (const std::exception& e) {
        r.ok = false;
        r.error = e.what();
    }
    return r;
}

void CodeAgent::emit(const Turn& t, const char* event, const std::string& payload_json) {
    if (ctx_.events) ctx_.events->event(t.run_id, t.attempt, event, payload_json);
}

void CodeAgent::conclude(Turn& t, AgentStatus status, const std::string& message) {
    t.done = true;
    t.reply.status = status;
    t.reply.message = message;
}

} // namespace codebox
