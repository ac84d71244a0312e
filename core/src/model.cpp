#include "codebox/model.h"
#include "codebox/json_mini.h"
#include "codebox/log.h"
#include "codebox/serialization.h"

#include <algorithm>
#include <chrono>

namespace codebox {

namespace {

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

bool reply_from_object(const std::string& text, ModelReply* out) {
    json_mini::Doc d = json_mini::parse(text);
    if (!d || !json_object_is_type(d.root, json_type_object)) return false;
    std::string v;
    if (json_get_string(d.root, "content", &v)) {
        out->ok = true;
        out->content = std::move(v);
        return true;
    }
    if (json_get_string(d.root, "error", &v)) {
        out->ok = false;
        out->error = v.empty() ? "model reported an error" : v;
        return true;
    }
    return false;
}

} // namespace

ModelReply parse_model_output(const std::string& stdout_text) {
    ModelReply r;
    size_t start = 0;
    while (start < stdout_text.size()) {
        size_t nl = stdout_text.find('\n', start);
        std::string line = stdout_text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (reply_from_object(line, &r)) return r;
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    if (reply_from_object(stdout_text, &r)) return r;
    r.ok = false;
    r.error = "model output has no content";
    return r;
}

ExternalProcessModel::ExternalProcessModel(ExternalModelOptions opt) : opt_(std::move(opt)) {
    argv_ = split_argv_quoted(opt_.cmd);
    if (opt_.fail_threshold < 1) opt_.fail_threshold = 1;
    if (opt_.cooldown_ms < 0) opt_.cooldown_ms = 0;
}

ModelReply ExternalProcessModel::invoke(const std::vector<ChatMessage>& messages, int timeout_ms) {
    if (argv_.empty()) {
        ModelReply r;
        r.error = "model command is not configured";
        return r;
    }

    const int64_t now = now_ms();
    if (disabled_until_ms_.load() > now) {
        ModelReply r;
        r.error = "model temporarily disabled after repeated failures";
        return r;
    }

    ModelReply r = invoke_once(messages, timeout_ms);
    if (r.ok) {
        consecutive_fail_.store(0);
    } else {
        int fails = consecutive_fail_.fetch_add(1) + 1;
        if (fails >= opt_.fail_threshold) {
            disabled_until_ms_.store(now_ms() + opt_.cooldown_ms);
            consecutive_fail_.store(0);
            log_warn("model circuit breaker tripped after " + std::to_string(fails) +
                     " consecutive failures; cooling down for " + std::to_string(opt_.cooldown_ms) + " ms");
        }
    }
    return r;
}

ModelReply ExternalProcessModel::invoke_once(const std::vector<ChatMessage>& messages, int timeout_ms) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "messages", messages_to_json(messages));
    std::string payload = json_object_to_json_string_ext(root, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(root);

    ProcLimits lim;
    lim.timeout_ms = std::max(1, std::min(opt_.timeout_ms, timeout_ms));
    lim.stdout_max_bytes = opt_.stdout_max_bytes;
    lim.rlimit_as_mb = opt_.rlimit_as_mb;
    lim.rlimit_nofile = 256;

    ModelReply r;
    ProcResult pr;
    if (!proc_run_capture_stdin(argv_, "", payload, lim, &pr)) {
        r.error = "model launch failed: " + pr.error;
        return r;
    }
    if (pr.timed_out) {
        r.error = "model timed out after " + std::to_string(lim.timeout_ms) + " ms";
        return r;
    }
    if (pr.exit_code != 0) {
        std::string tail = pr.stderr_output.substr(0, 300);
        r.error = "model exit " + std::to_string(pr.exit_code) + (tail.empty() ? "" : ": " + tail);
        return r;
    }
    if (pr.output_truncated) {
        r.error = "model output exceeded " + std::to_string(opt_.stdout_max_bytes) + " bytes";
        return r;
    }
    return parse_model_output(pr.output);
}

} // namespace codebox
