#include "codebox/isolate_protocol.h"
#include "codebox/json_mini.h"
#include "codebox/serialization.h"

#include <json-c/json.h>

namespace codebox {

namespace {

std::string to_line(json_object* o) {
    std::string s = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(o);
    return s;
}

json_object* new_str(const std::string& s) {
    return json_object_new_string_len(s.c_str(), (int)s.size());
}

// Parses raw JSON text into a json-c value for embedding. Invalid text becomes null.
json_object* raw_value(const std::string& json) {
    return json_tokener_parse(json.c_str());
}

} // namespace

std::string encode_request(const IsolateRequest& req) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "code", new_str(req.code));
    json_object* caps = json_object_new_array();
    for (const auto& c : req.capabilities) json_object_array_add(caps, new_str(c));
    json_object_object_add(o, "capabilities", caps);
    json_object_object_add(o, "memory_limit_mb", json_object_new_int64((int64_t)req.memory_limit_mb));
    json_object_object_add(o, "timeout_ms", json_object_new_int64(req.timeout_ms));
    json_object_object_add(o, "seccomp", json_object_new_boolean(req.seccomp));
    return to_line(o);
}

bool decode_request(const std::string& line, IsolateRequest* out, std::string* error) {
    json_mini::Doc d = json_mini::parse(line);
    if (!d || !json_object_is_type(d.root, json_type_object)) {
        if (error) *error = "request is not a JSON object";
        return false;
    }
    IsolateRequest r;
    if (!json_get_string(d.root, "code", &r.code)) {
        if (error) *error = "request has no code";
        return false;
    }
    r.capabilities = json_get_string_array(d.root, "capabilities");
    int64_t mb = 0;
    if (json_get_int(d.root, "memory_limit_mb", &mb) && mb > 0) r.memory_limit_mb = (size_t)mb;
    int64_t ms = 0;
    if (json_get_int(d.root, "timeout_ms", &ms) && ms > 0 && ms <= 0x7fffffff) r.timeout_ms = (int)ms;
    (void)json_get_bool(d.root, "seccomp", &r.seccomp);
    *out = std::move(r);
    return true;
}

IsolateMessage decode_isolate_message(const std::string& line) {
    IsolateMessage m;
    json_mini::Doc d = json_mini::parse(line);
    if (!d || !json_object_is_type(d.root, json_type_object)) return m;

    std::string t;
    if (!json_get_string(d.root, "t", &t)) return m;

    if (t == "ready") {
        m.type = IsolateMessage::Type::READY;
    } else if (t == "out") {
        if (!json_get_string(d.root, "stream", &m.stream)) return m;
        if (!json_get_string(d.root, "text", &m.text)) return m;
        if (m.stream != "stdout" && m.stream != "stderr") return m;
        m.type = IsolateMessage::Type::OUT;
    } else if (t == "final") {
        if (!json_get_string(d.root, "text", &m.text)) return m;
        m.type = IsolateMessage::Type::FINAL;
    } else if (t == "call") {
        if (!json_get_int(d.root, "id", &m.id)) return m;
        if (!json_get_string(d.root, "name", &m.name)) return m;
        json_object* a = d.get("args");
        if (!a || !json_object_is_type(a, json_type_array)) return m;
        m.args_json = json_mini::to_compact(a);
        m.type = IsolateMessage::Type::CALL;
    } else if (t == "done") {
        if (!json_get_bool(d.root, "ok", &m.ok)) return m;
        if (m.ok) {
            json_object* v = nullptr;
            if (json_object_object_get_ex(d.root, "value", &v)) m.value_json = json_mini::to_compact(v);
        } else {
            if (!json_get_string(d.root, "error", &m.error)) m.error = "unknown error";
            (void)json_get_string(d.root, "kind", &m.kind);
        }
        m.type = IsolateMessage::Type::DONE;
    }
    return m;
}

std::string encode_ready() {
    return "{\"t\":\"ready\"}";
}

std::string encode_out(const std::string& stream, const std::string& text) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "t", json_object_new_string("out"));
    json_object_object_add(o, "stream", new_str(stream));
    json_object_object_add(o, "text", new_str(text));
    return to_line(o);
}

std::string encode_final(const std::string& text) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "t", json_object_new_string("final"));
    json_object_object_add(o, "text", new_str(text));
    return to_line(o);
}

std::string encode_call(int64_t id, const std::string& name, const std::string& args_json) {
    json_object* args = raw_value(args_json);
    if (!args || !json_object_is_type(args, json_type_array)) {
        if (args) json_object_put(args);
        args = json_object_new_array();
    }
    json_object* o = json_object_new_object();
    json_object_object_add(o, "t", json_object_new_string("call"));
    json_object_object_add(o, "id", json_object_new_int64(id));
    json_object_object_add(o, "name", new_str(name));
    json_object_object_add(o, "args", args);
    return to_line(o);
}

std::string encode_done_ok(const std::optional<std::string>& value_json) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "t", json_object_new_string("done"));
    json_object_object_add(o, "ok", json_object_new_boolean(1));
    if (value_json) json_object_object_add(o, "value", raw_value(*value_json));
    return to_line(o);
}

std::string encode_done_error(const std::string& error, const std::string& kind) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "t", json_object_new_string("done"));
    json_object_object_add(o, "ok", json_object_new_boolean(0));
    json_object_object_add(o, "error", new_str(error));
    json_object_object_add(o, "kind", new_str(kind));
    return to_line(o);
}

std::string encode_reply(const CallReply& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "id", json_object_new_int64(r.id));
    json_object_object_add(o, "ok", json_object_new_boolean(r.ok));
    if (r.ok) json_object_object_add(o, "value", raw_value(r.value_json));
    else json_object_object_add(o, "error", new_str(r.error));
    return to_line(o);
}

bool decode_reply(const std::string& line, CallReply* out) {
    json_mini::Doc d = json_mini::parse(line);
    if (!d || !json_object_is_type(d.root, json_type_object)) return false;
    CallReply r;
    if (!json_get_int(d.root, "id", &r.id)) return false;
    if (!json_get_bool(d.root, "ok", &r.ok)) return false;
    if (r.ok) {
        json_object* v = nullptr;
        if (json_object_object_get_ex(d.root, "value", &v)) r.value_json = json_mini::to_compact(v);
    } else if (!json_get_string(d.root, "error", &r.error)) {
        r.error = "capability failed";
    }
    *out = std::move(r);
    return true;
}

// buf_[0, scan_from_) is known to hold no '\n'.
void LineBuffer::append(const char* data, size_t n) {
    if (overflow_) return;
    buf_.append(data, n);
    size_t nl = buf_.find('\n', scan_from_);
    if (nl == std::string::npos) {
        scan_from_ = buf_.size();
        if (buf_.size() > max_line_) overflow_ = true;
    } else {
        scan_from_ = nl;
    }
}

bool LineBuffer::next_line(std::string* line) {
    if (overflow_) return false;
    size_t nl = buf_.find('\n', scan_from_);
    if (nl == std::string::npos) {
        scan_from_ = buf_.size();
        if (buf_.size() > max_line_) overflow_ = true;
        return false;
    }
    if (nl > max_line_) {
        overflow_ = true;
        return false;
    }
    line->assign(buf_, 0, nl);
    buf_.erase(0, nl + 1);
    scan_from_ = 0;
    return true;
}

} // namespace codebox
