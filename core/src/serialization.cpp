#include "codebox/serialization.h"

namespace codebox {

// --- JSON helpers ---

std::string json_quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(o);
    return out;
}

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    out->assign(json_object_get_string(v), (size_t)json_object_get_string_len(v));
    return true;
}

bool json_get_bool(json_object* o, const char* k, bool* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (json_object_is_type(v, json_type_boolean)) { *out = (json_object_get_boolean(v) != 0); return true; }
    return false;
}

bool json_get_int(json_object* o, const char* k, int64_t* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (json_object_is_type(v, json_type_int)) { *out = json_object_get_int64(v); return true; }
    return false;
}

std::vector<std::string> json_get_string_array(json_object* o, const char* k) {
    std::vector<std::string> out;
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_array)) return out;
    const size_t n = json_object_array_length(v);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* it = json_object_array_get_idx(v, i);
        if (it && json_object_is_type(it, json_type_string)) out.push_back(json_object_get_string(it));
    }
    return out;
}

// --- RunResult ---

std::string run_result_to_json(const RunResult& r) {
    json_object* o = json_object_new_object();
    if (r.terminal_answer)
        json_object_object_add(o, "terminal_answer",
            json_object_new_string_len(r.terminal_answer->c_str(), (int)r.terminal_answer->size()));
    if (r.raw_return_json) {
        json_object* rv = json_tokener_parse(r.raw_return_json->c_str());
        // null parses to nullptr, which json-c stores as a JSON null member
        json_object_object_add(o, "raw_return", rv);
    }

    json_object* so = json_object_new_array();
    for (const auto& s : r.stdout_lines) json_object_array_add(so, json_object_new_string_len(s.c_str(), (int)s.size()));
    json_object_object_add(o, "stdout", so);
    json_object* se = json_object_new_array();
    for (const auto& s : r.stderr_lines) json_object_array_add(se, json_object_new_string_len(s.c_str(), (int)s.size()));
    json_object_object_add(o, "stderr", se);

    if (r.error)
        json_object_object_add(o, "error", json_object_new_string_len(r.error->c_str(), (int)r.error->size()));
    json_object_object_add(o, "output_truncated", json_object_new_boolean(r.output_truncated));
    json_object_object_add(o, "timed_out", json_object_new_boolean(r.timed_out));
    json_object_object_add(o, "memory_exceeded", json_object_new_boolean(r.memory_exceeded));
    json_object_object_add(o, "duration_ms", json_object_new_int(r.duration_ms));
    json_object_object_add(o, "capability_calls", json_object_new_int(r.capability_calls));

    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(o);
    return out;
}

// --- Chat messages ---

json_object* messages_to_json(const std::vector<ChatMessage>& msgs) {
    json_object* arr = json_object_new_array();
    for (const auto& m : msgs) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "role", json_object_new_string(m.role.c_str()));
        json_object_object_add(o, "content", json_object_new_string_len(m.content.c_str(), (int)m.content.size()));
        json_object_array_add(arr, o);
    }
    return arr;
}

} // namespace codebox
