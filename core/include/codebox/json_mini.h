#pragma once

// json_mini.h
//
// Small read helpers over json-c for the isolate protocol, capability
// manifests and model replies. Every helper parses its input afresh; callers
// that need several fields of one document should hold a Doc instead.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>

namespace codebox::json_mini {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    explicit operator bool() const { return root != nullptr; }

    // Member lookup on an object root. Borrowed pointer, valid while the Doc lives.
    json_object* get(const char* key) const {
        if (!root || !json_object_is_type(root, json_type_object)) return nullptr;
        json_object* v = nullptr;
        if (!json_object_object_get_ex(root, key, &v)) return nullptr;
        return v;
    }
};

// Strict parse: trailing garbage or a truncated document yields an empty Doc.
inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = tok->char_offset;
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    for (size_t i = consumed; i < json.size(); ++i) {
        char c = json[i];
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            if (obj) json_object_put(obj);
            return Doc{};
        }
    }
    // A bare null also yields an empty Doc; see is_valid().
    return Doc{obj};
}

// True when `json` is one complete JSON value (including a bare null).
inline bool is_valid(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return false;
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    bool ok = json_tokener_get_error(tok) == json_tokener_success;
    size_t consumed = tok->char_offset;
    json_tokener_free(tok);
    if (obj) json_object_put(obj);
    if (!ok) return false;
    for (size_t i = consumed; i < json.size(); ++i) {
        char c = json[i];
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
    }
    return true;
}

// Compact serialization of a borrowed value. nullptr renders as "null".
inline std::string to_compact(json_object* v) {
    if (!v) return "null";
    return std::string(json_object_to_json_string_ext(v, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE));
}

inline std::optional<std::string> get_string(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    json_object* v = d.get(key.c_str());
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

inline std::optional<int64_t> get_int(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    json_object* v = d.get(key.c_str());
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

// A JSON string literal decodes to its contents; anything else is returned as-is.
inline std::string unquote_if_string(const std::string& json) {
    Doc d = parse(json);
    if (d && json_object_is_type(d.root, json_type_string)) {
        return std::string(json_object_get_string(d.root), (size_t)json_object_get_string_len(d.root));
    }
    return json;
}

} // namespace codebox::json_mini
