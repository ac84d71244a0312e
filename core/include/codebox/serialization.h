#pragma once

#include "types.h"

#include <json-c/json.h>

#include <string>
#include <vector>

namespace codebox {

// --- JSON helpers (json-c wrappers) ---

std::string json_quote(const std::string& s);

bool json_get_string(json_object* o, const char* k, std::string* out);
bool json_get_bool(json_object* o, const char* k, bool* out);
bool json_get_int(json_object* o, const char* k, int64_t* out);
std::vector<std::string> json_get_string_array(json_object* o, const char* k);

// --- RunResult ---

// {"terminal_answer"?, "raw_return"?, "stdout":[..], "stderr":[..], "error"?,
//  "output_truncated", "timed_out", "memory_exceeded", "duration_ms",
//  "capability_calls"}
// raw_return is embedded as a JSON value, not a string.
std::string run_result_to_json(const RunResult& r);

// --- Chat messages ---

// [{"role":..,"content":..}, ...]
json_object* messages_to_json(const std::vector<ChatMessage>& msgs);

} // namespace codebox
