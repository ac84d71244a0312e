#include "codebox/capability.h"
#include "codebox/json_mini.h"
#include "codebox/log.h"
#include "codebox/serialization.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace codebox {

namespace {

std::string slurp(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss; ss << f.rdbuf();
    return ss.str();
}

std::string first_line_trimmed(const std::string& s, size_t max_len) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find('\n', b);
    std::string line = s.substr(b, e == std::string::npos ? std::string::npos : e - b);
    while (!line.empty() && std::isspace((unsigned char)line.back())) line.pop_back();
    if (line.size() > max_len) line.resize(max_len);
    return line;
}

} // namespace

const std::vector<std::string>& capability_vocabulary() {
    static const std::vector<std::string> v = {
        "webSearch", "fetchText",
        "queryKnowledgeBase", "queryRAG", "kb_query",
        "read_note", "zk_create", "writeNote", "capture",
        "schedule", "list_scheduled_tasks", "delete_scheduled_task", "toggle_scheduled_task",
        "list_plugins",
        "calendarList", "calendarCreate",
        "sendEmail",
        "notify", "discordNotify", "signalNotify", "sendSignal",
        "finalAnswer",
    };
    return v;
}

bool is_known_capability(const std::string& name) {
    const auto& v = capability_vocabulary();
    return std::find(v.begin(), v.end(), name) != v.end();
}

bool is_reserved_name(const std::string& name) {
    return name == "finalAnswer" || name == "console";
}

bool is_valid_capability_name(const std::string& name) {
    if (name.empty() || name.size() > 64) return false;
    auto head = [](char c) { return std::isalpha((unsigned char)c) || c == '_' || c == '$'; };
    if (!head(name[0])) return false;
    for (char c : name) {
        if (!(head(c) || std::isdigit((unsigned char)c))) return false;
    }
    return true;
}

std::vector<std::string> bridgeable_names(const CapabilitySet& caps) {
    std::vector<std::string> out;
    for (const auto& kv : caps) {
        const std::string& n = kv.first;
        if (!kv.second) {
            log_warn("capability '" + n + "' has no implementation; skipped");
            continue;
        }
        if (is_reserved_name(n)) {
            log_debug("capability '" + n + "' is provided by the sandbox itself; skipped");
            continue;
        }
        if (!is_valid_capability_name(n) || !is_known_capability(n)) {
            log_warn("capability '" + n + "' is not in vocabulary v" +
                     std::to_string(kCapabilityVocabularyVersion) + "; skipped");
            continue;
        }
        out.push_back(n);
    }
    return out; // std::map iteration order is already sorted
}

CapabilityResult invoke_capability(const CapabilitySet& caps,
                                   const std::string& name,
                                   const std::string& args_json) {
    auto it = caps.find(name);
    if (it == caps.end() || !it->second) {
        log_warn("capability '" + name + "' is not available");
        return CapabilityResult::fail(name + " is not available");
    }

    CapabilityResult r;
    try {
        r = it->second(args_json);
    } catch (const std::exception& e) {
        r = CapabilityResult::fail(e.what());
    }

    if (r.ok && !json_mini::is_valid(r.value_json)) {
        r = CapabilityResult::fail("returned a value that is not JSON");
    }
    if (!r.ok) {
        if (r.error.empty()) r.error = "capability failed";
        log_error("Error in tool '" + name + "': " + r.error);
    }
    return r;
}

// --- Process-backed capabilities ---

CapabilityResult run_process_capability(const ProcessCapability& pc, const std::string& args_json) {
    ProcLimits lim;
    lim.timeout_ms = pc.timeout_ms;
    lim.stdout_max_bytes = pc.max_output_bytes;
    lim.rlimit_nofile = 256;
    lim.rlimit_as_mb = 2048;

    ProcResult pr;
    if (!proc_run_capture_stdin(pc.argv, pc.cwd, args_json, lim, &pr)) {
        return CapabilityResult::fail("failed to start: " + pr.error);
    }
    if (pr.timed_out) {
        return CapabilityResult::fail("timed out after " + std::to_string(pc.timeout_ms) + " ms");
    }
    if (pr.exit_code != 0) {
        std::string why = first_line_trimmed(pr.stderr_output, 500);
        if (why.empty()) why = "exited with code " + std::to_string(pr.exit_code);
        return CapabilityResult::fail(why);
    }
    if (pr.output_truncated) {
        return CapabilityResult::fail("output exceeded " + std::to_string(pc.max_output_bytes) + " bytes");
    }

    std::string out = pr.output;
    while (!out.empty() && std::isspace((unsigned char)out.back())) out.pop_back();
    if (!out.empty() && json_mini::is_valid(out)) return CapabilityResult::value(out);
    return CapabilityResult::value(json_quote(out));
}

void CapabilityRegistry::load_manifest(const std::string& manifest_path) {
    std::string j = slurp(manifest_path);

    json_mini::Doc d = json_mini::parse(j);
    if (!d || !json_object_is_type(d.root, json_type_object)) {
        throw std::runtime_error("capability manifest is not a JSON object: " + manifest_path);
    }
    json_object* arr = d.get("capabilities");
    if (!arr || !json_object_is_type(arr, json_type_array)) {
        throw std::runtime_error("capability manifest: capabilities is not a JSON array");
    }

    const size_t n = json_object_array_length(arr);
    for (size_t i = 0; i < n; i++) {
        json_object* o = json_object_array_get_idx(arr, i);
        if (!o || !json_object_is_type(o, json_type_object)) {
            throw std::runtime_error("capability manifest: entry " + std::to_string(i) + " is not an object");
        }
        ProcessCapability pc;
        std::string cmd;
        if (!json_get_string(o, "name", &pc.name) || !is_valid_capability_name(pc.name)) {
            throw std::runtime_error("capability manifest: entry " + std::to_string(i) + " has a bad name");
        }
        if (!json_get_string(o, "cmd", &cmd)) {
            throw std::runtime_error("capability manifest: " + pc.name + " has no cmd");
        }
        pc.argv = split_argv_quoted(cmd);
        if (pc.argv.empty()) {
            throw std::runtime_error("capability manifest: " + pc.name + " cmd does not parse");
        }
        int64_t t = 0;
        if (json_get_int(o, "timeout_ms", &t)) pc.timeout_ms = (int)std::clamp<int64_t>(t, 1, 600000);
        int64_t m = 0;
        if (json_get_int(o, "max_output_bytes", &m)) pc.max_output_bytes = (size_t)std::clamp<int64_t>(m, 1, 64LL * 1024 * 1024);
        (void)json_get_string(o, "cwd", &pc.cwd);

        if (!is_known_capability(pc.name)) {
            log_warn("capability manifest: '" + pc.name + "' is not in vocabulary v" +
                     std::to_string(kCapabilityVocabularyVersion) + " and will not be installed");
        }
        add(pc);
    }
}

void CapabilityRegistry::add(const ProcessCapability& pc, bool allow_override) {
    if (caps_.count(pc.name) && !allow_override) {
        throw std::runtime_error("duplicate capability: " + pc.name);
    }
    caps_[pc.name] = pc;
}

std::vector<std::string> CapabilityRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& kv : caps_) out.push_back(kv.first);
    return out;
}

CapabilitySet CapabilityRegistry::build() const {
    CapabilitySet set;
    for (const auto& kv : caps_) {
        ProcessCapability pc = kv.second;
        set[kv.first] = [pc](const std::string& args_json) {
            return run_process_capability(pc, args_json);
        };
    }
    return set;
}

} // namespace codebox
