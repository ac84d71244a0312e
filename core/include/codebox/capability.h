#pragma once
#include "proc.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace codebox {

// Result of one host capability call. value_json is compact JSON text.
struct CapabilityResult {
    bool ok{false};
    std::string value_json{"null"};
    std::string error;

    static CapabilityResult value(std::string json) {
        CapabilityResult r;
        r.ok = true;
        r.value_json = std::move(json);
        return r;
    }
    static CapabilityResult fail(std::string msg) {
        CapabilityResult r;
        r.error = std::move(msg);
        return r;
    }
};

// args_json is always a JSON array holding the script's call arguments.
// Implementations may block; they run on a worker thread and must tolerate
// being abandoned when the run times out.
using CapabilityFn = std::function<CapabilityResult(const std::string& args_json)>;

// name -> host function. Read-only once handed to a sandbox run.
using CapabilitySet = std::map<std::string, CapabilityFn>;

constexpr int kCapabilityVocabularyVersion = 1;

// Closed vocabulary of names a script may see, finalAnswer included.
const std::vector<std::string>& capability_vocabulary();

bool is_known_capability(const std::string& name);

// finalAnswer and the console pair are provided by the isolate itself.
bool is_reserved_name(const std::string& name);

// [A-Za-z_$][A-Za-z0-9_$]*
bool is_valid_capability_name(const std::string& name);

// Names from `caps` that will be installed as globals, sorted. Reserved,
// unknown or malformed names are skipped with a warning.
std::vector<std::string> bridgeable_names(const CapabilitySet& caps);

// Call `name` with `args_json`. Never throws: a missing capability, an
// exception, or a non-JSON value all come back as ok=false, and every
// failure is logged with the capability name.
CapabilityResult invoke_capability(const CapabilitySet& caps,
                                   const std::string& name,
                                   const std::string& args_json);

// --- Process-backed capabilities ---

struct ProcessCapability {
    std::string name;
    std::vector<std::string> argv;
    std::string cwd;
    int timeout_ms{10000};
    size_t max_output_bytes{1024 * 1024};
};

// Each call runs argv with the argument array on stdin. stdout is the result:
// JSON text is passed through, anything else becomes a JSON string. A
// non-zero exit, a timeout or oversized output is a capability error.
CapabilityResult run_process_capability(const ProcessCapability& pc, const std::string& args_json);

class CapabilityRegistry {
public:
    // {"capabilities":[{"name":"webSearch","cmd":"...","timeout_ms":10000,"cwd":"..."}]}
    // Throws std::runtime_error on unreadable or malformed manifests.
    void load_manifest(const std::string& manifest_path);

    // Duplicate names throw unless allow_override.
    void add(const ProcessCapability& pc, bool allow_override = false);

    std::vector<std::string> names() const;
    size_t size() const { return caps_.size(); }

    // Fresh set bound to copies of the specs.
    CapabilitySet build() const;

private:
    std::map<std::string, ProcessCapability> caps_;
};

} // namespace codebox
