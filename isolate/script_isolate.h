#pragma once
#include "host_channel.h"

extern "C" {
#include "quickjs.h"
}

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codebox {

// Largest text the isolate puts into one protocol message (console line,
// final answer, call arguments, return value).
constexpr size_t kMaxIsolatePayload = 2u * 1024u * 1024u;

// One QuickJS runtime + context with the capability bridge installed.
//
// Globals seen by the script: the engine's standard built-ins, `console`
// (log/info/debug -> stdout, warn/error -> stderr), `finalAnswer`, `global`,
// and one async function per installed capability name. Nothing else from
// the host is reachable.
//
// The heap ceiling is enforced by the runtime's allocator. A refused
// allocation latches a flag, and the interrupt handler then stops the script
// for good, so catching the out-of-memory error does not let it carry on. The
// same handler stops the script once its deadline passes.
//
// Every capability call creates a promise whose resolving functions are kept
// until the host replies. The destructor frees those, then the context, then
// the runtime.
class ScriptIsolate {
public:
    struct Outcome {
        bool ok{false};
        std::optional<std::string> value_json;
        std::string error;
        std::string kind;
    };

    // timeout_ms <= 0: no in-engine deadline
    ScriptIsolate(HostChannel& chan, size_t memory_limit_mb, int timeout_ms);
    ~ScriptIsolate();
    ScriptIsolate(const ScriptIsolate&) = delete;
    ScriptIsolate& operator=(const ScriptIsolate&) = delete;

    bool install(const std::vector<std::string>& capabilities, std::string* error);

    // Runs `code` as the body of an async function and pumps jobs and host
    // replies until its promise settles.
    Outcome run(const std::string& code);

private:
    struct Resolvers {
        JSValue resolve;
        JSValue reject;
    };

    HostChannel& chan_;
    bool heap_limit_hit_{false};
    bool interrupted_{false};
    bool has_deadline_{false};
    std::chrono::steady_clock::time_point deadline_;
    JSRuntime* rt_{nullptr};
    JSContext* ctx_{nullptr};
    std::map<int64_t, Resolvers> outstanding_;
    int64_t next_id_{1};

    static int interrupt_handler(JSRuntime* rt, void* opaque);
    static JSValue js_console(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv, int magic);
    static JSValue js_final_answer(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv);
    static JSValue js_host_call(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv,
                                int magic, JSValue* func_data);

    std::string to_std_string(JSValueConst v);
    std::optional<std::string> stringify(JSValueConst v);
    void settle(JSValue fn, JSValue arg);
    void deliver_reply(const CallReply& r);
    Outcome outcome_from_exception(JSValue exc);
    // Memory or deadline outcome once either limit was hit, else nothing.
    std::optional<Outcome> limit_outcome() const;
    void release_outstanding();
};

} // namespace codebox
