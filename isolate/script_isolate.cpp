#include "script_isolate.h"

#include "codebox/log.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>

#include <malloc.h>

namespace codebox {

namespace {

constexpr int kConsoleStdout = 0;
constexpr int kConsoleStderr = 1;

// Per-allocation bookkeeping overhead, as the engine's default allocator counts it.
constexpr size_t kMallocOverhead = 8;

JSValue new_error(JSContext* ctx, const std::string& msg) {
    JSValue err = JS_NewError(ctx);
    if (JS_IsException(err)) return err;
    JS_SetPropertyStr(ctx, err, "message", JS_NewStringLen(ctx, msg.data(), msg.size()));
    return err;
}

// Allocator that honours JS_SetMemoryLimit like the engine's default one and
// also reports every refusal to the isolate through *(bool*)s->opaque.

void* guarded_malloc(JSMallocState* s, size_t size) {
    if (s->malloc_size + size > s->malloc_limit) {
        *static_cast<bool*>(s->opaque) = true;
        return nullptr;
    }
    void* p = std::malloc(size);
    if (!p) {
        *static_cast<bool*>(s->opaque) = true;
        return nullptr;
    }
    s->malloc_count++;
    s->malloc_size += malloc_usable_size(p) + kMallocOverhead;
    return p;
}

void guarded_free(JSMallocState* s, void* ptr) {
    if (!ptr) return;
    s->malloc_count--;
    s->malloc_size -= malloc_usable_size(ptr) + kMallocOverhead;
    std::free(ptr);
}

void* guarded_realloc(JSMallocState* s, void* ptr, size_t size) {
    if (!ptr) return size ? guarded_malloc(s, size) : nullptr;
    size_t old_size = malloc_usable_size(ptr);
    if (size == 0) {
        guarded_free(s, ptr);
        return nullptr;
    }
    if (s->malloc_size + size - old_size > s->malloc_limit) {
        *static_cast<bool*>(s->opaque) = true;
        return nullptr;
    }
    void* p = std::realloc(ptr, size);
    if (!p) {
        *static_cast<bool*>(s->opaque) = true;
        return nullptr;
    }
    s->malloc_size += malloc_usable_size(p);
    s->malloc_size -= old_size;
    return p;
}

size_t guarded_usable_size(const void* ptr) {
    return malloc_usable_size(const_cast<void*>(ptr));
}

const JSMallocFunctions kGuardedMalloc = {
    guarded_malloc,
    guarded_free,
    guarded_realloc,
    guarded_usable_size,
};

} // namespace

ScriptIsolate::ScriptIsolate(HostChannel& chan, size_t memory_limit_mb, int timeout_ms) : chan_(chan) {
    if (timeout_ms > 0) {
        has_deadline_ = true;
        deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    }
    rt_ = JS_NewRuntime2(&kGuardedMalloc, &heap_limit_hit_);
    if (!rt_) return;
    JS_SetMemoryLimit(rt_, memory_limit_mb * 1024 * 1024);
    JS_SetMaxStackSize(rt_, 1024 * 1024);
    JS_SetInterruptHandler(rt_, interrupt_handler, this);
    ctx_ = JS_NewContext(rt_);
    if (ctx_) JS_SetContextOpaque(ctx_, this);
}

int ScriptIsolate::interrupt_handler(JSRuntime*, void* opaque) {
    auto* self = static_cast<ScriptIsolate*>(opaque);
    if (self->heap_limit_hit_) return 1;
    if (self->has_deadline_ && std::chrono::steady_clock::now() >= self->deadline_) {
        self->interrupted_ = true;
        return 1;
    }
    return 0;
}

std::optional<ScriptIsolate::Outcome> ScriptIsolate::limit_outcome() const {
    if (!heap_limit_hit_ && !interrupted_) return std::nullopt;
    Outcome o;
    if (heap_limit_hit_) {
        o.kind = kFailMemory;
        o.error = "out of memory";
    } else {
        o.kind = kFailTimeout;
        o.error = "interrupted";
    }
    return o;
}

ScriptIsolate::~ScriptIsolate() {
    release_outstanding();
    if (ctx_) JS_FreeContext(ctx_);
    if (rt_) JS_FreeRuntime(rt_);
}

void ScriptIsolate::release_outstanding() {
    if (!ctx_) return;
    for (auto& kv : outstanding_) {
        JS_FreeValue(ctx_, kv.second.resolve);
        JS_FreeValue(ctx_, kv.second.reject);
    }
    outstanding_.clear();
}

bool ScriptIsolate::install(const std::vector<std::string>& capabilities, std::string* error) {
    if (!rt_ || !ctx_) {
        if (error) *error = "cannot allocate script runtime";
        return false;
    }

    JSValue global = JS_GetGlobalObject(ctx_);
    bool ok = true;

    JSValue console = JS_NewObject(ctx_);
    JS_SetPropertyStr(ctx_, console, "log",
        JS_NewCFunctionMagic(ctx_, js_console, "log", 1, JS_CFUNC_generic_magic, kConsoleStdout));
    JS_SetPropertyStr(ctx_, console, "info",
        JS_NewCFunctionMagic(ctx_, js_console, "info", 1, JS_CFUNC_generic_magic, kConsoleStdout));
    JS_SetPropertyStr(ctx_, console, "debug",
        JS_NewCFunctionMagic(ctx_, js_console, "debug", 1, JS_CFUNC_generic_magic, kConsoleStdout));
    JS_SetPropertyStr(ctx_, console, "warn",
        JS_NewCFunctionMagic(ctx_, js_console, "warn", 1, JS_CFUNC_generic_magic, kConsoleStderr));
    JS_SetPropertyStr(ctx_, console, "error",
        JS_NewCFunctionMagic(ctx_, js_console, "error", 1, JS_CFUNC_generic_magic, kConsoleStderr));
    if (JS_SetPropertyStr(ctx_, global, "console", console) < 0) ok = false;

    if (JS_SetPropertyStr(ctx_, global, "finalAnswer",
            JS_NewCFunction(ctx_, js_final_answer, "finalAnswer", 1)) < 0) ok = false;
    if (JS_SetPropertyStr(ctx_, global, "global", JS_DupValue(ctx_, global)) < 0) ok = false;

    for (const auto& name : capabilities) {
        JSValue data = JS_NewStringLen(ctx_, name.data(), name.size());
        JSValue fn = JS_NewCFunctionData(ctx_, js_host_call, 0, 0, 1, &data);
        JS_FreeValue(ctx_, data);
        if (JS_SetPropertyStr(ctx_, global, name.c_str(), fn) < 0) {
            ok = false;
            break;
        }
    }

    JS_FreeValue(ctx_, global);
    if (!ok) {
        JS_FreeValue(ctx_, JS_GetException(ctx_));
        if (error) *error = "failed to install capability bridge";
    }
    return ok;
}

std::string ScriptIsolate::to_std_string(JSValueConst v) {
    size_t len = 0;
    const char* s = JS_ToCStringLen(ctx_, &len, v);
    if (!s) {
        JS_FreeValue(ctx_, JS_GetException(ctx_));
        return "[unprintable]";
    }
    std::string out(s, len);
    JS_FreeCString(ctx_, s);
    return out;
}

std::optional<std::string> ScriptIsolate::stringify(JSValueConst v) {
    if (JS_IsUndefined(v)) return std::nullopt;
    JSValue j = JS_JSONStringify(ctx_, v, JS_UNDEFINED, JS_UNDEFINED);
    if (JS_IsException(j)) {
        // BigInt, cycles, throwing toJSON: not representable, drop it
        JS_FreeValue(ctx_, JS_GetException(ctx_));
        return std::nullopt;
    }
    if (!JS_IsString(j)) {
        JS_FreeValue(ctx_, j);
        return std::nullopt;
    }
    std::string out = to_std_string(j);
    JS_FreeValue(ctx_, j);
    if (out.size() > kMaxIsolatePayload) return std::nullopt;
    return out;
}

void ScriptIsolate::settle(JSValue fn, JSValue arg) {
    JSValue r = JS_Call(ctx_, fn, JS_UNDEFINED, 1, &arg);
    if (JS_IsException(r)) JS_FreeValue(ctx_, JS_GetException(ctx_));
    JS_FreeValue(ctx_, r);
    JS_FreeValue(ctx_, arg);
}

JSValue ScriptIsolate::js_console(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv, int magic) {
    auto* self = static_cast<ScriptIsolate*>(JS_GetContextOpaque(ctx));
    std::string line;
    for (int i = 0; i < argc; i++) {
        if (i) line += ' ';
        // strings verbatim, other values as JSON, String() when JSON has no form
        std::optional<std::string> as_json;
        if (!JS_IsString(argv[i])) as_json = self->stringify(argv[i]);
        if (as_json) {
            line += *as_json;
        } else {
            size_t len = 0;
            const char* s = JS_ToCStringLen(ctx, &len, argv[i]);
            if (!s) return JS_EXCEPTION;
            line.append(s, len);
            JS_FreeCString(ctx, s);
        }
        if (line.size() > kMaxIsolatePayload) {
            line.resize(kMaxIsolatePayload);
            break;
        }
    }
    const char* stream = magic == kConsoleStderr ? "stderr" : "stdout";
    if (!self->chan_.write_line(encode_out(stream, line))) {
        return JS_ThrowInternalError(ctx, "host channel closed");
    }
    return JS_UNDEFINED;
}

JSValue ScriptIsolate::js_final_answer(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* self = static_cast<ScriptIsolate*>(JS_GetContextOpaque(ctx));
    JSValueConst v = argc > 0 ? argv[0] : JS_UNDEFINED;

    // String(x) for anything that is not already a string
    size_t len = 0;
    const char* s = JS_ToCStringLen(ctx, &len, v);
    if (!s) return JS_EXCEPTION;
    std::string text(s, std::min(len, kMaxIsolatePayload));
    JS_FreeCString(ctx, s);

    if (!self->chan_.write_line(encode_final(text))) {
        return JS_ThrowInternalError(ctx, "host channel closed");
    }
    return JS_UNDEFINED;
}

JSValue ScriptIsolate::js_host_call(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv,
                                    int, JSValue* func_data) {
    auto* self = static_cast<ScriptIsolate*>(JS_GetContextOpaque(ctx));

    JSValue resolving[2];
    JSValue promise = JS_NewPromiseCapability(ctx, resolving);
    if (JS_IsException(promise)) return promise;

    std::string name = self->to_std_string(func_data[0]);

    // Arguments are copied out as JSON; nothing crosses by reference.
    JSValue arr = JS_NewArray(ctx);
    for (int i = 0; i < argc; i++) {
        JS_SetPropertyUint32(ctx, arr, (uint32_t)i, JS_DupValue(ctx, argv[i]));
    }
    JSValue json = JS_JSONStringify(ctx, arr, JS_UNDEFINED, JS_UNDEFINED);
    JS_FreeValue(ctx, arr);

    std::string args;
    if (JS_IsException(json)) {
        self->settle(resolving[1], JS_GetException(ctx));
    } else {
        args = JS_IsString(json) ? self->to_std_string(json) : "[]";
        JS_FreeValue(ctx, json);
        if (args.size() > kMaxIsolatePayload) {
            self->settle(resolving[1], new_error(ctx, name + ": arguments too large"));
        } else {
            int64_t id = self->next_id_++;
            if (self->chan_.write_line(encode_call(id, name, args))) {
                self->outstanding_[id] = Resolvers{resolving[0], resolving[1]};
                return promise;
            }
            self->settle(resolving[1], new_error(ctx, "host channel closed"));
        }
    }

    JS_FreeValue(ctx, resolving[0]);
    JS_FreeValue(ctx, resolving[1]);
    return promise;
}

void ScriptIsolate::deliver_reply(const CallReply& r) {
    auto it = outstanding_.find(r.id);
    if (it == outstanding_.end()) {
        log_warn("isolate: reply for unknown call id " + std::to_string(r.id));
        return;
    }
    Resolvers res = it->second;
    outstanding_.erase(it);

    if (r.ok) {
        JSValue v = JS_ParseJSON(ctx_, r.value_json.c_str(), r.value_json.size(), "<capability>");
        if (JS_IsException(v)) settle(res.reject, JS_GetException(ctx_));
        else settle(res.resolve, v);
    } else {
        settle(res.reject, new_error(ctx_, r.error));
    }
    JS_FreeValue(ctx_, res.resolve);
    JS_FreeValue(ctx_, res.reject);
}

ScriptIsolate::Outcome ScriptIsolate::outcome_from_exception(JSValue exc) {
    Outcome o;
    o.kind = kFailException;

    // An exception that could not even be allocated arrives as null.
    if (JS_IsNull(exc) || JS_IsUninitialized(exc)) {
        o.kind = kFailMemory;
        o.error = "out of memory";
        JS_FreeValue(ctx_, exc);
        return o;
    }

    if (JS_IsError(ctx_, exc)) {
        JSValue msg = JS_GetPropertyStr(ctx_, exc, "message");
        JSValue nm = JS_GetPropertyStr(ctx_, exc, "name");
        std::string message = JS_IsUndefined(msg) ? "" : to_std_string(msg);
        std::string name = JS_IsUndefined(nm) ? "Error" : to_std_string(nm);
        JS_FreeValue(ctx_, msg);
        JS_FreeValue(ctx_, nm);
        if (name == "InternalError" && message == "out of memory") o.kind = kFailMemory;
        o.error = message.empty() ? name : message;
    } else {
        o.error = to_std_string(exc);
    }
    JS_FreeValue(ctx_, exc);
    if (o.error.size() > kMaxIsolatePayload) o.error.resize(kMaxIsolatePayload);
    return o;
}

ScriptIsolate::Outcome ScriptIsolate::run(const std::string& code) {
    Outcome out;
    if (!ctx_) {
        out.kind = kFailInternal;
        out.error = "script runtime not available";
        return out;
    }

    // Newlines keep a trailing line comment in `code` from eating the wrapper.
    const std::string wrapped = "(async () => {\n" + code + "\n})()";
    JSValue p = JS_Eval(ctx_, wrapped.c_str(), wrapped.size(), "<script>", JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(p)) {
        out = outcome_from_exception(JS_GetException(ctx_));
        if (auto lim = limit_outcome()) out = *lim;
        return out;
    }

    while (true) {
        JSContext* job_ctx = nullptr;
        int jr;
        while ((jr = JS_ExecutePendingJob(rt_, &job_ctx)) > 0) {}
        if (jr < 0) {
            out = outcome_from_exception(JS_GetException(job_ctx ? job_ctx : ctx_));
            break;
        }
        if (limit_outcome()) break;

        int st = JS_PromiseState(ctx_, p);
        if (st < 0) {
            // Not a promise: the snippet closed the wrapper early. Use the value as is.
            out.ok = true;
            out.value_json = stringify(p);
            break;
        }
        if (st == JS_PROMISE_FULFILLED) {
            JSValue v = JS_PromiseResult(ctx_, p);
            out.ok = true;
            out.value_json = stringify(v);
            JS_FreeValue(ctx_, v);
            break;
        }
        if (st == JS_PROMISE_REJECTED) {
            out = outcome_from_exception(JS_PromiseResult(ctx_, p));
            break;
        }

        if (outstanding_.empty()) {
            out.kind = kFailException;
            out.error = "Script is awaiting a promise that can never settle";
            break;
        }

        std::string line;
        if (!chan_.read_line(&line)) {
            out.kind = kFailProtocol;
            out.error = "host channel closed";
            break;
        }
        CallReply r;
        if (!decode_reply(line, &r)) {
            out.kind = kFailProtocol;
            out.error = "malformed reply from host";
            break;
        }
        deliver_reply(r);
    }

    JS_FreeValue(ctx_, p);
    // A limit hit wins over whatever the script did afterwards.
    if (auto lim = limit_outcome()) out = *lim;
    return out;
}

} // namespace codebox
