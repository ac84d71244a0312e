#include "codebox/config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace codebox {

namespace {

bool env_flag(const char* key, bool defv) {
    const char* v = std::getenv(key);
    if (!v) return defv;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

long long env_ll(const char* key, long long defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    try {
        return std::stoll(v);
    } catch (const std::exception&) {
        return defv;
    }
}

} // namespace

Profile detect_profile() {
    const char* env = std::getenv("CODEBOX_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("CODEBOX_SECCOMP_ENABLE",    "0",     NO_OVERWRITE);
            setenv("CODEBOX_STEP_TIMEOUT_MS",   "20000", NO_OVERWRITE);
            setenv("CODEBOX_TOTAL_TIMEOUT_MS",  "60000", NO_OVERWRITE);
            setenv("CODEBOX_LOG_LEVEL",         "debug", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("CODEBOX_SECCOMP_ENABLE",    "1",     NO_OVERWRITE);
            setenv("CODEBOX_STEP_TIMEOUT_MS",   "15000", NO_OVERWRITE);
            setenv("CODEBOX_TOTAL_TIMEOUT_MS",  "45000", NO_OVERWRITE);
            setenv("CODEBOX_MEMORY_LIMIT_MB",   "96",    NO_OVERWRITE);
            setenv("CODEBOX_LOG_LEVEL",         "warn",  NO_OVERWRITE);
            setenv("CODEBOX_EVENT_LOG",         "codebox_events.jsonl", NO_OVERWRITE);
            break;
    }
}

EngineConfig load_engine_config(const std::string& exe_dir) {
    EngineConfig c;

    c.max_attempts     = (int)std::clamp<long long>(env_ll("CODEBOX_MAX_ATTEMPTS", c.max_attempts), 1, 100);
    c.step_timeout_ms  = (int)std::clamp<long long>(env_ll("CODEBOX_STEP_TIMEOUT_MS", c.step_timeout_ms), 1, 3600000);
    c.total_timeout_ms = (int)std::clamp<long long>(env_ll("CODEBOX_TOTAL_TIMEOUT_MS", c.total_timeout_ms), 1, 3600000);
    c.memory_limit_mb  = (size_t)std::clamp<long long>(env_ll("CODEBOX_MEMORY_LIMIT_MB", (long long)c.memory_limit_mb), 8, 65536);
    c.max_output_chars = (size_t)std::clamp<long long>(env_ll("CODEBOX_MAX_OUTPUT_CHARS", (long long)c.max_output_chars), 1, 64LL * 1024 * 1024);

    c.enable_seccomp     = env_flag("CODEBOX_SECCOMP_ENABLE", c.enable_seccomp);
    c.classifier_enabled = env_flag("CODEBOX_CLASSIFIER_ENABLE", c.classifier_enabled);
    c.lazy_return        = env_flag("CODEBOX_LAZY_RETURN", c.lazy_return);

    if (const char* v = std::getenv("CODEBOX_ISOLATE_BIN")) {
        c.isolate_bin = v;
    } else if (!exe_dir.empty()) {
        c.isolate_bin = exe_dir + "/codebox_isolate";
    } else {
        c.isolate_bin = "codebox_isolate";
    }

    if (const char* v = std::getenv("CODEBOX_EVENT_LOG")) c.event_log_path = v;
    return c;
}

} // namespace codebox
