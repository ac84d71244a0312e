#pragma once
#include <cstddef>
#include <string>

namespace codebox {

enum class Profile { DEV, PROD };

// Detect profile from CODEBOX_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no seccomp, generous timeouts, classifier on)
// PROD: strict (seccomp on, tighter memory, event log on)
void apply_profile_defaults(Profile p);

// Engine knobs. The core receives this struct; only load_engine_config()
// looks at the environment.
struct EngineConfig {
    int max_attempts{2};
    int step_timeout_ms{20000};
    int total_timeout_ms{60000};
    size_t memory_limit_mb{128};
    size_t max_output_chars{10000};

    std::string isolate_bin;     // path to codebox_isolate
    bool enable_seccomp{false};
    bool classifier_enabled{true};
    bool lazy_return{true};
    std::string event_log_path;  // empty: event log disabled
};

// Read CODEBOX_* variables on top of EngineConfig defaults. Unparseable
// values keep the default; out-of-range values are clamped.
// `exe_dir` is used to locate codebox_isolate when CODEBOX_ISOLATE_BIN is unset.
EngineConfig load_engine_config(const std::string& exe_dir = "");

} // namespace codebox
