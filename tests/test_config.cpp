#include "test_common.h"
#include "codebox/config.h"
#include "codebox/log.h"
#include "codebox/types.h"

#include <cstdlib>
#include <thread>

static const char* kVars[] = {
    "CODEBOX_PROFILE", "CODEBOX_MAX_ATTEMPTS", "CODEBOX_STEP_TIMEOUT_MS", "CODEBOX_TOTAL_TIMEOUT_MS",
    "CODEBOX_MEMORY_LIMIT_MB", "CODEBOX_MAX_OUTPUT_CHARS", "CODEBOX_ISOLATE_BIN", "CODEBOX_SECCOMP_ENABLE",
    "CODEBOX_CLASSIFIER_ENABLE", "CODEBOX_LAZY_RETURN", "CODEBOX_EVENT_LOG", "CODEBOX_LOG_LEVEL",
};

static void clear_env() {
    for (const char* k : kVars) unsetenv(k);
}

int main() {
    clear_env();

    // Test 1: Default profile is DEV
    auto p = codebox::detect_profile();
    expect_true(p == codebox::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("CODEBOX_PROFILE", "prod", 1);
    expect_true(codebox::detect_profile() == codebox::Profile::PROD, "should detect PROD");
    setenv("CODEBOX_PROFILE", "PRODUCTION", 1);
    expect_true(codebox::detect_profile() == codebox::Profile::PROD, "should detect PRODUCTION");
    setenv("CODEBOX_PROFILE", "staging", 1);
    expect_true(codebox::detect_profile() == codebox::Profile::DEV, "unknown profile falls back to DEV");

    // Test 3: Apply defaults (won't override existing)
    setenv("CODEBOX_STEP_TIMEOUT_MS", "42", 1);
    codebox::apply_profile_defaults(codebox::Profile::PROD);
    std::string val = std::getenv("CODEBOX_STEP_TIMEOUT_MS") ? std::getenv("CODEBOX_STEP_TIMEOUT_MS") : "";
    expect_true(val == "42", "should NOT override pre-existing env var");

    // Test 4: Apply sets missing vars
    val = std::getenv("CODEBOX_SECCOMP_ENABLE") ? std::getenv("CODEBOX_SECCOMP_ENABLE") : "";
    expect_true(val == "1", "PROD should set SECCOMP_ENABLE=1");

    // Test 5: PROD profile flows into the engine config
    {
        auto c = codebox::load_engine_config("/opt/codebox/bin");
        expect_eq_ll(c.step_timeout_ms, 42, "explicit step timeout kept");
        expect_eq_ll(c.total_timeout_ms, 45000, "prod total timeout");
        expect_eq_ll((long long)c.memory_limit_mb, 96, "prod memory");
        expect_true(c.enable_seccomp, "prod enables seccomp");
        expect_true(c.event_log_path == "codebox_events.jsonl", "prod event log");
        expect_true(c.isolate_bin == "/opt/codebox/bin/codebox_isolate", "isolate beside exe: " + c.isolate_bin);
    }
    clear_env();

    // Test 6: Built-in defaults without any profile
    {
        auto c = codebox::load_engine_config();
        expect_eq_ll(c.max_attempts, 2, "default attempts");
        expect_eq_ll(c.step_timeout_ms, 20000, "default step timeout");
        expect_eq_ll(c.total_timeout_ms, 60000, "default total timeout");
        expect_eq_ll((long long)c.memory_limit_mb, 128, "default memory");
        expect_eq_ll((long long)c.max_output_chars, 10000, "default output cap");
        expect_true(!c.enable_seccomp, "seccomp off by default");
        expect_true(c.classifier_enabled && c.lazy_return, "classifier and lazy return on");
        expect_true(c.event_log_path.empty(), "event log off");
        expect_true(c.isolate_bin == "codebox_isolate", "bare isolate name");
    }

    // Test 7: Clamping and unparseable values
    {
        setenv("CODEBOX_MAX_ATTEMPTS", "0", 1);
        setenv("CODEBOX_STEP_TIMEOUT_MS", "-5", 1);
        setenv("CODEBOX_MEMORY_LIMIT_MB", "1", 1);
        setenv("CODEBOX_MAX_OUTPUT_CHARS", "abc", 1);
        setenv("CODEBOX_LAZY_RETURN", "off", 1);
        setenv("CODEBOX_CLASSIFIER_ENABLE", "maybe", 1);
        setenv("CODEBOX_ISOLATE_BIN", "/tmp/iso", 1);
        auto c = codebox::load_engine_config("/ignored");
        expect_eq_ll(c.max_attempts, 1, "attempts clamped to 1");
        expect_eq_ll(c.step_timeout_ms, 1, "timeout clamped to 1");
        expect_eq_ll((long long)c.memory_limit_mb, 8, "memory clamped to 8");
        expect_eq_ll((long long)c.max_output_chars, 10000, "unparseable keeps default");
        expect_true(!c.lazy_return, "off disables lazy return");
        expect_true(c.classifier_enabled, "unrecognised flag keeps default");
        expect_true(c.isolate_bin == "/tmp/iso", "explicit isolate bin");
    }
    clear_env();

    // Test 8: Profile name
    expect_true(std::string(codebox::profile_name(codebox::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(codebox::profile_name(codebox::Profile::PROD)) == "prod", "prod name");

    // Test 9: Log level parsing
    expect_true(codebox::log_level_from_string("WARN") == codebox::LogLevel::WARN, "WARN");
    expect_true(codebox::log_level_from_string("debug") == codebox::LogLevel::DEBUG, "debug");
    expect_true(codebox::log_level_from_string("nonsense") == codebox::LogLevel::INFO, "unknown -> INFO");

    // Test 10: Execution budget never hands out more than what is left
    {
        auto b = codebox::ExecutionBudget::start(3, 20000, 1000);
        expect_eq_ll(b.attempts_remaining, 3, "attempts");
        int t = b.next_timeout_ms();
        expect_true(t > 0 && t <= 1000, "step capped by total: " + std::to_string(t));
        auto s = codebox::ExecutionBudget::start(1, 50, 60000);
        expect_eq_ll(s.next_timeout_ms(), 50, "step timeout when total is generous");
        auto z = codebox::ExecutionBudget::start(1, 50, 1);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        expect_true(z.expired() && z.next_timeout_ms() == 0, "spent budget");
    }

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
