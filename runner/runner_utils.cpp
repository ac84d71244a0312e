#include "runner_utils.h"

#include "codebox/log.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace codebox {

std::filesystem::path exe_dir(const char* argv0) {
    std::filesystem::path exe = argv0 ? std::filesystem::path(argv0) : std::filesystem::path();
    if (exe.empty()) return std::filesystem::current_path();
    std::error_code ec;
    if (!exe.is_absolute()) exe = std::filesystem::absolute(exe, ec);
    // A bare name found through PATH does not resolve here; fall back to cwd.
    if (!std::filesystem::exists(exe, ec)) return std::filesystem::current_path();
    std::filesystem::path canon = std::filesystem::canonical(exe, ec);
    return (ec ? exe : canon).parent_path();
}

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

int64_t getenv_i64(const char* k, int64_t defv) {
    const char* e = std::getenv(k);
    if (!e || !*e) return defv;
    try {
        return std::stoll(e);
    } catch (const std::exception&) {
        log_warn(std::string("ignoring unparseable ") + k + "=" + e);
        return defv;
    }
}

std::string getenv_str(const char* k, const std::string& defv) {
    const char* e = std::getenv(k);
    return (e && *e) ? std::string(e) : defv;
}

EngineConfig init_runtime(const char* argv0) {
    Profile p = detect_profile();
    apply_profile_defaults(p);
    set_log_level(log_level_from_string(getenv_str("CODEBOX_LOG_LEVEL", "info")));
    EngineConfig cfg = load_engine_config(exe_dir(argv0).string());
    log_debug(std::string("profile=") + profile_name(p) + " isolate=" + cfg.isolate_bin +
              " attempts=" + std::to_string(cfg.max_attempts) +
              " step_ms=" + std::to_string(cfg.step_timeout_ms) +
              " total_ms=" + std::to_string(cfg.total_timeout_ms));
    return cfg;
}

CapabilitySet load_capabilities(const std::string& manifest_path) {
    if (manifest_path.empty()) return {};
    CapabilityRegistry reg;
    reg.load_manifest(manifest_path);
    std::string names;
    for (const auto& n : reg.names()) names += (names.empty() ? "" : ",") + n;
    log_info("loaded " + std::to_string(reg.size()) + " capabilities from " + manifest_path +
             (names.empty() ? "" : ": " + names));
    return reg.build();
}

} // namespace codebox
