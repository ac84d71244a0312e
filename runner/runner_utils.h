#pragma once

#include "codebox/capability.h"
#include "codebox/config.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace codebox {

// Directory holding the running executable (argv0 resolved, best effort).
std::filesystem::path exe_dir(const char* argv0);

// Throws std::runtime_error when the file cannot be opened.
std::string slurp(const std::string& path);

int64_t getenv_i64(const char* k, int64_t defv);
std::string getenv_str(const char* k, const std::string& defv = "");

// Shared startup: profile defaults, engine config, diagnostic level.
EngineConfig init_runtime(const char* argv0);

// Capabilities from a manifest, or none for an empty path. Logs the names
// that were loaded. Throws std::runtime_error on a bad manifest.
CapabilitySet load_capabilities(const std::string& manifest_path);

} // namespace codebox
