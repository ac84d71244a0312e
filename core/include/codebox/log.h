#pragma once
#include <fstream>
#include <mutex>
#include <string>

namespace codebox {

// --- Diagnostics (stderr) ---

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

LogLevel log_level_from_string(const std::string& s);  // unknown -> INFO
void set_log_level(LogLevel lvl);

// Writes "[codebox][LEVEL] msg" to stderr when lvl >= the process level.
void log_msg(LogLevel lvl, const std::string& msg);
inline void log_debug(const std::string& m) { log_msg(LogLevel::DEBUG, m); }
inline void log_info(const std::string& m)  { log_msg(LogLevel::INFO, m); }
inline void log_warn(const std::string& m)  { log_msg(LogLevel::WARN, m); }
inline void log_error(const std::string& m) { log_msg(LogLevel::ERROR, m); }

// --- Event log (JSONL) ---

std::string gen_run_id();

// One JSON object per line:
//   {"attempt":N,"event":"...","payload":{...},"run_id":"...","ts":"..."}
// Keys are sorted so lines are diffable. A default-constructed or
// path-less EventLog accepts events and drops them.
class EventLog {
public:
    EventLog() = default;
    explicit EventLog(const std::string& path);

    bool enabled() const { return out_.is_open(); }
    const std::string& path() const { return path_; }

    void event(const std::string& run_id, int attempt, const std::string& name,
               const std::string& payload_json);

private:
    std::string path_;
    std::ofstream out_;
    std::mutex mu_;
};

} // namespace codebox
