#include "codebox/log.h"

#include <json-c/json.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <vector>

namespace codebox {

namespace {

std::atomic<int> g_level{(int)LogLevel::INFO};

const char* level_tag(LogLevel l) {
    switch (l) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

std::string iso_now_ms() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string_len(keys[i].c_str(), (int)keys[i].size());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

} // namespace

LogLevel log_level_from_string(const std::string& s) {
    std::string v = s;
    for (auto& c : v) c = (char)std::tolower((unsigned char)c);
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void set_log_level(LogLevel lvl) { g_level.store((int)lvl); }

void log_msg(LogLevel lvl, const std::string& msg) {
    if ((int)lvl < g_level.load()) return;
    // One write per line so concurrent capability threads do not interleave.
    std::string line = "[codebox][";
    line += level_tag(lvl);
    line += "] ";
    line += msg;
    line += "\n";
    std::cerr << line;
}

std::string gen_run_id() {
    uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
    uint64_t r = 0;
    try {
        std::random_device rd;
        r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
    } catch (const std::exception&) {
        r = 0x9e3779b97f4a7c15ULL;
    }
    std::mt19937_64 rng{t ^ r};
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << rng();
    return oss.str();
}

EventLog::EventLog(const std::string& path) : path_(path) {
    if (!path_.empty()) {
        out_.open(path_, std::ios::out | std::ios::app);
        if (!out_.is_open()) log_warn("event log: cannot open " + path_);
    }
}

void EventLog::event(const std::string& run_id, int attempt, const std::string& name,
                     const std::string& payload_json) {
    if (!out_.is_open()) return;

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "attempt", json_object_new_int(attempt));
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_object* pobj = json_tokener_parse(payload_json.c_str());
    json_object_object_add(rec, "payload",
        pobj ? pobj : json_object_new_string_len(payload_json.c_str(), (int)payload_json.size()));
    json_object_object_add(rec, "run_id", json_object_new_string(run_id.c_str()));
    json_object_object_add(rec, "ts", json_object_new_string(iso_now_ms().c_str()));

    std::ostringstream line;
    canonical_serialize(rec, line);
    json_object_put(rec);

    std::lock_guard<std::mutex> lk(mu_);
    out_ << line.str() << "\n";
    out_.flush();
}

} // namespace codebox
