#pragma once

// NDJSON protocol between the host and the codebox_isolate process.
//
// host -> isolate  {"code":"...","capabilities":["webSearch",...],
//                   "memory_limit_mb":128,"timeout_ms":20000,"seccomp":false}
//                  {"id":N,"ok":true,"value":<json>}     reply to a call
//                  {"id":N,"ok":false,"error":"..."}
// isolate -> host  {"t":"ready"}                         bridge installed
//                  {"t":"out","stream":"stdout","text":"..."}
//                  {"t":"final","text":"..."}
//                  {"t":"call","id":N,"name":"...","args":[...]}
//                  {"t":"done","ok":true[,"value":<json>]}
//                  {"t":"done","ok":false,"error":"...","kind":"..."}

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codebox {

constexpr size_t kMaxProtocolLine = 16u * 1024u * 1024u;

// done.kind values
constexpr const char* kFailException = "exception";
constexpr const char* kFailMemory = "memory";
constexpr const char* kFailTimeout = "timeout";
constexpr const char* kFailProtocol = "protocol";
constexpr const char* kFailInternal = "internal";

struct IsolateRequest {
    std::string code;
    std::vector<std::string> capabilities;
    size_t memory_limit_mb{128};
    int timeout_ms{0};  // in-engine deadline from isolate start; 0: none
    bool seccomp{false};
};

std::string encode_request(const IsolateRequest& req);
bool decode_request(const std::string& line, IsolateRequest* out, std::string* error);

struct IsolateMessage {
    enum class Type { READY, OUT, FINAL, CALL, DONE, INVALID } type{Type::INVALID};

    std::string stream;   // OUT
    std::string text;     // OUT, FINAL

    int64_t id{0};        // CALL
    std::string name;     // CALL
    std::string args_json{"[]"};

    bool ok{false};                        // DONE
    std::optional<std::string> value_json; // DONE ok
    std::string error;                     // DONE !ok
    std::string kind;                      // DONE !ok
};

IsolateMessage decode_isolate_message(const std::string& line);

std::string encode_ready();
std::string encode_out(const std::string& stream, const std::string& text);
std::string encode_final(const std::string& text);
std::string encode_call(int64_t id, const std::string& name, const std::string& args_json);
std::string encode_done_ok(const std::optional<std::string>& value_json);
std::string encode_done_error(const std::string& error, const std::string& kind);

struct CallReply {
    int64_t id{0};
    bool ok{false};
    std::string value_json{"null"};
    std::string error;
};

std::string encode_reply(const CallReply& r);
bool decode_reply(const std::string& line, CallReply* out);

// Splits a byte stream into lines. Bytes past kMaxProtocolLine without a
// newline put the buffer into the overflow state, which is sticky.
class LineBuffer {
public:
    explicit LineBuffer(size_t max_line = kMaxProtocolLine) : max_line_(max_line) {}

    void append(const char* data, size_t n);
    // Pops the next complete line (without '\n'). False when none is buffered.
    bool next_line(std::string* line);
    bool overflow() const { return overflow_; }

private:
    size_t max_line_;
    std::string buf_;
    size_t scan_from_{0};
    bool overflow_{false};
};

} // namespace codebox
