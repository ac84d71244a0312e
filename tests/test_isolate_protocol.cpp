#include "test_common.h"
#include "codebox/isolate_protocol.h"
#include "codebox/json_mini.h"

#include <string>

using namespace codebox;

int main() {
    // Test 1: request survives the wire
    {
        IsolateRequest req;
        req.code = "const a = \"x\\n\";\nfinalAnswer(a)";
        req.capabilities = {"fetchText", "webSearch"};
        req.memory_limit_mb = 64;
        req.timeout_ms = 1500;
        req.seccomp = true;
        std::string line = encode_request(req);
        expect_true(line.find('\n') == std::string::npos, "request is one line");

        IsolateRequest back;
        std::string err;
        expect_true(decode_request(line, &back, &err), "decode: " + err);
        expect_true(back.code == req.code, "code");
        expect_true(back.capabilities == req.capabilities, "capabilities");
        expect_eq_ll((long long)back.memory_limit_mb, 64, "memory");
        expect_true(back.seccomp, "seccomp");
        expect_eq_ll(back.timeout_ms, 1500, "timeout");

        expect_true(decode_request("{\"code\":\"1\",\"timeout_ms\":-5}", &back, &err), "minimal request");
        expect_eq_ll(back.timeout_ms, 0, "negative timeout means none");

        expect_true(!decode_request("{\"capabilities\":[]}", &back, &err), "code is required");
        expect_true(!decode_request("[1]", &back, &err), "object required");
    }

    // Test 2: isolate messages
    {
        auto m = decode_isolate_message(encode_ready());
        expect_true(m.type == IsolateMessage::Type::READY, "ready");

        m = decode_isolate_message(encode_out("stderr", "warn: x"));
        expect_true(m.type == IsolateMessage::Type::OUT && m.stream == "stderr" && m.text == "warn: x", "out");
        m = decode_isolate_message("{\"t\":\"out\",\"stream\":\"stdlog\",\"text\":\"x\"}");
        expect_true(m.type == IsolateMessage::Type::INVALID, "unknown stream rejected");

        m = decode_isolate_message(encode_final("42"));
        expect_true(m.type == IsolateMessage::Type::FINAL && m.text == "42", "final");

        m = decode_isolate_message(encode_call(7, "webSearch", "[\"cats\",{\"n\":3}]"));
        expect_true(m.type == IsolateMessage::Type::CALL && m.id == 7 && m.name == "webSearch", "call");
        expect_true(m.args_json == "[\"cats\",{\"n\":3}]", "call args: " + m.args_json);
        m = decode_isolate_message(encode_call(8, "webSearch", "not json"));
        expect_true(m.type == IsolateMessage::Type::CALL && m.args_json == "[]", "bad args become []");
        m = decode_isolate_message("{\"t\":\"call\",\"id\":1,\"name\":\"x\",\"args\":{}}");
        expect_true(m.type == IsolateMessage::Type::INVALID, "args must be an array");

        m = decode_isolate_message(encode_done_ok(std::string("{\"a\":[1,2]}")));
        expect_true(m.type == IsolateMessage::Type::DONE && m.ok && m.value_json && *m.value_json == "{\"a\":[1,2]}", "done ok value");
        m = decode_isolate_message(encode_done_ok(std::nullopt));
        expect_true(m.type == IsolateMessage::Type::DONE && m.ok && !m.value_json, "done without value");
        m = decode_isolate_message(encode_done_error("boom", kFailException));
        expect_true(m.type == IsolateMessage::Type::DONE && !m.ok && m.error == "boom" && m.kind == "exception", "done error");

        expect_true(decode_isolate_message("garbage").type == IsolateMessage::Type::INVALID, "garbage");
        expect_true(decode_isolate_message("{\"t\":\"mystery\"}").type == IsolateMessage::Type::INVALID, "unknown type");
        expect_true(decode_isolate_message("{\"t\":\"ready\"} trailing").type == IsolateMessage::Type::INVALID, "trailing bytes");
    }

    // Test 3: call replies
    {
        CallReply ok;
        ok.id = 3;
        ok.ok = true;
        ok.value_json = "[\"r1\",\"r2\"]";
        CallReply back;
        expect_true(decode_reply(encode_reply(ok), &back), "decode ok reply");
        expect_true(back.id == 3 && back.ok && back.value_json == ok.value_json, "ok reply value");

        CallReply bad;
        bad.id = 4;
        bad.error = "webSearch is not available";
        expect_true(decode_reply(encode_reply(bad), &back), "decode error reply");
        expect_true(back.id == 4 && !back.ok && back.error == bad.error, "error reply");

        expect_true(!decode_reply("{\"ok\":true}", &back), "id required");
    }

    // Test 4: line splitting across arbitrary chunk boundaries
    {
        LineBuffer lb;
        std::string line;
        lb.append("{\"t\":\"re", 8);
        expect_true(!lb.next_line(&line), "partial line");
        lb.append("ady\"}\n{\"t\":", 11);
        expect_true(lb.next_line(&line) && line == "{\"t\":\"ready\"}", "first line: " + line);
        expect_true(!lb.next_line(&line), "second line incomplete");
        lb.append("\"final\",\"text\":\"x\"}\n\n", 21);
        expect_true(lb.next_line(&line) && line == "{\"t\":\"final\",\"text\":\"x\"}", "second line: " + line);
        expect_true(lb.next_line(&line) && line.empty(), "empty line");
        expect_true(!lb.next_line(&line) && !lb.overflow(), "drained");
    }

    // Test 5: an overlong line is a sticky overflow
    {
        LineBuffer lb(16);
        std::string line;
        std::string chunk(10, 'a');
        lb.append(chunk.data(), chunk.size());
        expect_true(!lb.overflow(), "under the limit");
        lb.append(chunk.data(), chunk.size());
        expect_true(lb.overflow(), "over the limit without newline");
        lb.append("\n", 1);
        expect_true(!lb.next_line(&line) && lb.overflow(), "overflow is sticky");

        LineBuffer lb2(4);
        lb2.append("ok\n0123456789\n", 14);
        expect_true(lb2.next_line(&line) && line == "ok", "short line still delivered");
        expect_true(!lb2.next_line(&line) && lb2.overflow(), "long line with newline overflows");
    }

    std::cerr << "test_isolate_protocol: ALL PASSED" << std::endl;
    return 0;
}
