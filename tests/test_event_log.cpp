#include "test_common.h"
#include "codebox/json_mini.h"
#include "codebox/log.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace codebox;

static std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> out;
    std::ifstream f(path);
    std::string line;
    while (std::getline(f, line)) out.push_back(line);
    return out;
}

int main() {
    // Test 1: run ids are 16 hex chars and differ
    {
        std::string a = gen_run_id(), b = gen_run_id();
        expect_eq_ll((long long)a.size(), 16, "run id length");
        expect_true(a.find_first_not_of("0123456789abcdef") == std::string::npos, "hex run id");
        expect_true(a != b, "run ids should differ");
    }

    // Test 2: disabled log accepts and drops events
    {
        EventLog off;
        expect_true(!off.enabled(), "default EventLog is disabled");
        off.event("r", 0, "start", "{}");
        EventLog empty("");
        expect_true(!empty.enabled(), "empty path disables the log");
    }

    // Test 3: records are one sorted JSON object per line
    std::string path = "codebox_test_events_" + std::to_string((long long)getpid()) + ".jsonl";
    std::remove(path.c_str());
    {
        EventLog log(path);
        expect_true(log.enabled(), "event log should open " + path);
        log.event("run1", 0, "start", "{\"user_input\":\"hi\"}");
        log.event("run1", 2, "error", "not json payload");
        log.event("run1", 3, "sandbox_result", "{\"b\":1,\"a\":{\"d\":2,\"c\":[3,{\"z\":1,\"y\":2}]}}");
    }
    {
        auto lines = read_lines(path);
        expect_eq_ll((long long)lines.size(), 3, "three records");
        expect_true(lines[0].rfind("{\"attempt\":0,\"event\":\"start\",\"payload\":{\"user_input\":\"hi\"},\"run_id\":\"run1\",\"ts\":\"", 0) == 0,
                    "first record layout: " + lines[0]);
        auto ts = json_mini::get_string(lines[0], "ts");
        expect_true(ts && ts->size() == 24 && ts->back() == 'Z', "ISO timestamp with ms: " + ts.value_or(""));
        expect_true(json_mini::get_int(lines[1], "attempt").value_or(-1) == 2, "attempt number");
        expect_true(json_mini::get_string(lines[1], "payload").value_or("") == "not json payload",
                    "non-JSON payload kept as a string");
        expect_true(lines[2].find("\"payload\":{\"a\":{\"c\":[3,{\"y\":2,\"z\":1}],\"d\":2},\"b\":1}") != std::string::npos,
                    "payload keys sorted at every level: " + lines[2]);
    }

    // Test 4: concurrent writers never interleave lines
    {
        EventLog log(path);
        std::vector<std::thread> th;
        for (int t = 0; t < 4; t++) {
            th.emplace_back([&log, t] {
                for (int i = 0; i < 50; i++) log.event("run" + std::to_string(t), i, "sandbox_result", "{\"i\":1}");
            });
        }
        for (auto& x : th) x.join();
    }
    {
        auto lines = read_lines(path);
        expect_eq_ll((long long)lines.size(), 203, "appended records");
        for (const auto& l : lines) expect_true(json_mini::is_valid(l), "every line is JSON: " + l);
    }
    std::remove(path.c_str());

    std::cerr << "test_event_log: ALL PASSED" << std::endl;
    return 0;
}
