#include "test_common.h"
#include "codebox/agent.h"
#include "codebox/json_mini.h"

#include <chrono>
#include <cstdio>
#include <deque>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>

using namespace codebox;

namespace {

// Replies are consumed in order; when exhausted the last one repeats.
struct FakeModel final : IModel {
    std::deque<ModelReply> replies;
    std::vector<std::vector<ChatMessage>> prompts;
    std::vector<int> timeouts;
    int sleep_ms{0};
    bool throws{false};

    void say(const std::string& content) {
        ModelReply r;
        r.ok = true;
        r.content = content;
        replies.push_back(r);
    }
    void fail(const std::string& error) {
        ModelReply r;
        r.error = error;
        replies.push_back(r);
    }

    ModelReply invoke(const std::vector<ChatMessage>& messages, int timeout_ms) override {
        prompts.push_back(messages);
        timeouts.push_back(timeout_ms);
        if (sleep_ms) std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
        if (throws) throw std::runtime_error("model backend crashed");
        if (replies.empty()) return ModelReply{};
        ModelReply r = replies.front();
        if (replies.size() > 1) replies.pop_front();
        return r;
    }
};

struct FakeSandbox final : ISandbox {
    std::deque<RunResult> results;
    std::vector<std::string> codes;
    std::vector<int> timeouts;
    std::vector<size_t> cap_counts;
    int sleep_ms_first{0};

    void answer(const std::string& a) {
        RunResult r;
        r.terminal_answer = a;
        results.push_back(r);
    }
    void error(const std::string& e, const std::string& out = "") {
        RunResult r;
        r.error = e;
        if (!out.empty()) r.stdout_lines.push_back(out);
        results.push_back(r);
    }

    RunResult run(const std::string& code, const CapabilitySet& caps, int timeout_ms) override {
        codes.push_back(code);
        timeouts.push_back(timeout_ms);
        cap_counts.push_back(caps.size());
        if (codes.size() == 1 && sleep_ms_first) std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms_first));
        if (results.empty()) return RunResult{};
        RunResult r = results.front();
        if (results.size() > 1) results.pop_front();
        return r;
    }
};

const std::string kCode = "```js\nfinalAnswer('x')\n```";

EngineConfig base_config(int attempts = 2) {
    EngineConfig c;
    c.max_attempts = attempts;
    c.step_timeout_ms = 20000;
    c.total_timeout_ms = 60000;
    c.classifier_enabled = false;
    return c;
}

InvocationRequest ask(const std::string& q) {
    InvocationRequest r;
    r.user_input = q;
    return r;
}

std::string prompt_text(const std::vector<ChatMessage>& msgs) {
    std::string all;
    for (const auto& m : msgs) all += m.role + ": " + m.content + "\n";
    return all;
}

} // namespace

int main(int argc, char** argv) {
    DefaultPromptBuilder prompts;

    // Test 1: collaborators are required
    {
        FakeSandbox sb;
        AgentContext ctx;
        ctx.prompts = &prompts;
        ctx.sandbox = &sb;
        bool threw = false;
        try { CodeAgent a(ctx); } catch (const std::invalid_argument&) { threw = true; }
        expect_true(threw, "missing model rejected");
    }

    // Test 2: terminal answer on the first attempt
    {
        FakeModel m;
        m.say("Sure:\n" + kCode);
        FakeSandbox sb;
        sb.answer("the answer");
        AgentContext ctx;
        ctx.config = base_config();
        ctx.model = &m;
        ctx.prompts = &prompts;
        ctx.sandbox = &sb;
        ctx.capabilities = [] {
            CapabilitySet s;
            s["webSearch"] = [](const std::string&) { return CapabilityResult::value("1"); };
            return s;
        };
        AgentReply r = CodeAgent(ctx).handle(ask("what?"));
        expect_true(r.status == AgentStatus::ANSWERED && r.message == "the answer", "answered: " + r.message);
        expect_eq_ll(r.attempts, 1, "one attempt");
        expect_eq_ll(r.generations, 1, "one generation");
        expect_true(sb.codes.size() == 1 && sb.codes[0] == "finalAnswer('x')", "extracted code reached the sandbox");
        expect_eq_ll((long long)sb.cap_counts[0], 1, "capability set passed through");
        expect_true(prompt_text(m.prompts[0]).find("webSearch(query)") != std::string::npos, "prompt lists the capability");
        expect_true(m.prompts[0].back().content == "what?", "user input is the last message");
    }

    // Test 3: no code twice -> fixed apology, sandbox never called
    {
        FakeModel m;
        m.say("I think the answer is 4.");
        FakeSandbox sb;
        AgentContext ctx;
        ctx.config = base_config(2);
        ctx.model = &m;
        ctx.prompts = &prompts;
        ctx.sandbox = &sb;
        AgentReply r = CodeAgent(ctx).handle(ask("2+2"));
        expect_true(r.status == AgentStatus::NO_CODE, "no code status");
        expect_true(r.message == "I couldn't generate the right code to answer your request. Please try rephrasing.",
                    "no code message: " + r.message);
        expect_eq_ll(r.generations, 2, "two generations");
        expect_eq_ll((long long)sb.codes.size(), 0, "sandbox not used");
    }

    // Test 4: failing run with one attempt -> exhausted
    {
        FakeModel m;
        m.say(kCode);
        FakeSandbox sb;
        sb.error("boom");
        AgentContext ctx;
        ctx.config = base_config(1);
        ctx.model = &m;
        ctx.prompts = &prompts;
        ctx.sandbox = &sb;
        AgentReply r = CodeAgent(ctx).handle(ask("q"));
        expect_true(r.status == AgentStatus::EXHAUSTED, "exhausted status");
        expect_true(r.message == "I tried my best but couldn't get a final answer. Please check the logs for more details.",
                    "exhausted message: " + r.message);
        expect_eq_ll(r.attempts, 1, "one attempt");
    }

    // Test 4b: an answer latched by a run that then failed is not used
    {
        FakeModel m;
        m.say(kCode);
        FakeSandbox sb;
        RunResult late;
        late.terminal_answer = "half done";
        late.error = "Script execution timed out.";
        late.timed_out = true;
        sb.results.push_back(late);
        AgentContext ctx;
        ctx.config = base_config(1);
        ctx.model = &m;
        ctx.prompts = &prompts;
        ctx.sandbox = &sb;
        AgentReply r = CodeAgent(ctx).handle(ask("q"));
        expect_true(r.status == AgentStatus::EXHAUSTED, "failed run does not answer: " + r.message);
        expect_true(r.message.find("half done") == std::string::npos, "latched answer not surfaced");
    }

    // Test 5: the second attempt sees the first one's failure
    {
        FakeModel m;
        m.say("```js\nconst v = await webSearch('q');\nfinalAnswer(v.missing.field)\n```");
        m.say(kCode);
        FakeSandbox sb;
        sb.error("TypeError: cannot read property 'field' of undefined", "searched q");
        sb.answer("fixed");
        AgentContext ctx;
        ctx.config = base_config(3);
        ctx.model = &m;
        ctx.prompts = &prompts;
        ctx.sandbox = &sb;
        AgentReply r = CodeAgent(ctx).handle(ask("q"));
        expect_true(r.status == AgentStatus::ANSWERED && r.message == "fixed", "answered on retry");
        expect_eq_ll(r.attempts, 2, "two attempts");
        std::string second = prompt_text(m.prompts[1]);
        expect_true(second.find("cannot read property 'field'") != std::string::npos, "error fed back");
        expect_true(second.find("v.missing.field") != std::string::npos, "previous code fed back");
        expect_true(second.find("searched q") != std::string::npos, "previous stdout fed back");
        expect_true(prompt_text(m.prompts[0]).find("previous script") == std::string::npos, "no feedback on attempt 1");
    }

    // Test 6: feedback text is capped
    {
        RunResult rr;
        rr.stdout_lines = {std::string(500, 'o')};
        auto f = make_attempt_feedback(2, std::string(300, 'c'), std::string(400, 'e'), rr, 100);
        expect_true(f.attempt == 2 && f.code.size() == 100 && f.error.size() == 100 && f.stdout_text.size() == 100,
                    "every field cut to the cap");
    }

    // Test 7: the total deadline shrinks later sandbox timeouts
    {
        FakeModel m;
        m.say(kCode);
        FakeSandbox sb;
        sb.sleep_ms_first = 1200;
        sb.error("slow failure");
        AgentContext ctx;
        ctx.config = base_config(2);
        ctx.config.total_timeout_ms = 1500;
        ctx.model = &m;
        ctx.prompts = &prompts;
        ctx.sandbox = &sb;
        AgentReply r = CodeAgent(ctx).handle(ask("q"));
        expect_eq_ll((long long)sb.timeouts.size(), 2, "both attempts ran");
        expect_true(sb.timeouts[0] <= 1500, "first run bounded by the total");
        expect_true(sb.timeouts[1] > 0 && sb.timeouts[1] <= 300,
                    "second run gets only what is left: " + std::to_string(sb.timeouts[1]));
        expect_true(r.status == AgentStatus::EXHAUSTED, "both attempts failed: " + std::string(agent_status_name(r.status)));
        for (int t : m.timeouts) expect_true(t <= 1500, "model calls bounded by the total");
    }

    // Test 8: no new attempt once the deadline has passed
    {
        FakeModel m;
        m.sleep_ms = 60;
        m.say("no code here");
        FakeSandbox sb;
        AgentContext ctx;
        ctx.config = base_config(5);
        ctx.config.total_timeout_ms = 30;
        ctx.model = &m;
        ctx.prompts = &prompts;
        ctx.sandbox = &sb;
        AgentReply r = CodeAgent(ctx).handle(ask("q"));
        expect_true(r.status == AgentStatus::TIMED_OUT, "timed out");
        expect_true(r.message == "I took too long to think and could not complete the request.", "timeout message");
        expect_eq_ll(r.generations, 1, "no model call after the deadline");
    }

    // Test 9: raw return values are a fallback answer
    {
        RunResult a;
        a.raw_return_json = "\"plain text\"";
        expect_true(answer_from_result(a).value_or("") == "plain text", "JSON string unquoted");
        RunResult b;
        b.raw_return_json = "{\"n\":1}";
        expect_true(answer_from_result(b).value_or("") == "{\"n\":1}", "other values stay JSON");
        RunResult c = b;
        c.error = "later failure";
        expect_true(!answer_from_result(c), "raw value ignored when the run failed");
        RunResult d;
        d.raw_return_json = "null";
        expect_true(!answer_from_result(d), "null is not an answer");
        RunResult e;
        e.terminal_answer = "latched";
        e.error = "Script execution timed out.";
        expect_true(!answer_from_result(e), "a failed run never answers");
        RunResult f;
        f.terminal_answer = "";
        expect_true(!answer_from_result(f), "empty answer does not count");
    }

    // Test 10: model failures and exceptions use up attempts
    {
        FakeModel m;
        m.fail("HTTP 500");
        FakeSandbox sb;
        AgentContext ctx;
        ctx.config = base_config(2);
        ctx.model = &m;
        ctx.prompts = &prompts;
        ctx.sandbox = &sb;
        AgentReply r = CodeAgent(ctx).handle(ask("q"));
        expect_true(r.status == AgentStatus::NO_CODE && r.attempts == 2, "model errors end as no code");

        FakeModel t;
        t.throws = true;
        ctx.model = &t;
        r = CodeAgent(ctx).handle(ask("q"));
        expect_true(r.status == AgentStatus::NO_CODE && r.generations == 2, "exceptions are contained");
    }

    // Test 11: classifier fast path answers directly
    {
        FakeModel cls;
        cls.say("NONE");
        FakeModel m;
        m.say("  Paris is the capital of France.\n");
        FakeSandbox sb;
        AgentContext ctx;
        ctx.config = base_config(2);
        ctx.config.classifier_enabled = true;
        ctx.model = &m;
        ctx.classifier_model = &cls;
        ctx.prompts = &prompts;
        ctx.sandbox = &sb;
        AgentReply r = CodeAgent(ctx).handle(ask("capital of France?"));
        expect_true(r.status == AgentStatus::DIRECT && r.message == "Paris is the capital of France.", "direct: " + r.message);
        expect_eq_ll((long long)sb.codes.size(), 0, "no sandbox run");
        expect_eq_ll(r.attempts, 0, "direct answers use no attempt");
        expect_true(prompt_text(m.prompts[0]).find("Do not output code.") != std::string::npos, "direct prompt");
    }

    // Test 12: code in a direct answer is executed and uses an attempt
    {
        FakeModel cls;
        cls.say("NONE");
        FakeModel m;
        m.say("Let me check.\n" + kCode);
        FakeSandbox sb;
        sb.error("first failed");
        sb.answer("from retry");
        AgentContext ctx;
        ctx.config = base_config(2);
        ctx.config.classifier_enabled = true;
        ctx.model = &m;
        ctx.classifier_model = &cls;
        ctx.prompts = &prompts;
        ctx.sandbox = &sb;
        AgentReply r = CodeAgent(ctx).handle(ask("hello"));
        expect_true(r.status == AgentStatus::ANSWERED && r.message == "from retry", "answered after fallback");
        expect_eq_ll(r.attempts, 2, "fallback run plus one generation");
        expect_eq_ll((long long)sb.codes.size(), 2, "two sandbox runs");
    }

    // Test 13: trigger phrases skip the classifier model; a failing direct answer falls through
    {
        FakeModel cls;
        cls.say("NONE");
        FakeModel m;
        m.say(kCode);
        FakeSandbox sb;
        sb.answer("scheduled");
        AgentContext ctx;
        ctx.config = base_config(2);
        ctx.config.classifier_enabled = true;
        ctx.model = &m;
        ctx.classifier_model = &cls;
        ctx.prompts = &prompts;
        ctx.sandbox = &sb;
        AgentReply r = CodeAgent(ctx).handle(ask("remind me to call mom"));
        expect_true(r.status == AgentStatus::ANSWERED, "tools path");
        expect_eq_ll((long long)cls.prompts.size(), 0, "classifier model not asked");

        FakeModel broken;
        broken.fail("overloaded");
        broken.say(kCode);
        ctx.model = &broken;
        FakeSandbox sb2;
        sb2.answer("via tools");
        ctx.sandbox = &sb2;
        r = CodeAgent(ctx).handle(ask("hello there"));
        expect_true(r.status == AgentStatus::ANSWERED && r.message == "via tools", "direct failure falls through");
    }

    // Test 14: event log records the whole turn
    {
        std::string path = "codebox_test_agent_" + std::to_string((long long)getpid()) + ".jsonl";
        std::remove(path.c_str());
        {
            EventLog events(path);
            FakeModel m;
            m.say(kCode);
            FakeSandbox sb;
            sb.answer("logged");
            AgentContext ctx;
            ctx.config = base_config(1);
            ctx.model = &m;
            ctx.prompts = &prompts;
            ctx.sandbox = &sb;
            ctx.events = &events;
            CodeAgent(ctx).handle(ask("q"));
        }
        std::ifstream f(path);
        std::string line, seen;
        std::string run_id;
        while (std::getline(f, line)) {
            seen += json_mini::get_string(line, "event").value_or("?") + ",";
            std::string id = json_mini::get_string(line, "run_id").value_or("");
            if (run_id.empty()) run_id = id;
            expect_true(id == run_id, "one run id per turn");
        }
        std::remove(path.c_str());
        expect_true(seen == "start,llm_request,llm_response,code_extracted,sandbox_run,sandbox_result,final_answer,finish,",
                    "event sequence: " + seen);
    }

    // Test 15: end to end through the real isolate
    if (argc >= 2) {
        SandboxOptions opt;
        opt.isolate_bin = argv[1];
        IsolateSandbox sandbox(opt);

        FakeModel m;
        m.say("```js\nconst hits = await webSearch('weather');\nfinalAnswer(`Top: ${hits[0].title}`);\n```");
        AgentContext ctx;
        ctx.config = base_config(2);
        ctx.model = &m;
        ctx.prompts = &prompts;
        ctx.sandbox = &sandbox;
        ctx.capabilities = [] {
            CapabilitySet s;
            s["webSearch"] = [](const std::string&) {
                return CapabilityResult::value("[{\"title\":\"Sunny\"}]");
            };
            return s;
        };
        AgentReply r = CodeAgent(ctx).handle(ask("weather?"));
        expect_true(r.status == AgentStatus::ANSWERED && r.message == "Top: Sunny", "end to end: " + r.message);

        const std::string boom = "await webSearch(\"x\");\nthrow new Error(\"boom\")";
        RunResult direct = sandbox.run(boom, ctx.capabilities(), 5000);
        expect_true(direct.error.value_or("") == "boom", "capability then throw: " + direct.error.value_or("<none>"));

        FakeModel bad;
        bad.say("```js\n" + boom + "\n```");
        ctx.model = &bad;
        ctx.config.max_attempts = 1;
        r = CodeAgent(ctx).handle(ask("x"));
        expect_true(r.status == AgentStatus::EXHAUSTED && r.message == kExhaustedMessage,
                    "thrown error exhausts a single attempt");
    }

    std::cerr << "test_agent: ALL PASSED" << std::endl;
    return 0;
}
