#include "codebox/prompt.h"

#include <map>
#include <sstream>

namespace codebox {

namespace {

const std::map<std::string, std::string>& signatures() {
    static const std::map<std::string, std::string> kSig = {
        {"webSearch", "webSearch(query): Search the public web."},
        {"fetchText", "fetchText(url): Read a webpage as text."},
        {"queryKnowledgeBase", "queryKnowledgeBase(query): Search the personal library."},
        {"queryRAG", "queryRAG(query): Deprecated alias of kb_query."},
        {"kb_query", "kb_query(query, scope?): Hybrid text and vector search of the personal library. Returns a JSON string of hits."},
        {"read_note", "read_note(name): Full content of a note by title or path."},
        {"zk_create", "zk_create(title, body, tags?): Create a new note. Returns a status string."},
        {"writeNote", "writeNote(text): Append to the daily journal."},
        {"capture", "capture(text): Capture an item to the inbox."},
        {"schedule", "schedule(time, text): Schedule a reminder or task."},
        {"list_scheduled_tasks", "list_scheduled_tasks(): Array of formatted task strings."},
        {"delete_scheduled_task", "delete_scheduled_task(id): Delete a scheduled task by ID."},
        {"toggle_scheduled_task", "toggle_scheduled_task(id, active): Enable or disable a task."},
        {"list_plugins", "list_plugins(): Names of active plugins (string[])."},
        {"calendarList", "calendarList(opts?): List calendar events."},
        {"calendarCreate", "calendarCreate(event): Create a calendar event."},
        {"sendEmail", "sendEmail(args): Send an email."},
        {"notify", "notify(msg): Send a notification on the default channel."},
        {"discordNotify", "discordNotify(msg): Post to Discord."},
        {"signalNotify", "signalNotify(msg): Send a Signal notification."},
        {"sendSignal", "sendSignal(msg): Send a Signal message."},
    };
    return kSig;
}

const char* kRules =
    "You can solve tasks by emitting a single JavaScript code block, and nothing else.\n"
    "Rules:\n"
    "- Output exactly one fenced code block: ```js ... ``` and no prose outside it.\n"
    "- Every API call is async: always `await` it.\n"
    "- Use only the provided APIs:\n";

const char* kGuidance =
    "- Keep code concise (about 60 lines at most). Use try/catch and small helpers.\n"
    "- Call finalAnswer(text) exactly once at the end with the answer for the user.\n"
    "- Summarize long API outputs instead of passing them through. Do not print secrets.\n"
    "- When results come back as JSON, read them and write a natural language answer.\n"
    "- There is no require, import, process, filesystem or network access besides the APIs above.\n";

const char* kExample =
    "Example:\n"
    "```js\n"
    "const hits = JSON.parse(await kb_query('project status'));\n"
    "if (hits.length === 0) {\n"
    "  finalAnswer(\"I couldn't find anything about that in your library.\");\n"
    "} else {\n"
    "  const lines = hits.slice(0, 3).map(h => `- ${h.title}: ${h.text.slice(0, 150)}`);\n"
    "  finalAnswer(`According to your notes:\\n${lines.join('\\n')}`);\n"
    "}\n"
    "```\n";

const char* kClassifierSystem =
    "Task: Decide if the user request needs tools or can be answered directly.\n"
    "Respond with ONLY one token: NONE or TOOLS.\n"
    "NONE if trivial Q&A or general knowledge; TOOLS if web, RAG, file write, schedule, "
    "email, calendar, notifications, or multi-step research.";

void append_conversation(std::vector<ChatMessage>& out, const InvocationRequest& req) {
    for (const auto& m : req.history) out.push_back(m);
    out.push_back({"user", req.user_input});
}

} // namespace

std::string capability_signature(const std::string& name) {
    const auto& sig = signatures();
    auto it = sig.find(name);
    return it == sig.end() ? std::string() : it->second;
}

DefaultPromptBuilder::DefaultPromptBuilder(std::string base_system_prompt)
    : base_(std::move(base_system_prompt)) {}

std::string DefaultPromptBuilder::code_system(const std::vector<std::string>& capabilities) const {
    std::ostringstream os;
    if (!base_.empty()) os << base_ << "\n\n";
    os << kRules;
    for (const auto& n : capabilities) {
        std::string sig = capability_signature(n);
        os << "  - " << (sig.empty() ? n + "(...)" : sig) << "\n";
    }
    os << "  - finalAnswer(text): Deliver the answer. Only the first call counts.\n";
    os << kGuidance << "\n" << kExample;
    return os.str();
}

std::vector<ChatMessage> DefaultPromptBuilder::code_prompt(const InvocationRequest& req,
                                                           const std::vector<std::string>& capabilities,
                                                           const AttemptFeedback* previous) {
    std::vector<ChatMessage> out;
    out.push_back({"system", code_system(capabilities)});
    append_conversation(out, req);
    if (previous) {
        std::ostringstream os;
        os << "Your previous script (attempt " << previous->attempt << ") did not produce a final answer.\n";
        os << "```js\n" << previous->code << "\n```\n";
        if (!previous->error.empty()) os << "Error: " << previous->error << "\n";
        if (!previous->stdout_text.empty()) os << "stdout:\n" << previous->stdout_text << "\n";
        if (!previous->stderr_text.empty()) os << "stderr:\n" << previous->stderr_text << "\n";
        os << "Write a corrected script. Remember to call finalAnswer.";
        out.push_back({"user", os.str()});
    }
    return out;
}

std::vector<ChatMessage> DefaultPromptBuilder::classifier_prompt(const InvocationRequest& req) {
    return {{"system", kClassifierSystem}, {"user", req.user_input}};
}

std::vector<ChatMessage> DefaultPromptBuilder::direct_prompt(const InvocationRequest& req,
                                                             const std::vector<std::string>& capabilities) {
    std::vector<ChatMessage> out;
    out.push_back({"system", code_system(capabilities) +
                                 "\n\nAnswer the user directly in plain text. Do not output code."});
    append_conversation(out, req);
    return out;
}

} // namespace codebox
