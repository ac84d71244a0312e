#include "cmd_ask.h"
#include "runner_utils.h"

#include "codebox/agent.h"
#include "codebox/log.h"

#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>

using namespace codebox;

int cmd_ask(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: codebox_cli ask <question...|->\n";
        std::cerr << "env: CODEBOX_MODEL_CMD (required), CODEBOX_CLASSIFIER_CMD, CODEBOX_MODEL_TIMEOUT_MS,\n"
                     "     CODEBOX_CAPABILITIES, CODEBOX_SYSTEM_PROMPT_FILE\n";
        return 2;
    }

    EngineConfig cfg = init_runtime(argv[0]);

    InvocationRequest req;
    if (std::string(argv[2]) == "-") {
        req.user_input.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        for (int i = 2; i < argc; i++) {
            if (i > 2) req.user_input += " ";
            req.user_input += argv[i];
        }
    }

    ExternalModelOptions mopt;
    mopt.cmd = getenv_str("CODEBOX_MODEL_CMD");
    mopt.timeout_ms = (int)getenv_i64("CODEBOX_MODEL_TIMEOUT_MS", 60000);
    ExternalProcessModel model(mopt);
    if (!model.configured()) {
        std::cerr << "[codebox_cli] CODEBOX_MODEL_CMD is not set\n";
        return 2;
    }

    std::unique_ptr<ExternalProcessModel> classifier;
    const std::string classifier_cmd = getenv_str("CODEBOX_CLASSIFIER_CMD");
    if (!classifier_cmd.empty()) {
        ExternalModelOptions copt = mopt;
        copt.cmd = classifier_cmd;
        classifier = std::make_unique<ExternalProcessModel>(copt);
    }

    std::string base_prompt;
    CapabilityRegistry reg;
    try {
        const std::string prompt_file = getenv_str("CODEBOX_SYSTEM_PROMPT_FILE");
        if (!prompt_file.empty()) base_prompt = slurp(prompt_file);
        const std::string manifest = getenv_str("CODEBOX_CAPABILITIES");
        if (!manifest.empty()) reg.load_manifest(manifest);
    } catch (const std::exception& e) {
        std::cerr << "[codebox_cli] " << e.what() << "\n";
        return 2;
    }
    DefaultPromptBuilder prompts(base_prompt);

    SandboxOptions opt;
    opt.isolate_bin = cfg.isolate_bin;
    opt.memory_limit_mb = cfg.memory_limit_mb;
    opt.max_output_chars = cfg.max_output_chars;
    opt.enable_seccomp = cfg.enable_seccomp;
    opt.lazy_return = cfg.lazy_return;
    IsolateSandbox sandbox(opt);

    EventLog events(cfg.event_log_path);

    AgentContext ctx;
    ctx.config = cfg;
    ctx.model = &model;
    ctx.classifier_model = classifier.get();
    ctx.prompts = &prompts;
    ctx.sandbox = &sandbox;
    ctx.capabilities = [&reg]() { return reg.build(); };
    ctx.events = &events;

    CodeAgent agent(ctx);
    AgentReply reply = agent.handle(req);

    std::cout << reply.message << "\n";
    log_info(std::string("status=") + agent_status_name(reply.status) +
             " attempts=" + std::to_string(reply.attempts) +
             " generations=" + std::to_string(reply.generations));
    return (reply.status == AgentStatus::ANSWERED || reply.status == AgentStatus::DIRECT) ? 0 : 1;
}
