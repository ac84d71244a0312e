#include "cmd_run.h"
#include "runner_utils.h"

#include "codebox/isolate_sandbox.h"
#include "codebox/log.h"
#include "codebox/serialization.h"

#include <iostream>
#include <iterator>
#include <stdexcept>

using namespace codebox;

int cmd_run(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: codebox_cli run <script.js|-> [capabilities.json]\n";
        std::cerr << "env: CODEBOX_STEP_TIMEOUT_MS, CODEBOX_MEMORY_LIMIT_MB, CODEBOX_SECCOMP_ENABLE\n";
        return 2;
    }

    EngineConfig cfg = init_runtime(argv[0]);

    std::string code;
    CapabilitySet caps;
    try {
        const std::string script = argv[2];
        if (script == "-") {
            code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        } else {
            code = slurp(script);
        }
        caps = load_capabilities(argc > 3 ? argv[3] : "");
    } catch (const std::exception& e) {
        std::cerr << "[codebox_cli] " << e.what() << "\n";
        return 2;
    }

    SandboxOptions opt;
    opt.isolate_bin = cfg.isolate_bin;
    opt.memory_limit_mb = cfg.memory_limit_mb;
    opt.max_output_chars = cfg.max_output_chars;
    opt.enable_seccomp = cfg.enable_seccomp;
    opt.lazy_return = cfg.lazy_return;
    IsolateSandbox sandbox(opt);

    RunResult r = sandbox.run(code, caps, cfg.step_timeout_ms);
    std::cout << run_result_to_json(r) << "\n";
    if (r.error) log_warn("run failed: " + *r.error);
    return r.terminal_answer ? 0 : 1;
}
