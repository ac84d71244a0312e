#include "cmd_ask.h"
#include "cmd_run.h"

#include "codebox/capability.h"

#include <iostream>
#include <string>

static int cmd_vocabulary() {
    std::cout << "capability vocabulary v" << codebox::kCapabilityVocabularyVersion << "\n";
    for (const auto& n : codebox::capability_vocabulary()) {
        std::cout << "  " << n << (codebox::is_reserved_name(n) ? " (reserved)" : "") << "\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "codebox_cli <run|ask|vocabulary> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "ask") return cmd_ask(argc, argv);
    if (cmd == "vocabulary") return cmd_vocabulary();
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
