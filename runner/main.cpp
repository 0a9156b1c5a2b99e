#include "commands.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "frameguard_cli <serve|exec|scan|check> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "serve") return cmd_serve(argc, argv);
    if (cmd == "exec") return cmd_exec(argc, argv);
    if (cmd == "scan") return cmd_scan(argc, argv);
    if (cmd == "check") return cmd_check(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
