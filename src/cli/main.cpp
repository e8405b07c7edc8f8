// File: src/cli/main.cpp
//
// stocklens_cli [--config <file>] [<command> [args...]]
// Without a command, reads commands from stdin.

#include "cli/stocklens_cli.hpp"
#include "core/logging.hpp"
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    using namespace stocklens;

    try {
        CliConfig config = CliConfig::Default();
        std::string command_line;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config") {
                if (i + 1 >= argc) {
                    std::cerr << "--config requires a file argument\n";
                    return 1;
                }
                auto loaded = CliConfig::LoadFromFile(argv[++i]);
                if (!loaded) {
                    return 1;
                }
                config = *loaded;
            } else {
                if (!command_line.empty()) {
                    command_line += ' ';
                }
                command_line += arg;
            }
        }

        Logger::SetLevel(ParseLogLevel(config.logging.level));

        StockLensCli cli(config, std::cout);
        if (command_line.empty()) {
            cli.Run(std::cin);
            return 0;
        }
        return cli.ProcessCommand(command_line) ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
