#include "hostmux/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        hostmux::startup_config cfg{};
        if (auto cli_result = hostmux::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        hostmux::cli::run_repl(cfg);
        return 0;
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
