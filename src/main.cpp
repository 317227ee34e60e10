#include <iostream>
#include <vector>
#include <string>
#include "cli/cscope_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>
#include <platform/process.hpp>

int main(int argc, char** argv) {
    platform::install_interrupt_handler();
    try {
        CscopeCLI cli;
        std::vector<std::string> args(argv + 1, argv + argc);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return EXIT_FAILURE_CODE;
    }
}
