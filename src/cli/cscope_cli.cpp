#include "cscope_cli.hpp"
#include "formatter.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <iostream>

CscopeCLI::CscopeCLI() : BaseCLI() {
    register_all_commands();
}

void CscopeCLI::register_all_commands() {
    register_resource_commands(*this);
    register_cluster_commands(*this);
    register_job_commands(*this);
}

void CscopeCLI::print_usage() const {
    std::cout << "\n" << theme::color::SLATE << theme::color::BOLD << "  cscope"
              << theme::color::RESET << theme::color::DIM
              << "  HPC cluster and job information" << theme::color::RESET << "\n";
    print_help();
}

int CscopeCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage();
        return EXIT_USAGE;
    }

    const std::string& cmd = args[0];
    if (cmd == "--help" || cmd == "-h" || cmd == "help") {
        print_usage();
        return EXIT_OK;
    }
    if (cmd == "--version") {
        std::cout << format_version();
        return EXIT_OK;
    }
    if (!has_command(cmd)) {
        std::cerr << theme::fail("Unknown command: " + cmd);
        print_usage();
        return EXIT_USAGE;
    }

    std::vector<std::string> rest(args.begin() + 1, args.end());
    return execute_command(cmd, rest);
}
