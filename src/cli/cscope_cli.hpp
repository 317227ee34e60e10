#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_resource_commands(BaseCLI& cli);
void register_cluster_commands(BaseCLI& cli);
void register_job_commands(BaseCLI& cli);

class CscopeCLI : public BaseCLI {
public:
    CscopeCLI();

    // Dispatch argv[1..] and return the exit code.
    int run(const std::vector<std::string>& args);

    void print_usage() const;

private:
    void register_all_commands();
};
