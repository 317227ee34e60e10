#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Seam between probes and the processes they launch.  Tests substitute a
// runner that returns canned scheduler output.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Run argv with a bounded timeout.  Never throws; a missing binary is
    // reported as exit code 127.
    virtual CommandResult run(const std::vector<std::string>& argv, int timeout_ms) = 0;
};

// Production runner: forks the command in its own process group.
class SubprocessRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv, int timeout_ms) override;
};
