#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <probes/command_runner.hpp>
#include <probes/file_reader.hpp>
#include <probes/local_probe.hpp>
#include <probes/slurm_probe.hpp>
#include <managers/cluster_service.hpp>
#include "args.hpp"

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    // Returns the process exit code.
    using CommandHandler = std::function<int(BaseCLI&, const ParsedArgs&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help,
                     CommandSpec spec = {});

    // Load config once and point the debug log at its log_file.
    Result<void> require_config();

    // Detected on first use, then reused for the rest of the invocation.
    const ClusterEnvironment& environment();
    ClusterService& service();
    CommandRunner& runner() { return *runner_; }

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    bool has_command(const std::string& command) const;
    void print_help() const;
    void print_command_help(const std::string& command) const;

    // Swap in fakes before the first command runs.
    void set_host(std::unique_ptr<CommandRunner> runner, std::unique_ptr<FileReader> files);

    // Use this config instead of loading one from disk.
    void set_config(const Config& cfg);

    // Public state
    Config config;

protected:
    struct CommandEntry {
        CommandHandler handler;
        std::string help;
        CommandSpec spec;
    };
    std::map<std::string, CommandEntry> commands_;
    std::vector<std::string> order_;

private:
    ProbeOptions probe_options() const;

    bool config_loaded_ = false;
    std::unique_ptr<CommandRunner> runner_;
    std::unique_ptr<FileReader> files_;
    std::optional<ClusterEnvironment> env_;
    std::unique_ptr<SlurmProbe> slurm_;
    std::unique_ptr<LocalProbe> local_;
    std::unique_ptr<ClusterService> service_;
};

// Print a failure to stderr and return the exit code for its error kind.
int report_error(ErrorKind kind, const std::string& message);

// Exit code for an error kind: 2 for usage errors, 1 otherwise.
int exit_code_for(ErrorKind kind);
