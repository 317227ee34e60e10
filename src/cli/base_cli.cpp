#include "base_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <probes/environment.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI()
    : runner_(std::make_unique<SubprocessRunner>()),
      files_(std::make_unique<SystemFileReader>()) {}

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& help,
                          CommandSpec spec) {
    if (!commands_.count(name)) order_.push_back(name);
    commands_[name] = {handler, help, spec};
}

void BaseCLI::set_host(std::unique_ptr<CommandRunner> runner, std::unique_ptr<FileReader> files) {
    runner_ = std::move(runner);
    files_ = std::move(files);
    env_.reset();
    service_.reset();
    slurm_.reset();
    local_.reset();
}

void BaseCLI::set_config(const Config& cfg) {
    config = cfg;
    config_loaded_ = true;
}

Result<void> BaseCLI::require_config() {
    if (config_loaded_) return Result<void>::Ok();

    auto loaded = Config::load();
    if (loaded.is_err()) return Result<void>::Err(loaded.kind, loaded.error);
    config = loaded.value;
    config_loaded_ = true;

    set_cscope_log_path(config.log_file());
    return Result<void>::Ok();
}

ProbeOptions BaseCLI::probe_options() const {
    ProbeOptions opts;
    opts.timeout_ms = config.probe().timeout_ms;
    opts.max_parallel = config.probe().max_parallel;
    return opts;
}

const ClusterEnvironment& BaseCLI::environment() {
    if (!env_) {
        DetectOptions opts;
        opts.timeout_ms = config.probe().timeout_ms;
        opts.query_metadata = config.aws().metadata;
        env_ = detect_environment(*files_, *runner_, opts);
        cscope_log(fmt::format("environment: scheduler={} version='{}' cloud={} efa={}",
                               env_->scheduler_present, env_->scheduler_version,
                               env_->cloud_provider.value_or("none"), env_->efa_present));
    }
    return *env_;
}

ClusterService& BaseCLI::service() {
    if (!service_) {
        const auto& env = environment();
        local_ = std::make_unique<LocalProbe>(*runner_, *files_, probe_options());
        if (env.scheduler_present) {
            slurm_ = std::make_unique<SlurmProbe>(*runner_, probe_options());
        }
        service_ = std::make_unique<ClusterService>(env, slurm_.get(), *local_);
    }
    return *service_;
}

bool BaseCLI::has_command(const std::string& command) const {
    return commands_.count(command) > 0;
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cerr << theme::fail("Unknown command: " + command);
        std::cerr << theme::step("Run 'cscope --help' for available commands.");
        return EXIT_USAGE;
    }
    const auto& entry = it->second;

    auto parsed = parse_args(args, entry.spec);
    if (parsed.is_err()) {
        std::cerr << theme::fail(parsed.error);
        std::cerr << theme::step("Usage: cscope " + entry.spec.usage);
        return EXIT_USAGE;
    }
    if (parsed.value.help) {
        print_command_help(command);
        return EXIT_OK;
    }

    auto cfg = require_config();
    if (cfg.is_err()) return report_error(cfg.kind, cfg.error);

    cscope_log(fmt::format("=== cscope {} {}", command, join_command(args)));
    return entry.handler(*this, parsed.value);
}

void BaseCLI::print_help() const {
    std::cout << theme::section("Commands");
    for (const auto& name : order_) {
        std::cout << theme::command_row(name, commands_.at(name).help);
    }
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    cscope --version      Show version\n"
              << "    cscope <command> --help"
              << theme::color::RESET << "\n\n";
}

void BaseCLI::print_command_help(const std::string& command) const {
    auto it = commands_.find(command);
    if (it == commands_.end()) return;
    std::cout << theme::section("Usage");
    std::cout << "    cscope " << it->second.spec.usage << "\n\n";
    std::cout << theme::dim("    " + it->second.help) << "\n\n";
}

int exit_code_for(ErrorKind kind) {
    return kind == ErrorKind::InvalidArgument ? EXIT_USAGE : EXIT_FAILURE_CODE;
}

int report_error(ErrorKind kind, const std::string& message) {
    cscope_log(fmt::format("error ({}): {}", error_kind_name(kind), message));
    std::cerr << theme::fail("Error: " + message);
    return exit_code_for(kind);
}
