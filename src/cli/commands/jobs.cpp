#include "../base_cli.hpp"
#include "../formatter.hpp"
#include <core/constants.hpp>
#include <managers/job_generator.hpp>
#include <managers/job_info.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <fmt/format.h>

static int do_job_gen(BaseCLI& cli, const ParsedArgs& args) {
    const std::string& type = args.positionals[0];
    const JobProfile* profile = cli.config.find_job_type(type);
    if (!profile) {
        std::string known;
        for (const auto& [name, p] : cli.config.job_types()) {
            if (!known.empty()) known += ", ";
            known += name;
        }
        return report_error(ErrorKind::InvalidArgument,
                            fmt::format("Unknown job type: {} (known: {})", type, known));
    }

    std::string format = args.value("format", "json");
    if (!is_job_format(format)) {
        return report_error(ErrorKind::InvalidArgument,
                            fmt::format("Unknown format '{}': use json, sbatch, srun or submitit", format));
    }

    JobGenOptions opts;
    opts.partition = args.value("partition");
    const std::pair<const char*, std::optional<int>*> int_options[] = {
        {"num-gpus", &opts.num_gpus},
        {"num-gpus-per-task", &opts.num_gpus_per_task},
        {"num-tasks-per-node", &opts.num_tasks_per_node},
        {"num-cpus", &opts.num_cpus},
    };
    for (const auto& [name, slot] : int_options) {
        auto v = args.int_value(name);
        if (v.is_err()) return report_error(v.kind, v.error);
        *slot = v.value;
    }

    auto resources = cli.service().resources();
    if (resources.is_err()) return report_error(resources.kind, resources.error);

    auto req = generate_job_request(resources.value, *profile, opts);
    if (req.is_err()) return report_error(req.kind, req.error);

    std::cout << format_job_request(req.value, format);
    return EXIT_OK;
}

static int do_job_info(BaseCLI& cli, const ParsedArgs& args) {
    auto info = read_job_info(platform::get_env, cli.runner(), cli.config.probe().timeout_ms);
    if (info.is_err()) return report_error(info.kind, info.error);

    if (args.flag("export")) std::cout << format_job_info_exports(info.value);
    else std::cout << format_job_info(info.value);
    return EXIT_OK;
}

void register_job_commands(BaseCLI& cli) {
    CommandSpec gen;
    gen.usage = "job-gen <job-type> [--num-gpus N] [--num-gpus-per-task N] "
                "[--num-tasks-per-node N] [--num-cpus N] [--partition NAME] "
                "[--format json|sbatch|srun|submitit]";
    gen.value_options = {"num-gpus", "num-gpus-per-task", "num-tasks-per-node",
                         "num-cpus", "partition", "format"};
    gen.min_positionals = 1;
    gen.max_positionals = 1;
    cli.add_command("job-gen", do_job_gen, "Recommend resources for a job type", gen);

    CommandSpec info;
    info.usage = "job-info [--export]";
    info.flag_options = {"export"};
    cli.add_command("job-info", do_job_info, "Rank, world size and master address of this job", info);
}
