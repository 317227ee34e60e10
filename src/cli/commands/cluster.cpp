#include "../base_cli.hpp"
#include "../formatter.hpp"
#include <core/constants.hpp>
#include <probes/environment.hpp>
#include <iostream>

static int do_info(BaseCLI& cli, const ParsedArgs&) {
    std::cout << format_info(cli.service().summary());
    return EXIT_OK;
}

static int do_aws(BaseCLI& cli, const ParsedArgs&) {
    const auto& env = cli.environment();
    std::cout << format_aws(env.is_aws(), nccl_settings(env, cli.config.aws().nccl));
    return EXIT_OK;
}

static int do_version(BaseCLI&, const ParsedArgs&) {
    std::cout << format_version();
    return EXIT_OK;
}

void register_cluster_commands(BaseCLI& cli) {
    CommandSpec info;
    info.usage = "info";
    cli.add_command("info", do_info, "Cluster name, Slurm version and partitions", info);

    CommandSpec aws;
    aws.usage = "aws";
    cli.add_command("aws", do_aws, "AWS detection and recommended NCCL settings", aws);

    CommandSpec version;
    version.usage = "version";
    cli.add_command("version", do_version, "Show version", version);
}
