#include "../base_cli.hpp"
#include "../formatter.hpp"
#include <core/constants.hpp>
#include <managers/gpu_inventory.hpp>
#include <iostream>

static int do_cpus(BaseCLI& cli, const ParsedArgs& args) {
    auto r = cli.service().resources(args.value("partition"));
    if (r.is_err()) return report_error(r.kind, r.error);
    std::cout << format_cpus(r.value);
    return EXIT_OK;
}

static int do_mem(BaseCLI& cli, const ParsedArgs& args) {
    auto r = cli.service().resources(args.value("partition"));
    if (r.is_err()) return report_error(r.kind, r.error);
    std::cout << format_mem(r.value, args.flag("detailed"), cli.config.memory_usage_percentage());
    return EXIT_OK;
}

static int do_gpus(BaseCLI& cli, const ParsedArgs& args) {
    auto inv = cli.service().gpu_inventory(args.value("partition"));
    if (inv.is_err()) return report_error(inv.kind, inv.error);

    GpuView view = GpuView::Default;
    if (args.flag("vendor")) view = GpuView::Vendor;
    else if (args.flag("counts")) view = GpuView::Counts;
    else if (args.flag("generations")) view = GpuView::Generations;

    std::cout << format_gpus(inv.value, view);
    return EXIT_OK;
}

static int do_check_gpu(BaseCLI& cli, const ParsedArgs& args) {
    const std::string& model = args.positionals[0];
    auto inv = cli.service().gpu_inventory(args.value("partition"));
    if (inv.is_err()) return report_error(inv.kind, inv.error);
    std::cout << format_check_gpu(model, has_gpu(inv.value, model));
    return EXIT_OK;
}

void register_resource_commands(BaseCLI& cli) {
    CommandSpec cpus;
    cpus.usage = "cpus [--partition=NAME]";
    cpus.value_options = {"partition"};
    cli.add_command("cpus", do_cpus, "CPU cores per node", cpus);

    CommandSpec mem;
    mem.usage = "mem [--partition=NAME] [--detailed]";
    mem.value_options = {"partition"};
    mem.flag_options = {"detailed"};
    cli.add_command("mem", do_mem, "Memory per node (MB and GB)", mem);

    CommandSpec gpus;
    gpus.usage = "gpus [--partition=NAME] [--vendor] [--counts] [--generations]";
    gpus.value_options = {"partition"};
    gpus.flag_options = {"vendor", "counts", "generations"};
    cli.add_command("gpus", do_gpus, "GPU models and counts per node", gpus);

    CommandSpec check;
    check.usage = "check-gpu <model> [--partition=NAME]";
    check.value_options = {"partition"};
    check.min_positionals = 1;
    check.max_positionals = 1;
    cli.add_command("check-gpu", do_check_gpu, "Check whether a GPU model exists", check);
}
