#include "slurm_probe.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>

SlurmProbe::SlurmProbe(CommandRunner& runner, ProbeOptions options)
    : runner_(runner), options_(options) {}

// Map a failed scontrol invocation onto the probe error taxonomy
template <typename T>
static Result<T> command_error(const std::vector<std::string>& argv, const CommandResult& r) {
    if (r.timed_out) {
        return Result<T>::Err(ErrorKind::ProbeTimeout,
                              fmt::format("'{}' timed out", join_command(argv)));
    }
    return Result<T>::Err(ErrorKind::SchedulerUnavailable,
                          fmt::format("'{}' exited {}: {}", join_command(argv),
                                      r.exit_code, trimmed(r.stderr_data)));
}

Result<std::vector<PartitionLine>> SlurmProbe::partition_lines() {
    std::vector<std::string> argv = {"scontrol", "show", "partition", "-o"};
    auto r = runner_.run(argv, options_.timeout_ms);
    if (r.failed()) return command_error<std::vector<PartitionLine>>(argv, r);
    return Result<std::vector<PartitionLine>>::Ok(parse_partition_listing(r.stdout_data));
}

Result<std::vector<PartitionResource>> SlurmProbe::list_partitions(const std::string& filter) {
    auto lines = partition_lines();
    if (lines.is_err()) return Result<std::vector<PartitionResource>>::Err(lines.kind, lines.error);

    std::vector<PartitionLine> wanted;
    for (const auto& p : lines.value) {
        if (filter.empty() || p.name == filter) wanted.push_back(p);
    }
    if (wanted.empty()) {
        if (!filter.empty()) cscope_log(fmt::format("partition '{}' not found", filter));
        return Result<std::vector<PartitionResource>>::Ok({});
    }

    // One slot per partition so completion order cannot reorder the output
    std::vector<PartitionResource> slots(wanted.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (size_t i = next++; i < wanted.size(); i = next++) {
            const auto& p = wanted[i];
            auto& out = slots[i];
            out.name = p.name;
            out.state = p.state;
            out.is_default = p.is_default;
            if (p.nodes.empty()) continue;

            // scontrol show node can exit non-zero while still printing the
            // nodes it found, so only a timeout discards the output.  A timed
            // out partition is still listed, with zero capacity.
            std::vector<std::string> argv = {"scontrol", "show", "node", p.nodes, "-o"};
            auto r = runner_.run(argv, options_.timeout_ms);
            if (r.timed_out) {
                cscope_log(fmt::format("{}: node query for partition '{}' timed out after {}ms",
                                       error_kind_name(ErrorKind::ProbeTimeout), p.name,
                                       options_.timeout_ms));
                continue;
            }
            aggregate_nodes(r.stdout_data, out);
        }
    };

    size_t n_threads = std::min(wanted.size(),
                                static_cast<size_t>(std::max(1, options_.max_parallel)));
    std::vector<std::thread> pool;
    for (size_t t = 1; t < n_threads; t++) {
        try {
            pool.emplace_back(worker);
        } catch (const std::system_error& e) {
            // Remaining partitions are drained by the threads already running
            cscope_log(fmt::format("thread spawn failed: {}", e.what()));
            break;
        }
    }
    worker();
    for (auto& th : pool) th.join();

    return Result<std::vector<PartitionResource>>::Ok(std::move(slots));
}

Result<std::vector<std::string>> SlurmProbe::partition_names() {
    auto lines = partition_lines();
    if (lines.is_err()) return Result<std::vector<std::string>>::Err(lines.kind, lines.error);
    std::vector<std::string> names;
    for (const auto& p : lines.value) names.push_back(p.name);
    return Result<std::vector<std::string>>::Ok(names);
}

Result<ResourceSet> SlurmProbe::resources(const std::string& partition_filter) {
    auto parts = list_partitions(partition_filter);
    if (parts.is_err()) return Result<ResourceSet>::Err(parts.kind, parts.error);
    return Result<ResourceSet>::Ok(ResourceSet::from_partitions(std::move(parts.value)));
}

Result<std::string> SlurmProbe::show_config() {
    std::vector<std::string> argv = {"scontrol", "show", "config"};
    auto r = runner_.run(argv, options_.timeout_ms);
    if (r.failed()) return command_error<std::string>(argv, r);
    return Result<std::string>::Ok(r.stdout_data);
}

Result<std::string> SlurmProbe::cluster_name() {
    auto cfg = show_config();
    if (cfg.is_err()) return cfg;
    auto name = parse_config_value(cfg.value, "ClusterName");
    if (name.empty()) {
        return Result<std::string>::Err(ErrorKind::MalformedProbeOutput,
                                        "ClusterName missing from scontrol show config");
    }
    return Result<std::string>::Ok(name);
}

Result<std::string> SlurmProbe::max_job_lifetime() {
    auto cfg = show_config();
    if (cfg.is_ok()) {
        auto v = parse_config_value(cfg.value, "MaxJobTime");
        if (!v.empty()) return Result<std::string>::Ok(v);
    }

    auto lines = partition_lines();
    if (lines.is_err()) return Result<std::string>::Err(lines.kind, lines.error);
    for (const auto& p : lines.value) {
        if (p.is_default && !p.max_time.empty()) return Result<std::string>::Ok(p.max_time);
    }
    return Result<std::string>::Err(ErrorKind::MalformedProbeOutput,
                                    "no MaxJobTime and no default partition MaxTime");
}
