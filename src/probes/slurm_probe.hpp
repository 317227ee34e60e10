#pragma once

#include "resource_probe.hpp"
#include "command_runner.hpp"
#include "slurm_parser.hpp"
#include <string>
#include <vector>

// Reads partitions and their nodes through scontrol.
class SlurmProbe : public ResourceProbe {
public:
    SlurmProbe(CommandRunner& runner, ProbeOptions options);

    Result<ResourceSet> resources(const std::string& partition_filter) override;
    const char* name() const override { return "slurm"; }

    // Partitions in scheduler order.  Node details are fetched concurrently,
    // at most options.max_parallel queries at a time.  An unmatched filter
    // gives an empty list.  Errors: SchedulerUnavailable, ProbeTimeout.
    Result<std::vector<PartitionResource>> list_partitions(const std::string& filter = "");

    // Partition names only, without querying nodes.
    Result<std::vector<std::string>> partition_names();

    // ClusterName from `scontrol show config`.
    Result<std::string> cluster_name();

    // MaxJobTime from the config, else MaxTime of the default partition.
    Result<std::string> max_job_lifetime();

private:
    Result<std::vector<PartitionLine>> partition_lines();
    Result<std::string> show_config();

    CommandRunner& runner_;
    ProbeOptions options_;
};
