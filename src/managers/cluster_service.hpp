#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <probes/resource_probe.hpp>
#include <probes/slurm_probe.hpp>
#include "gpu_inventory.hpp"

// Data for `cscope info`
struct ClusterSummary {
    std::string cluster_name;
    std::string slurm_version;
    std::optional<std::string> max_job_lifetime;   // scheduler only
    std::vector<std::string> partitions;           // scheduler only
    std::optional<std::string> cloud_provider;
    bool scheduler_present = false;
};

// Turns probe output into one ResourceSet per query.  With a scheduler the
// partitions are used; when the scheduler cannot be reached (or times out)
// the local node is reported instead.
class ClusterService {
public:
    // slurm may be null when the scheduler is absent.
    ClusterService(const ClusterEnvironment& env, SlurmProbe* slurm, ResourceProbe& local);

    // Exactly one of partitions or node.  Fails only when neither the
    // scheduler nor the local machine yields anything.
    Result<ResourceSet> resources(const std::string& partition_filter = "");

    Result<GpuInventory> gpu_inventory(const std::string& partition_filter = "");

    ClusterSummary summary();

    const ClusterEnvironment& environment() const { return env_; }

private:
    ClusterEnvironment env_;
    SlurmProbe* slurm_;
    ResourceProbe& local_;
};
