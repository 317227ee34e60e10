#include "cluster_service.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

ClusterService::ClusterService(const ClusterEnvironment& env, SlurmProbe* slurm,
                               ResourceProbe& local)
    : env_(env), slurm_(slurm), local_(local) {}

Result<ResourceSet> ClusterService::resources(const std::string& partition_filter) {
    if (env_.scheduler_present && slurm_) {
        auto r = slurm_->resources(partition_filter);
        if (r.is_ok()) return r;
        cscope_log(fmt::format("{} query failed ({}: {}), using {} probe",
                               slurm_->name(), error_kind_name(r.kind), r.error, local_.name()));
    }

    auto local = local_.resources(partition_filter);
    if (local.is_err()) {
        return Result<ResourceSet>::Err(local.kind,
            fmt::format("No cluster information available: {}", local.error));
    }
    return local;
}

Result<GpuInventory> ClusterService::gpu_inventory(const std::string& partition_filter) {
    auto r = resources(partition_filter);
    if (r.is_err()) return Result<GpuInventory>::Err(r.kind, r.error);
    return Result<GpuInventory>::Ok(list_gpus(r.value));
}

ClusterSummary ClusterService::summary() {
    ClusterSummary s;
    s.cluster_name = LOCAL_CLUSTER_NAME;
    s.slurm_version = NO_SLURM_VERSION;
    s.cloud_provider = env_.cloud_provider;

    if (!env_.scheduler_present || !slurm_) return s;

    s.scheduler_present = true;
    s.slurm_version = env_.scheduler_version.empty() ? "unknown" : env_.scheduler_version;

    auto name = slurm_->cluster_name();
    if (name.is_ok()) s.cluster_name = name.value;
    else cscope_log("cluster name unavailable: " + name.error);

    auto lifetime = slurm_->max_job_lifetime();
    if (lifetime.is_ok()) s.max_job_lifetime = lifetime.value;
    else cscope_log("max job lifetime unavailable: " + lifetime.error);

    auto parts = slurm_->partition_names();
    if (parts.is_ok()) {
        s.partitions = parts.value;
    } else {
        cscope_log("partition list unavailable: " + parts.error);
    }
    return s;
}
