#include "formatter.hpp"
#include <core/constants.hpp>
#include <core/resource_spec.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

std::string format_cpus(const ResourceSet& resources) {
    std::string out = "CPU information:\n";
    if (!resources.is_partitioned()) {
        return out + fmt::format("cpu_count: {}\n", resources.node().cpu_count);
    }
    for (const auto& p : resources.partitions()) {
        out += fmt::format("partition: {}, cpu_count: {}\n", p.name, p.cpu_count);
    }
    return out;
}

static std::string mem_fields(int64_t total_mb, bool detailed, double pct) {
    std::string s = fmt::format("mem_total_MB: {}, mem_total_GB: {}", total_mb, mb_to_gb(total_mb));
    if (detailed) {
        int64_t avail = available_memory_mb(total_mb, pct);
        s += fmt::format(", mem_available_MB: {}, mem_available_GB: {}", avail, mb_to_gb(avail));
    }
    return s;
}

std::string format_mem(const ResourceSet& resources, bool detailed, double usage_percentage) {
    std::string out = "Mem information:\n";
    if (!resources.is_partitioned()) {
        return out + mem_fields(resources.node().mem_total_mb, detailed, usage_percentage) + "\n";
    }
    for (const auto& p : resources.partitions()) {
        out += fmt::format("partition: {}, {}\n", p.name,
                           mem_fields(p.mem_total_mb, detailed, usage_percentage));
    }
    return out;
}

std::string format_gpus(const GpuInventory& inventory, GpuView view) {
    switch (view) {
    case GpuView::Vendor:
        return fmt::format("Primary GPU vendor: {}\n", inventory.vendor);

    case GpuView::Counts: {
        if (inventory.empty()) return "No GPUs found\n";
        std::string out = "GPU counts by type:\n";
        for (const auto& [model, count] : inventory.models) {
            out += fmt::format("  {}: {}\n", model, count);
        }
        return out;
    }

    case GpuView::Generations: {
        if (inventory.empty()) return "No GPUs found\n";
        std::string out = "GPU generations available:\n";
        for (const auto& [model, count] : inventory.models) {
            out += fmt::format("- {}\n", model);
        }
        return out;
    }

    case GpuView::Default:
        break;
    }

    std::string out = fmt::format("GPU vendor: {}\n", inventory.vendor);
    if (inventory.empty()) return out + "No GPUs found\n";
    out += "GPU information:\n";
    for (const auto& [model, count] : inventory.models) {
        out += fmt::format("  {}: {}\n", model, count);
    }
    return out;
}

std::string format_check_gpu(const std::string& model, bool available) {
    if (available) return fmt::format("GPU type {} is available in the cluster.\n", model);
    return fmt::format("GPU type {} is NOT available in the cluster.\n", model);
}

std::string format_info(const ClusterSummary& s) {
    std::string out;
    out += fmt::format("Cluster Name: {}\n", s.cluster_name);
    out += fmt::format("Slurm Version: {}\n", s.slurm_version);
    if (s.scheduler_present) {
        out += fmt::format("Max Job Lifetime: {}\n", s.max_job_lifetime.value_or("unknown"));
        out += fmt::format("Partitions: {}\n", fmt::join(s.partitions, ", "));
    }
    out += fmt::format("Cloud Provider: {}\n", s.cloud_provider.value_or("none"));
    return out;
}

std::string format_aws(bool is_aws, const std::map<std::string, std::string>& nccl) {
    if (!is_aws) return "This is NOT an AWS cluster.\n";
    nlohmann::json settings(nccl);
    return "This is an AWS cluster.\n\nRecommended NCCL settings:\n" + settings.dump(2) + "\n";
}

std::string format_job_info(const JobInfo& info) {
    std::string out;
    out += fmt::format("job_id: {}\n", info.job_id);
    out += fmt::format("job_name: {}\n", info.job_name);
    out += fmt::format("global_rank: {}\n", info.global_rank);
    out += fmt::format("local_rank: {}\n", info.local_rank);
    out += fmt::format("world_size: {}\n", info.world_size);
    out += fmt::format("local_world_size: {}\n", info.local_world_size);
    out += fmt::format("master_addr: {}\n", info.master_addr);
    out += fmt::format("master_port: {}\n", info.master_port);
    out += fmt::format("is_rank_zero: {}\n", info.is_rank_zero());
    return out;
}

std::string format_job_info_exports(const JobInfo& info) {
    std::string out;
    for (const auto& [key, value] : torch_distributed_env(info)) {
        out += fmt::format("export {}={}\n", key, value);
    }
    return out;
}

std::string format_version() {
    return fmt::format("cscope version {}\n", CSCOPE_VERSION);
}
