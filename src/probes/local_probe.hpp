#pragma once

#include "resource_probe.hpp"
#include "command_runner.hpp"
#include "file_reader.hpp"

// Describes the machine cscope runs on.  Every field degrades to zero/empty
// when its source is unavailable.
class LocalProbe : public ResourceProbe {
public:
    LocalProbe(CommandRunner& runner, FileReader& files, ProbeOptions options);

    // The filter does not apply to a single node and is ignored.
    Result<ResourceSet> resources(const std::string& partition_filter) override;
    const char* name() const override { return "local"; }

    NodeResource local_resources();

    int cpu_count();
    int64_t mem_total_mb();
    std::vector<GpuCount> gpus();

private:
    CommandRunner& runner_;
    FileReader& files_;
    ProbeOptions options_;
};

// MemTotal from /proc/meminfo contents, in MB.  0 if absent.
int64_t parse_meminfo_total_mb(const std::string& meminfo);

// Model counts from `nvidia-smi --query-gpu=name --format=csv,noheader`.
std::vector<GpuCount> parse_nvidia_smi_names(const std::string& output);

// Model counts from `rocm-smi --showproductname`.
std::vector<GpuCount> parse_rocm_smi_products(const std::string& output);
