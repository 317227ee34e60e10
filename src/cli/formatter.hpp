#pragma once

#include <string>
#include <map>
#include <core/types.hpp>
#include <managers/gpu_inventory.hpp>
#include <managers/cluster_service.hpp>
#include <managers/job_info.hpp>

// Text for each subcommand.  Pure: no I/O, fixed field order, integers
// without locale separators.  Every line ends in '\n'.

std::string format_cpus(const ResourceSet& resources);

// detailed adds mem_available_* at usage_percentage of the total.
std::string format_mem(const ResourceSet& resources, bool detailed, double usage_percentage);

enum class GpuView { Default, Vendor, Counts, Generations };
std::string format_gpus(const GpuInventory& inventory, GpuView view);

std::string format_check_gpu(const std::string& model, bool available);

std::string format_info(const ClusterSummary& summary);

// nccl is only printed for AWS hosts.
std::string format_aws(bool is_aws, const std::map<std::string, std::string>& nccl);

std::string format_job_info(const JobInfo& info);
std::string format_job_info_exports(const JobInfo& info);

std::string format_version();
