#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "None";
        case ErrorKind::Generic:              return "Error";
        case ErrorKind::SchedulerUnavailable: return "SchedulerUnavailable";
        case ErrorKind::MalformedProbeOutput: return "MalformedProbeOutput";
        case ErrorKind::PartitionNotFound:    return "PartitionNotFound";
        case ErrorKind::NoSuitablePartition:  return "NoSuitablePartition";
        case ErrorKind::ProbeTimeout:         return "ProbeTimeout";
        case ErrorKind::InvalidArgument:      return "InvalidArgument";
        case ErrorKind::ConfigError:          return "ConfigError";
    }
    return "Error";
}

static int sum_gpus(const std::vector<GpuCount>& gpus) {
    int total = 0;
    for (const auto& g : gpus) total += g.count;
    return total;
}

int NodeResource::gpu_count() const {
    return sum_gpus(gpus);
}

int PartitionResource::gpu_count() const {
    return gpus_per_node;
}

ResourceSet ResourceSet::from_partitions(std::vector<PartitionResource> partitions) {
    ResourceSet set;
    set.scope_ = ResourceScope::Partitions;
    set.partitions_ = std::move(partitions);
    return set;
}

ResourceSet ResourceSet::from_node(NodeResource node) {
    ResourceSet set;
    set.scope_ = ResourceScope::LocalNode;
    set.node_ = std::move(node);
    return set;
}
