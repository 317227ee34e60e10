#pragma once

#include <string>
#include <map>
#include <core/types.hpp>

// GPU models visible in a resource query
struct GpuInventory {
    std::string vendor = "none";        // "nvidia", "amd" or "none"
    std::map<std::string, int> models;  // model -> GPUs per node (largest seen)

    bool empty() const { return models.empty(); }
};

// Build the inventory from partitions or the local node.  The vendor is the
// one with the most GPUs per node summed over models (nvidia on a tie).
GpuInventory list_gpus(const ResourceSet& resources);

// Case-insensitive exact match on the normalized model name:
// "a100" matches "A100", "A10" does not.
bool has_gpu(const GpuInventory& inventory, const std::string& model);
