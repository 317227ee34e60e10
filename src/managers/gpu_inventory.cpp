#include "gpu_inventory.hpp"
#include <probes/gpu_names.hpp>
#include <core/utils.hpp>
#include <algorithm>

static void merge_gpus(std::map<std::string, int>& models, const std::vector<GpuCount>& gpus) {
    for (const auto& g : gpus) {
        if (g.model.empty() || g.count <= 0) continue;
        auto& slot = models[g.model];
        slot = std::max(slot, g.count);
    }
}

GpuInventory list_gpus(const ResourceSet& resources) {
    GpuInventory inv;
    if (resources.is_partitioned()) {
        for (const auto& p : resources.partitions()) merge_gpus(inv.models, p.gpus);
    } else {
        merge_gpus(inv.models, resources.node().gpus);
    }

    int nvidia = 0, amd = 0;
    for (const auto& [model, count] : inv.models) {
        if (gpu_vendor_for_model(model) == "amd") amd += count;
        else nvidia += count;
    }
    if (nvidia == 0 && amd == 0) inv.vendor = "none";
    else inv.vendor = amd > nvidia ? "amd" : "nvidia";
    return inv;
}

bool has_gpu(const GpuInventory& inventory, const std::string& model) {
    std::string wanted = to_upper(trimmed(model));
    if (wanted.empty()) return false;
    std::string normalized = normalize_gpu_name(model);
    for (const auto& [name, count] : inventory.models) {
        std::string have = to_upper(name);
        if (have == wanted || have == normalized) return true;
    }
    return false;
}
