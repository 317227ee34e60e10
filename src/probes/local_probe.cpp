#include "local_probe.hpp"
#include "gpu_names.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <thread>
#include <unistd.h>

LocalProbe::LocalProbe(CommandRunner& runner, FileReader& files, ProbeOptions options)
    : runner_(runner), files_(files), options_(options) {}

static void add_gpu(std::vector<GpuCount>& gpus, const std::string& model) {
    if (model.empty()) return;
    auto it = std::find_if(gpus.begin(), gpus.end(),
                           [&](const GpuCount& g) { return g.model == model; });
    if (it != gpus.end()) it->count++;
    else gpus.push_back({model, 1});
}

int64_t parse_meminfo_total_mb(const std::string& meminfo) {
    for (const auto& line : split_lines(meminfo)) {
        if (!starts_with(line, "MemTotal:")) continue;
        auto toks = split_whitespace(line);
        if (toks.size() < 2) return 0;
        return safe_stoll(toks[1]) / 1024;   // kB
    }
    return 0;
}

std::vector<GpuCount> parse_nvidia_smi_names(const std::string& output) {
    std::vector<GpuCount> gpus;
    for (const auto& line : split_lines(output)) {
        add_gpu(gpus, normalize_gpu_name(line));
    }
    return gpus;
}

std::vector<GpuCount> parse_rocm_smi_products(const std::string& output) {
    // GPU[0]		: Card Series: 		AMD Instinct MI300X OAM
    std::vector<GpuCount> gpus;
    for (const auto& line : split_lines(output)) {
        if (!contains_ci(line, "card series")) continue;
        auto colon = line.rfind(':');
        if (colon == std::string::npos) continue;
        add_gpu(gpus, normalize_gpu_name(line.substr(colon + 1)));
    }
    return gpus;
}

int LocalProbe::cpu_count() {
    long n = sysconf(_SC_NPROCESSORS_ONLN);
    if (n > 0) return static_cast<int>(n);
    return static_cast<int>(std::thread::hardware_concurrency());
}

int64_t LocalProbe::mem_total_mb() {
    if (auto meminfo = files_.read("/proc/meminfo")) {
        int64_t mb = parse_meminfo_total_mb(*meminfo);
        if (mb > 0) return mb;
    }
    // macOS
    auto r = runner_.run({"sysctl", "-n", "hw.memsize"}, options_.timeout_ms);
    if (r.success()) {
        int64_t bytes = safe_stoll(trimmed(r.stdout_data));
        if (bytes > 0) return bytes / (1024 * 1024);
    }
    cscope_log("local memory size unavailable");
    return 0;
}

std::vector<GpuCount> LocalProbe::gpus() {
    auto nv = runner_.run({"nvidia-smi", "--query-gpu=name", "--format=csv,noheader"},
                          options_.timeout_ms);
    if (nv.success()) {
        auto found = parse_nvidia_smi_names(nv.stdout_data);
        if (!found.empty()) return found;
    }
    auto amd = runner_.run({"rocm-smi", "--showproductname"}, options_.timeout_ms);
    if (amd.success()) return parse_rocm_smi_products(amd.stdout_data);
    return {};
}

NodeResource LocalProbe::local_resources() {
    NodeResource node;
    node.cpu_count = cpu_count();
    node.mem_total_mb = mem_total_mb();
    node.gpus = gpus();
    cscope_log(fmt::format("local node: cpus={} mem_mb={} gpus={}",
                           node.cpu_count, node.mem_total_mb, node.gpu_count()));
    return node;
}

Result<ResourceSet> LocalProbe::resources(const std::string& partition_filter) {
    if (!partition_filter.empty()) {
        cscope_log(fmt::format("no scheduler: ignoring partition filter '{}'", partition_filter));
    }
    auto node = local_resources();
    if (node.cpu_count <= 0 && node.mem_total_mb <= 0) {
        return Result<ResourceSet>::Err("could not read CPU or memory information for this host");
    }
    return Result<ResourceSet>::Ok(ResourceSet::from_node(std::move(node)));
}
