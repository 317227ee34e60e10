#include "environment.hpp"
#include "slurm_parser.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

static const char* DMI_DIR = "/sys/devices/virtual/dmi/id/";
static const char* HYPERVISOR_UUID = "/sys/hypervisor/uuid";
static const char* INFINIBAND_DIR = "/sys/class/infiniband";
static const char* IMDS_BASE = "http://169.254.169.254/latest";

SchedulerDetection detect_scheduler(CommandRunner& runner, int timeout_ms) {
    SchedulerDetection d;
    auto r = runner.run({"sinfo", "--version"}, timeout_ms);
    if (!r.success()) {
        cscope_log(fmt::format("no scheduler: sinfo exit={} timed_out={}",
                               r.exit_code, r.timed_out));
        return d;
    }
    d.present = true;
    d.version = parse_sinfo_version(r.stdout_data);
    return d;
}

std::optional<std::string> classify_cloud_identity(const std::map<std::string, std::string>& identity) {
    std::string all;
    for (const auto& [file, text] : identity) {
        all += to_lower(text);
        all += '\n';
    }

    auto uuid = identity.find("hypervisor_uuid");
    if (uuid != identity.end() && starts_with(to_lower(trimmed(uuid->second)), "ec2")) {
        return std::string("aws");
    }
    if (all.find("amazon") != std::string::npos || all.find("ec2") != std::string::npos) {
        return std::string("aws");
    }
    if (all.find("google") != std::string::npos) {
        return std::string("gcp");
    }
    if (all.find("microsoft corporation") != std::string::npos &&
        all.find("virtual machine") != std::string::npos) {
        return std::string("azure");
    }
    return std::nullopt;
}

// IMDSv2: fetch a session token, then the requested paths
static std::map<std::string, std::string> aws_metadata(CommandRunner& runner, int timeout_ms) {
    std::map<std::string, std::string> meta;
    std::string secs = std::to_string(METADATA_TIMEOUT_SECS);

    auto tok = runner.run({"curl", "-s", "-f", "-m", secs, "-X", "PUT",
                           fmt::format("{}/api/token", IMDS_BASE),
                           "-H", "X-aws-ec2-metadata-token-ttl-seconds: 60"},
                          timeout_ms);
    if (!tok.success() || trimmed(tok.stdout_data).empty()) {
        cscope_log("instance metadata token unavailable");
        return meta;
    }
    std::string header = "X-aws-ec2-metadata-token: " + trimmed(tok.stdout_data);

    const std::pair<const char*, const char*> fields[] = {
        {"instance_type", "meta-data/instance-type"},
        {"region", "meta-data/placement/region"},
    };
    for (const auto& [key, path] : fields) {
        auto r = runner.run({"curl", "-s", "-f", "-m", secs, "-H", header,
                             fmt::format("{}/{}", IMDS_BASE, path)},
                            timeout_ms);
        if (r.success() && !trimmed(r.stdout_data).empty()) {
            meta[key] = trimmed(r.stdout_data);
        }
    }
    return meta;
}

CloudDetection detect_cloud_provider(FileReader& files, CommandRunner& runner,
                                     const DetectOptions& options) {
    CloudDetection d;

    std::map<std::string, std::string> identity;
    for (const char* name : {"sys_vendor", "bios_vendor", "bios_version",
                             "product_version", "product_name"}) {
        if (auto text = files.read(std::string(DMI_DIR) + name)) identity[name] = *text;
    }
    if (auto uuid = files.read(HYPERVISOR_UUID)) identity["hypervisor_uuid"] = *uuid;

    d.provider = classify_cloud_identity(identity);
    cscope_log(fmt::format("cloud provider: {}", d.provider.value_or("none")));

    for (const auto& dev : files.list_dir(INFINIBAND_DIR)) {
        if (contains_ci(dev, "efa")) {
            d.efa_present = true;
            break;
        }
    }

    if (d.provider && *d.provider == "aws" && options.query_metadata) {
        d.metadata = aws_metadata(runner, options.timeout_ms);
    }
    return d;
}

ClusterEnvironment detect_environment(FileReader& files, CommandRunner& runner,
                                      const DetectOptions& options) {
    ClusterEnvironment env;
    auto sched = detect_scheduler(runner, options.timeout_ms);
    env.scheduler_present = sched.present;
    env.scheduler_version = sched.version;

    auto cloud = detect_cloud_provider(files, runner, options);
    env.cloud_provider = cloud.provider;
    env.cloud_metadata = cloud.metadata;
    env.efa_present = cloud.efa_present;
    return env;
}

std::map<std::string, std::string> nccl_settings(const ClusterEnvironment& env,
                                                 const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> s;
    if (!env.is_aws()) return s;

    s["FI_PROVIDER"] = "efa";
    s["FI_EFA_USE_DEVICE_RDMA"] = "1";
    s["FI_EFA_FORK_SAFE"] = "1";
    s["NCCL_PROTO"] = "simple";
    s["NCCL_SOCKET_IFNAME"] = "^docker,lo,veth";
    s["NCCL_DEBUG"] = "WARN";
    if (!env.efa_present) {
        // GPUDirect RDMA needs an EFA device
        s.erase("FI_EFA_USE_DEVICE_RDMA");
    }
    for (const auto& [k, v] : overrides) s[k] = v;
    return s;
}
