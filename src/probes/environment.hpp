#pragma once

#include <string>
#include <map>
#include <optional>
#include <core/types.hpp>
#include "command_runner.hpp"
#include "file_reader.hpp"

// Host detection.  Runs once per invocation; never throws, and anything that
// cannot be determined is reported as absent.

struct SchedulerDetection {
    bool present = false;
    std::string version;
};

struct CloudDetection {
    std::optional<std::string> provider;
    std::map<std::string, std::string> metadata;
    bool efa_present = false;
};

struct DetectOptions {
    int timeout_ms = 5000;
    bool query_metadata = true;   // AWS instance metadata through curl
};

// `sinfo --version` exiting 0 within the timeout means Slurm is usable.
SchedulerDetection detect_scheduler(CommandRunner& runner, int timeout_ms);

// Cloud provider from DMI identity files and /sys/hypervisor/uuid.
CloudDetection detect_cloud_provider(FileReader& files, CommandRunner& runner,
                                     const DetectOptions& options);

// Both of the above folded into one value.
ClusterEnvironment detect_environment(FileReader& files, CommandRunner& runner,
                                      const DetectOptions& options);

// Classify DMI/hypervisor text.  Exposed for tests.
std::optional<std::string> classify_cloud_identity(const std::map<std::string, std::string>& identity);

// NCCL/libfabric environment recommended for this host; empty off AWS.
// Overrides replace or extend the defaults.
std::map<std::string, std::string> nccl_settings(const ClusterEnvironment& env,
                                                 const std::map<std::string, std::string>& overrides);
