#pragma once

#include <string>
#include <map>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

namespace YAML { class Node; }

struct ProbeConfig {
    int timeout_ms = 5000;
    int max_parallel = 8;
};

struct AwsConfig {
    bool metadata = true;                       // query instance metadata
    std::map<std::string, std::string> nccl;    // overrides for the NCCL settings
};

class Config {
public:
    // Load from $CSCOPE_CONFIG or ~/.cscope/config.yaml.  A missing file
    // gives the defaults; a malformed one is a ConfigError.
    static Result<Config> load();

    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> from_yaml(const std::string& text);

    // Accessors
    const ProbeConfig& probe() const { return probe_; }
    double memory_usage_percentage() const { return memory_usage_percentage_; }
    const std::string& log_file() const { return log_file_; }
    const AwsConfig& aws() const { return aws_; }
    const std::map<std::string, JobProfile>& job_types() const { return job_types_; }

    // nullptr if the type is unknown
    const JobProfile* find_job_type(const std::string& name) const;

public:
    Config();

private:
    ProbeConfig probe_;
    double memory_usage_percentage_;
    std::string log_file_;
    AwsConfig aws_;
    std::map<std::string, JobProfile> job_types_;

    static Result<Config> from_node(const YAML::Node& root);
};

// Job types available without any configuration
const std::vector<JobProfile>& builtin_job_types();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
