#include "config.hpp"
#include "constants.hpp"
#include "resource_spec.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

const std::vector<JobProfile>& builtin_job_types() {
    static const std::vector<JobProfile> profiles = {
        // name        mode     gpus          cpus  memory MB           tasks
        {"task",      "task",  std::nullopt,  1,    1 * MB_PER_GB,      1},
        {"array",     "array", std::nullopt,  1,    1 * MB_PER_GB,      1},
        {"cpu",       "task",  0,             4,    8 * MB_PER_GB,      1},
        {"gpu",       "task",  1,             4,    16 * MB_PER_GB,     1},
        {"training",  "task",  8,             32,   256 * MB_PER_GB,    1},
        {"inference", "task",  1,             8,    32 * MB_PER_GB,     1},
    };
    return profiles;
}

Config::Config()
    : memory_usage_percentage_(DEFAULT_MEMORY_USAGE_PERCENTAGE) {
    probe_.timeout_ms = PROBE_TIMEOUT_MS;
    probe_.max_parallel = DEFAULT_MAX_PARALLEL;
    for (const auto& p : builtin_job_types()) job_types_[p.name] = p;
}

const JobProfile* Config::find_job_type(const std::string& name) const {
    auto it = job_types_.find(name);
    return it == job_types_.end() ? nullptr : &it->second;
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".cscope";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

static Result<JobProfile> parse_job_profile(const std::string& name, const YAML::Node& node,
                                            const JobProfile& base) {
    JobProfile p = base;
    p.name = name;
    p.mode = node["mode"].as<std::string>(p.mode);
    if (p.mode != "task" && p.mode != "array") {
        return Result<JobProfile>::Err(ErrorKind::ConfigError,
            fmt::format("job_types.{}.mode must be 'task' or 'array', got '{}'", name, p.mode));
    }

    if (node["gpus"]) {
        int gpus = node["gpus"].as<int>();
        if (gpus < 0) {
            return Result<JobProfile>::Err(ErrorKind::ConfigError,
                fmt::format("job_types.{}.gpus must be >= 0", name));
        }
        p.gpus = gpus;
    }

    p.min_cpus = node["min_cpus"].as<int>(p.min_cpus);
    if (p.min_cpus < 1) {
        return Result<JobProfile>::Err(ErrorKind::ConfigError,
            fmt::format("job_types.{}.min_cpus must be >= 1", name));
    }

    if (node["min_memory"]) {
        int64_t mb = parse_memory_mb(node["min_memory"].as<std::string>());
        if (mb <= 0) {
            return Result<JobProfile>::Err(ErrorKind::ConfigError,
                fmt::format("job_types.{}.min_memory '{}' is not a memory size",
                            name, node["min_memory"].as<std::string>()));
        }
        p.min_memory_mb = mb;
    }

    p.tasks_per_node = node["tasks_per_node"].as<int>(p.tasks_per_node);
    if (p.tasks_per_node < 1) {
        return Result<JobProfile>::Err(ErrorKind::ConfigError,
            fmt::format("job_types.{}.tasks_per_node must be >= 1", name));
    }
    return Result<JobProfile>::Ok(p);
}

Result<Config> Config::from_node(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) return Result<Config>::Ok(config);
    if (!root.IsMap()) {
        return Result<Config>::Err(ErrorKind::ConfigError, "config root must be a mapping");
    }

    if (root["probe"]) {
        const auto& probe = root["probe"];
        config.probe_.timeout_ms = probe["timeout_ms"].as<int>(config.probe_.timeout_ms);
        config.probe_.max_parallel = probe["max_parallel"].as<int>(config.probe_.max_parallel);
        if (config.probe_.timeout_ms <= 0) {
            return Result<Config>::Err(ErrorKind::ConfigError, "probe.timeout_ms must be > 0");
        }
        if (config.probe_.max_parallel < 1 || config.probe_.max_parallel > MAX_TRACKED_CHILDREN) {
            return Result<Config>::Err(ErrorKind::ConfigError,
                fmt::format("probe.max_parallel must be between 1 and {}", MAX_TRACKED_CHILDREN));
        }
    }

    if (root["memory"]) {
        double pct = root["memory"]["usage_percentage"].as<double>(config.memory_usage_percentage_);
        if (pct < 1.0 || pct > 100.0) {
            return Result<Config>::Err(ErrorKind::ConfigError,
                fmt::format("memory.usage_percentage must be between 1 and 100, got {}", pct));
        }
        config.memory_usage_percentage_ = pct;
    }

    config.log_file_ = root["log_file"].as<std::string>("");

    if (root["aws"]) {
        const auto& aws = root["aws"];
        config.aws_.metadata = aws["metadata"].as<bool>(true);
        if (aws["nccl"] && aws["nccl"].IsMap()) {
            for (const auto& kv : aws["nccl"]) {
                config.aws_.nccl[kv.first.as<std::string>()] = kv.second.as<std::string>("");
            }
        }
    }

    if (root["job_types"]) {
        if (!root["job_types"].IsMap()) {
            return Result<Config>::Err(ErrorKind::ConfigError, "job_types must be a mapping");
        }
        for (const auto& kv : root["job_types"]) {
            std::string name = kv.first.as<std::string>();
            // Entries for a built-in type only override the keys they set
            JobProfile base;
            auto existing = config.job_types_.find(name);
            if (existing != config.job_types_.end()) base = existing->second;

            auto parsed = parse_job_profile(name, kv.second, base);
            if (parsed.is_err()) return Result<Config>::Err(parsed.kind, parsed.error);
            config.job_types_[name] = parsed.value;
        }
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::from_yaml(const std::string& text) {
    try {
        return from_node(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigError,
                                   "Failed to parse config: " + std::string(e.what()));
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config());
    }
    try {
        return from_node(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigError,
            fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

Result<Config> Config::load() {
    if (auto env_path = platform::get_env("CSCOPE_CONFIG")) {
        if (!env_path->empty()) {
            if (!fs::exists(*env_path)) {
                return Result<Config>::Err(ErrorKind::ConfigError,
                    fmt::format("CSCOPE_CONFIG points to missing file {}", *env_path));
            }
            return load_file(*env_path);
        }
    }
    return load_file(get_global_config_path());
}
