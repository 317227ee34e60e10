#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <cstdint>

// Failure categories surfaced by probes and generators
enum class ErrorKind {
    None,
    Generic,
    SchedulerUnavailable,
    MalformedProbeOutput,
    PartitionNotFound,
    NoSuitablePartition,
    ProbeTimeout,
    InvalidArgument,
    ConfigError,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::Generic};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::Generic};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// External command execution result
struct CommandResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;

    bool success() const { return exit_code == 0 && !timed_out; }
    bool failed() const { return !success(); }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// ── Resource records ────────────────────────────────────────

// GPUs of one model attached to a single node
struct GpuCount {
    std::string model;      // normalized generation, e.g. "H100", "MI300X"
    int count = 0;
};

// Resources of the local machine when no scheduler is present
struct NodeResource {
    int cpu_count = 0;
    int64_t mem_total_mb = 0;
    std::vector<GpuCount> gpus;

    int gpu_count() const;
};

// Aggregate capacity of one scheduler partition.  Per-node figures are taken
// from the largest node in the partition.
struct PartitionResource {
    std::string name;
    int cpu_count = 0;
    int64_t mem_total_mb = 0;
    std::vector<GpuCount> gpus;     // largest count seen per model, for inventory
    int gpus_per_node = 0;          // largest total on any single node
    int node_count = 0;
    int available_nodes = 0;
    std::string state;          // "UP", "DOWN", "DRAIN", "INACTIVE"
    bool is_default = false;

    int gpu_count() const;
};

enum class ResourceScope { Partitions, LocalNode };

// Outcome of a resource query: either the partition list or the local node,
// never both.
class ResourceSet {
public:
    // An empty local node
    ResourceSet() = default;

    static ResourceSet from_partitions(std::vector<PartitionResource> partitions);
    static ResourceSet from_node(NodeResource node);

    ResourceScope scope() const { return scope_; }
    bool is_partitioned() const { return scope_ == ResourceScope::Partitions; }

    const std::vector<PartitionResource>& partitions() const { return partitions_; }
    const NodeResource& node() const { return node_; }

private:
    ResourceScope scope_ = ResourceScope::LocalNode;
    std::vector<PartitionResource> partitions_;
    NodeResource node_;
};

// What was detected about the host at startup.  Computed once per invocation
// and handed to everything that needs it.
struct ClusterEnvironment {
    bool scheduler_present = false;
    std::string scheduler_version;                  // "23.02.7", empty if absent
    std::optional<std::string> cloud_provider;      // "aws", "gcp", "azure"
    std::map<std::string, std::string> cloud_metadata;
    bool efa_present = false;

    bool is_aws() const { return cloud_provider && *cloud_provider == "aws"; }
};

// ── Job generation ──────────────────────────────────────────

// Resource floor and GPU defaults for one job type (task, array, training...)
struct JobProfile {
    std::string name;
    std::string mode = "task";      // "task" or "array"
    std::optional<int> gpus;        // per node in task mode, per task in array mode
    int min_cpus = 1;
    int64_t min_memory_mb = 1024;
    int tasks_per_node = 1;
};

// Recommended request produced by job-gen
struct JobRequest {
    std::string job_type;
    std::string mode = "task";
    std::string partition;          // empty when running without a scheduler
    int nodes = 1;
    int tasks_per_node = 1;
    int cpus_per_task = 1;
    int gpus_per_task = 0;
    int64_t memory_mb = 0;          // per node, as --mem takes it
    std::string memory;             // Slurm form, e.g. "256G"

    int gpus_per_node() const { return gpus_per_task * tasks_per_node; }
};
