#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

// Command-line knobs for job-gen
struct JobGenOptions {
    std::optional<int> num_gpus;            // GPUs per node (task mode)
    std::optional<int> num_gpus_per_task;   // GPUs per task (array mode)
    std::optional<int> num_tasks_per_node;
    std::optional<int> num_cpus;            // CPU-only jobs
    std::string partition;                  // explicit partition, empty = choose
};

// Per-task demand once the profile and options are combined
struct JobDemand {
    int gpus_per_task = 0;
    int tasks_per_node = 1;
    int min_cpus = 1;
    int64_t min_memory_mb = 0;

    int gpus_per_node() const { return gpus_per_task * tasks_per_node; }
};

// A partition (or the local node) job-gen may place work on
struct Candidate {
    std::string partition;      // empty for the local node
    int cpu_count = 0;
    int64_t mem_total_mb = 0;
    int gpu_count = 0;
    int node_count = 1;
    int available_nodes = 1;
    std::string state = "UP";
};

std::vector<Candidate> candidates_from(const ResourceSet& resources);

// Validate the options against the profile.  Errors are InvalidArgument.
Result<JobDemand> resolve_demand(const JobProfile& profile, const JobGenOptions& options);

// Selection rules:
//   1. State must be UP (the local node always qualifies)
//   2. gpu_count >= gpus_per_task * tasks_per_node
//   3. cpu_count >= min_cpus and mem_total_mb >= min_memory
//   4. Prefer candidates with available nodes
//   5. Among ties, waste the fewest GPUs, then prefer more nodes
// Returns nullptr when nothing qualifies.
const Candidate* select_candidate(const std::vector<Candidate>& candidates, const JobDemand& demand);

// Size a request on the chosen candidate.  GPU jobs get the node's CPUs and
// memory in proportion to the GPUs they take; CPU jobs get the profile floor.
JobRequest shape_request(const Candidate& c, const JobProfile& profile, const JobDemand& demand);

// Full pipeline.  Errors: InvalidArgument, PartitionNotFound,
// NoSuitablePartition.
Result<JobRequest> generate_job_request(const ResourceSet& resources,
                                        const JobProfile& profile,
                                        const JobGenOptions& options);

// Output formats: "json", "sbatch", "srun", "submitit".
bool is_job_format(const std::string& format);
std::string format_job_request(const JobRequest& req, const std::string& format);
