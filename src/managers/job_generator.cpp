#include "job_generator.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/resource_spec.hpp>
#include <core/utils.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <algorithm>

using json = nlohmann::json;

std::vector<Candidate> candidates_from(const ResourceSet& resources) {
    std::vector<Candidate> out;
    if (!resources.is_partitioned()) {
        const auto& n = resources.node();
        Candidate c;
        c.cpu_count = n.cpu_count;
        c.mem_total_mb = n.mem_total_mb;
        c.gpu_count = n.gpu_count();
        out.push_back(c);
        return out;
    }
    for (const auto& p : resources.partitions()) {
        Candidate c;
        c.partition = p.name;
        c.cpu_count = p.cpu_count;
        c.mem_total_mb = p.mem_total_mb;
        c.gpu_count = p.gpu_count();
        c.node_count = p.node_count;
        c.available_nodes = p.available_nodes;
        c.state = p.state;
        out.push_back(c);
    }
    return out;
}

Result<JobDemand> resolve_demand(const JobProfile& profile, const JobGenOptions& options) {
    JobDemand d;
    d.min_cpus = profile.min_cpus;
    d.min_memory_mb = profile.min_memory_mb;
    d.tasks_per_node = options.num_tasks_per_node.value_or(profile.tasks_per_node);
    if (d.tasks_per_node < 1) {
        return Result<JobDemand>::Err(ErrorKind::InvalidArgument, "--num-tasks-per-node must be >= 1");
    }

    if (profile.mode == "array") {
        auto gpus = options.num_gpus_per_task ? options.num_gpus_per_task : profile.gpus;
        if (!gpus) {
            return Result<JobDemand>::Err(ErrorKind::InvalidArgument,
                                          "Must specify --num-gpus-per-task for array jobs");
        }
        if (*gpus < 0) {
            return Result<JobDemand>::Err(ErrorKind::InvalidArgument, "--num-gpus-per-task must be >= 0");
        }
        d.gpus_per_task = *gpus;
    } else {
        auto gpus = options.num_gpus ? options.num_gpus : profile.gpus;
        if (!gpus) {
            return Result<JobDemand>::Err(ErrorKind::InvalidArgument,
                                          "Must specify --num-gpus for task jobs");
        }
        if (*gpus < 0) {
            return Result<JobDemand>::Err(ErrorKind::InvalidArgument, "--num-gpus must be >= 0");
        }
        if (*gpus % d.tasks_per_node != 0) {
            return Result<JobDemand>::Err(ErrorKind::InvalidArgument,
                fmt::format("--num-gpus ({}) must be divisible by --num-tasks-per-node ({})",
                            *gpus, d.tasks_per_node));
        }
        d.gpus_per_task = *gpus / d.tasks_per_node;
    }

    if (options.num_cpus) {
        if (*options.num_cpus < 1) {
            return Result<JobDemand>::Err(ErrorKind::InvalidArgument, "--num-cpus must be >= 1");
        }
        if (d.gpus_per_task > 0) {
            return Result<JobDemand>::Err(ErrorKind::InvalidArgument,
                "--num-cpus applies to CPU-only jobs; GPU jobs get CPUs in proportion to their GPUs");
        }
        d.min_cpus = *options.num_cpus;
    }
    return Result<JobDemand>::Ok(d);
}

static bool qualifies(const Candidate& c, const JobDemand& d) {
    if (!c.partition.empty() && to_upper(c.state) != "UP") {
        cscope_log(fmt::format("  skip {} (state {})", c.partition, c.state));
        return false;
    }
    if (c.gpu_count < d.gpus_per_node()) {
        cscope_log(fmt::format("  skip {} (only {} gpus, need {})",
                               c.partition, c.gpu_count, d.gpus_per_node()));
        return false;
    }
    if (c.cpu_count < d.min_cpus) {
        cscope_log(fmt::format("  skip {} (only {} cpus, need {})",
                               c.partition, c.cpu_count, d.min_cpus));
        return false;
    }
    if (c.mem_total_mb < d.min_memory_mb) {
        cscope_log(fmt::format("  skip {} (only {} MB, need {})",
                               c.partition, c.mem_total_mb, d.min_memory_mb));
        return false;
    }
    return true;
}

const Candidate* select_candidate(const std::vector<Candidate>& candidates, const JobDemand& demand) {
    const Candidate* best = nullptr;
    int best_score = 0;
    for (const auto& c : candidates) {
        if (!qualifies(c, demand)) continue;

        int score = 0;
        if (c.available_nodes > 0) score += 1000;
        score -= (c.gpu_count - demand.gpus_per_node()) * 10;
        score += c.node_count;

        cscope_log(fmt::format("  candidate: {} gpus={} cpus={} score={}",
                               c.partition, c.gpu_count, c.cpu_count, score));
        // Strict comparison keeps scheduler order among equal scores
        if (!best || score > best_score) {
            best = &c;
            best_score = score;
        }
    }
    return best;
}

JobRequest shape_request(const Candidate& c, const JobProfile& profile, const JobDemand& demand) {
    JobRequest req;
    req.job_type = profile.name;
    req.mode = profile.mode;
    req.partition = c.partition;
    req.nodes = 1;
    req.tasks_per_node = demand.tasks_per_node;
    req.gpus_per_task = demand.gpus_per_task;

    if (demand.gpus_per_task > 0 && c.gpu_count > 0) {
        int64_t cpus = static_cast<int64_t>(c.cpu_count) * demand.gpus_per_task / c.gpu_count;
        req.cpus_per_task = std::max<int>(1, static_cast<int>(cpus));
        int64_t mem = c.mem_total_mb * demand.gpus_per_node() / c.gpu_count;
        req.memory_mb = std::max(mem, demand.min_memory_mb);
    } else {
        req.cpus_per_task = demand.min_cpus;
        req.memory_mb = demand.min_memory_mb;
    }
    // Round down to whole gigabytes when that still meets the floor
    if (req.memory_mb >= MB_PER_GB && (req.memory_mb / MB_PER_GB) * MB_PER_GB >= demand.min_memory_mb) {
        req.memory_mb = (req.memory_mb / MB_PER_GB) * MB_PER_GB;
    }
    req.memory = format_slurm_memory(req.memory_mb);
    return req;
}

static std::string partition_names(const std::vector<Candidate>& candidates) {
    std::string names;
    for (const auto& c : candidates) {
        if (!names.empty()) names += ", ";
        names += "'" + c.partition + "'";
    }
    return "[" + names + "]";
}

Result<JobRequest> generate_job_request(const ResourceSet& resources,
                                        const JobProfile& profile,
                                        const JobGenOptions& options) {
    auto demand = resolve_demand(profile, options);
    if (demand.is_err()) return Result<JobRequest>::Err(demand.kind, demand.error);
    const auto& d = demand.value;

    auto candidates = candidates_from(resources);
    cscope_log(fmt::format("job-gen {}: gpus/task={} tasks/node={} min_cpus={} min_mem={} over {} candidates",
                           profile.name, d.gpus_per_task, d.tasks_per_node, d.min_cpus,
                           d.min_memory_mb, candidates.size()));

    if (!options.partition.empty()) {
        if (!resources.is_partitioned()) {
            cscope_log(fmt::format("no scheduler: ignoring --partition {}", options.partition));
        } else {
            auto it = std::find_if(candidates.begin(), candidates.end(),
                                   [&](const Candidate& c) { return c.partition == options.partition; });
            if (it == candidates.end()) {
                return Result<JobRequest>::Err(ErrorKind::PartitionNotFound,
                    fmt::format("Partition {} not found. Available partitions: {}",
                                options.partition, partition_names(candidates)));
            }
            candidates = {*it};
        }
    }

    const Candidate* best = select_candidate(candidates, d);
    if (!best) {
        std::string where = options.partition.empty() || !resources.is_partitioned()
            ? std::string("No partition")
            : fmt::format("Partition '{}'", options.partition);
        return Result<JobRequest>::Err(ErrorKind::NoSuitablePartition,
            fmt::format("{} satisfies {} GPUs x {} tasks per node, {} CPUs, {} memory",
                        where, d.gpus_per_task, d.tasks_per_node, d.min_cpus,
                        format_slurm_memory(d.min_memory_mb)));
    }

    auto req = shape_request(*best, profile, d);
    cscope_log(fmt::format("job-gen selected partition='{}' cpus/task={} mem={} gpus/task={}",
                           req.partition, req.cpus_per_task, req.memory, req.gpus_per_task));
    return Result<JobRequest>::Ok(req);
}

bool is_job_format(const std::string& format) {
    return format == "json" || format == "sbatch" || format == "srun" || format == "submitit";
}

static json to_json(const JobRequest& req) {
    json j;
    j["job_type"] = req.job_type;
    j["mode"] = req.mode;
    if (!req.partition.empty()) j["partition"] = req.partition;
    j["nodes"] = req.nodes;
    j["tasks_per_node"] = req.tasks_per_node;
    j["cpu_cores"] = req.cpus_per_task;
    j["memory"] = req.memory;
    j["memory_mb"] = req.memory_mb;
    j["gpus_per_task"] = req.gpus_per_task;
    return j;
}

// Keyword arguments for submitit's AutoExecutor.update_parameters
static json to_submitit(const JobRequest& req) {
    json j;
    if (!req.partition.empty()) j["slurm_partition"] = req.partition;
    j["nodes"] = req.nodes;
    j["tasks_per_node"] = req.tasks_per_node;
    j["cpus_per_task"] = req.cpus_per_task;
    j["mem_gb"] = mb_to_gb(req.memory_mb);
    j["gpus_per_node"] = req.gpus_per_node();
    return j;
}

std::string format_job_request(const JobRequest& req, const std::string& format) {
    if (format == "sbatch") return generate_sbatch_resources(req);
    if (format == "srun") return generate_srun_command(req) + "\n";
    if (format == "submitit") return to_submitit(req).dump(2) + "\n";
    return to_json(req).dump(2) + "\n";
}
