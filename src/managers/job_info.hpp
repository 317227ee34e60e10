#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <functional>
#include <core/types.hpp>
#include <probes/command_runner.hpp>

// Identity of the current job, preferring torch-distributed variables and
// falling back to Slurm's.
struct JobInfo {
    int64_t job_id = 0;             // SLURM_JOB_ID, 0 outside a job
    std::string job_name = "local"; // SLURM_JOB_NAME
    int global_rank = 0;            // RANK, SLURM_PROCID
    int local_rank = 0;             // LOCAL_RANK, SLURM_LOCALID
    int world_size = 1;             // WORLD_SIZE, SLURM_NTASKS
    int local_world_size = 1;       // LOCAL_WORLD_SIZE, SLURM_NTASKS_PER_NODE
    std::string master_addr = "127.0.0.1";
    int master_port = 0;
    bool is_slurm_job = false;

    bool is_rank_zero() const { return global_rank == 0; }
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Deterministic port in [MIN_MASTER_PORT, MAX_MASTER_PORT] for a job id, so
// every rank of the job agrees on it.
int master_port_for_job(int64_t job_id);

// Read the job identity.  MASTER_ADDR falls back to the first host of
// SLURM_JOB_NODELIST (via `scontrol show hostnames`), then 127.0.0.1.
// A variable that is set but not an integer is an InvalidArgument error.
Result<JobInfo> read_job_info(const EnvLookup& env, CommandRunner& runner, int timeout_ms);

// Variables torch.distributed expects, in export order.
std::vector<std::pair<std::string, std::string>> torch_distributed_env(const JobInfo& info);
