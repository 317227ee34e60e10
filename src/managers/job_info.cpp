#include "job_info.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <limits>
#include <random>

int master_port_for_job(int64_t job_id) {
    std::mt19937 rng(static_cast<std::mt19937::result_type>(job_id));
    const auto span = static_cast<std::mt19937::result_type>(MAX_MASTER_PORT - MIN_MASTER_PORT + 1);
    return MIN_MASTER_PORT + static_cast<int>(rng() % span);
}

// First variable that is set wins.  Unset everywhere leaves `out` untouched.
static Result<void> read_int(const EnvLookup& env, std::initializer_list<const char*> names,
                             int64_t& out) {
    for (const char* name : names) {
        auto v = env(name);
        if (!v) continue;
        // SLURM_NTASKS_PER_NODE may read "4(x2)"
        std::string digits = trimmed(*v);
        auto paren = digits.find('(');
        if (paren != std::string::npos) digits = digits.substr(0, paren);

        constexpr int64_t bad = std::numeric_limits<int64_t>::min();
        int64_t parsed = safe_stoll(digits, bad);
        if (parsed == bad) {
            return Result<void>::Err(ErrorKind::InvalidArgument,
                                     fmt::format("{} cannot be parsed: '{}'", name, *v));
        }
        out = parsed;
        return Result<void>::Ok();
    }
    return Result<void>::Ok();
}

static Result<void> read_int(const EnvLookup& env, std::initializer_list<const char*> names,
                             int& out) {
    int64_t wide = out;
    auto r = read_int(env, names, wide);
    if (r.is_ok()) out = static_cast<int>(wide);
    return r;
}

static std::string first_job_host(const std::string& nodelist, CommandRunner& runner, int timeout_ms) {
    std::vector<std::string> argv = {"scontrol", "show", "hostnames", nodelist};
    auto r = runner.run(argv, timeout_ms);
    if (r.failed()) {
        cscope_log(fmt::format("scontrol show hostnames failed: exit={} {}",
                               r.exit_code, trimmed(r.stderr_data)));
        return "";
    }
    auto hosts = split_lines(r.stdout_data);
    return hosts.empty() ? "" : hosts.front();
}

Result<JobInfo> read_job_info(const EnvLookup& env, CommandRunner& runner, int timeout_ms) {
    JobInfo info;
    info.is_slurm_job = env("SLURM_JOB_ID").has_value();

    std::vector<Result<void>> reads;
    if (info.is_slurm_job) {
        reads.push_back(read_int(env, {"SLURM_JOB_ID"}, info.job_id));
        info.job_name = env("SLURM_JOB_NAME").value_or("");
        reads.push_back(read_int(env, {"RANK", "SLURM_PROCID"}, info.global_rank));
        reads.push_back(read_int(env, {"LOCAL_RANK", "SLURM_LOCALID"}, info.local_rank));
        reads.push_back(read_int(env, {"WORLD_SIZE", "SLURM_NTASKS"}, info.world_size));
        reads.push_back(read_int(env, {"LOCAL_WORLD_SIZE", "SLURM_NTASKS_PER_NODE"}, info.local_world_size));
    } else {
        reads.push_back(read_int(env, {"RANK"}, info.global_rank));
        reads.push_back(read_int(env, {"LOCAL_RANK"}, info.local_rank));
        reads.push_back(read_int(env, {"WORLD_SIZE"}, info.world_size));
        reads.push_back(read_int(env, {"LOCAL_WORLD_SIZE"}, info.local_world_size));
    }
    int64_t port = -1;
    reads.push_back(read_int(env, {"MASTER_PORT"}, port));
    for (const auto& r : reads) {
        if (r.is_err()) return Result<JobInfo>::Err(r.kind, r.error);
    }

    // Outside a job the seed matches a job id of -1
    info.master_port = port >= 0 ? static_cast<int>(port)
                                 : master_port_for_job(info.is_slurm_job ? info.job_id : -1);

    if (auto addr = env("MASTER_ADDR")) {
        info.master_addr = *addr;
    } else if (info.is_slurm_job) {
        if (auto nodelist = env("SLURM_JOB_NODELIST")) {
            auto host = first_job_host(*nodelist, runner, timeout_ms);
            if (!host.empty()) info.master_addr = host;
        }
    }
    return Result<JobInfo>::Ok(info);
}

std::vector<std::pair<std::string, std::string>> torch_distributed_env(const JobInfo& info) {
    return {
        {"WORLD_SIZE", std::to_string(info.world_size)},
        {"RANK", std::to_string(info.global_rank)},
        {"LOCAL_WORLD_SIZE", std::to_string(info.local_world_size)},
        {"LOCAL_RANK", std::to_string(info.local_rank)},
        {"MASTER_ADDR", info.master_addr},
        {"MASTER_PORT", std::to_string(info.master_port)},
    };
}
