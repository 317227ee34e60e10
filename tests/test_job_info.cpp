#include <gtest/gtest.h>
#include <managers/job_info.hpp>
#include <core/constants.hpp>
#include "fakes.hpp"

static EnvLookup env_of(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

TEST(JobInfo, MasterPortRangeAndDeterminism) {
    for (int64_t id : {-1, 0, 1, 12345, 987654321}) {
        int port = master_port_for_job(id);
        EXPECT_GE(port, MIN_MASTER_PORT);
        EXPECT_LE(port, MAX_MASTER_PORT);
        EXPECT_EQ(port, master_port_for_job(id));
    }
}

TEST(JobInfo, OutsideJob) {
    FakeRunner runner;
    auto r = read_job_info(env_of({}), runner, 1000);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& info = r.value;
    EXPECT_FALSE(info.is_slurm_job);
    EXPECT_EQ(info.job_id, 0);
    EXPECT_EQ(info.job_name, "local");
    EXPECT_EQ(info.global_rank, 0);
    EXPECT_EQ(info.world_size, 1);
    EXPECT_EQ(info.master_addr, "127.0.0.1");
    EXPECT_EQ(info.master_port, master_port_for_job(-1));
    EXPECT_TRUE(info.is_rank_zero());
}

TEST(JobInfo, SlurmJob) {
    FakeRunner runner;
    runner.on("scontrol show hostnames gpu[01-02]", "gpu01\ngpu02\n");
    auto r = read_job_info(env_of({
        {"SLURM_JOB_ID", "12345"},
        {"SLURM_JOB_NAME", "train"},
        {"SLURM_PROCID", "3"},
        {"SLURM_LOCALID", "1"},
        {"SLURM_NTASKS", "8"},
        {"SLURM_NTASKS_PER_NODE", "4(x2)"},
        {"SLURM_JOB_NODELIST", "gpu[01-02]"},
    }), runner, 1000);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& info = r.value;
    EXPECT_TRUE(info.is_slurm_job);
    EXPECT_EQ(info.job_id, 12345);
    EXPECT_EQ(info.job_name, "train");
    EXPECT_EQ(info.global_rank, 3);
    EXPECT_EQ(info.local_rank, 1);
    EXPECT_EQ(info.world_size, 8);
    EXPECT_EQ(info.local_world_size, 4);
    EXPECT_EQ(info.master_addr, "gpu01");
    EXPECT_EQ(info.master_port, master_port_for_job(12345));
    EXPECT_FALSE(info.is_rank_zero());
}

TEST(JobInfo, TorchVariablesWin) {
    FakeRunner runner;
    auto r = read_job_info(env_of({
        {"SLURM_JOB_ID", "7"},
        {"SLURM_PROCID", "3"},
        {"RANK", "0"},
        {"WORLD_SIZE", "16"},
        {"MASTER_ADDR", "10.0.0.5"},
        {"MASTER_PORT", "29500"},
    }), runner, 1000);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.global_rank, 0);
    EXPECT_EQ(r.value.world_size, 16);
    EXPECT_EQ(r.value.master_addr, "10.0.0.5");
    EXPECT_EQ(r.value.master_port, 29500);
    EXPECT_FALSE(runner.called("scontrol"));
}

TEST(JobInfo, HostnamesFailure) {
    FakeRunner runner;
    auto r = read_job_info(env_of({
        {"SLURM_JOB_ID", "7"},
        {"SLURM_JOB_NODELIST", "n[1-2]"},
    }), runner, 1000);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.master_addr, "127.0.0.1");
}

TEST(JobInfo, UnparseableVariable) {
    FakeRunner runner;
    auto r = read_job_info(env_of({
        {"SLURM_JOB_ID", "7"},
        {"SLURM_PROCID", "abc"},
    }), runner, 1000);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(r.error, "SLURM_PROCID cannot be parsed: 'abc'");
}

TEST(JobInfo, TorchEnvOrder) {
    JobInfo info;
    info.world_size = 4;
    info.global_rank = 2;
    info.local_world_size = 4;
    info.local_rank = 2;
    info.master_addr = "node1";
    info.master_port = 30000;

    auto env = torch_distributed_env(info);
    ASSERT_EQ(env.size(), 6u);
    EXPECT_EQ(env[0].first, "WORLD_SIZE");
    EXPECT_EQ(env[1].first, "RANK");
    EXPECT_EQ(env[1].second, "2");
    EXPECT_EQ(env[4].second, "node1");
    EXPECT_EQ(env[5].second, "30000");
}
