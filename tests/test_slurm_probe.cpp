#include <gtest/gtest.h>
#include <probes/slurm_probe.hpp>
#include <platform/platform.hpp>
#include <core/utils.hpp>
#include "fakes.hpp"

static ProbeOptions options(int max_parallel = 8) {
    ProbeOptions o;
    o.timeout_ms = 1000;
    o.max_parallel = max_parallel;
    return o;
}

// Holds back the node query of the first partition so it finishes last
class SlowFirstRunner : public FakeRunner {
public:
    CommandResult run(const std::vector<std::string>& argv, int timeout_ms) override {
        if (argv.size() > 3 && argv[3].rfind("cpu[", 0) == 0) platform::sleep_ms(50);
        auto r = FakeRunner::run(argv, timeout_ms);
        std::lock_guard<std::mutex> lock(order_mu_);
        finished_.push_back(join_command(argv));
        return r;
    }

    std::vector<std::string> finished() {
        std::lock_guard<std::mutex> lock(order_mu_);
        return finished_;
    }

private:
    std::vector<std::string> finished_;
    std::mutex order_mu_;
};

TEST(SlurmProbe, ListsPartitionsInOrder) {
    FakeRunner runner;
    add_slurm_cluster(runner);
    SlurmProbe probe(runner, options());

    auto r = probe.list_partitions();
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);

    const auto& cpu = r.value[0];
    EXPECT_EQ(cpu.name, "cpu");
    EXPECT_EQ(cpu.cpu_count, 192);
    EXPECT_EQ(cpu.mem_total_mb, 1546000);
    EXPECT_EQ(cpu.gpu_count(), 0);
    EXPECT_EQ(cpu.node_count, 2);
    EXPECT_EQ(cpu.available_nodes, 2);
    EXPECT_TRUE(cpu.is_default);

    const auto& h100 = r.value[1];
    EXPECT_EQ(h100.name, "h100");
    EXPECT_EQ(h100.cpu_count, 192);
    EXPECT_EQ(h100.gpu_count(), 8);
    EXPECT_EQ(h100.gpus[0].model, "H100");
    EXPECT_EQ(h100.available_nodes, 1);
    EXPECT_EQ(h100.state, "UP");
}

TEST(SlurmProbe, SingleWorkerKeepsOrder) {
    FakeRunner runner;
    add_slurm_cluster(runner);
    SlurmProbe probe(runner, options(1));

    auto r = probe.list_partitions();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].name, "cpu");
    EXPECT_EQ(r.value[1].name, "h100");
}

TEST(SlurmProbe, CompletionOrderDoesNotReorder) {
    SlowFirstRunner runner;
    add_slurm_cluster(runner);
    SlurmProbe probe(runner, options(2));

    auto r = probe.list_partitions();
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].name, "cpu");
    EXPECT_EQ(r.value[0].gpu_count(), 0);
    EXPECT_EQ(r.value[1].name, "h100");
    EXPECT_EQ(r.value[1].gpu_count(), 8);

    // The h100 query really did finish first
    auto done = runner.finished();
    ASSERT_EQ(done.size(), 3u);
    EXPECT_EQ(done[1], "scontrol show node h100-[001-002] -o");
    EXPECT_EQ(done[2], "scontrol show node cpu[001-002] -o");
}

TEST(SlurmProbe, FilterSkipsOtherNodeQueries) {
    FakeRunner runner;
    add_slurm_cluster(runner);
    SlurmProbe probe(runner, options());

    auto r = probe.list_partitions("h100");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value[0].name, "h100");
    EXPECT_TRUE(runner.called("scontrol show node h100"));
    EXPECT_FALSE(runner.called("scontrol show node cpu"));
}

TEST(SlurmProbe, UnmatchedFilterIsEmpty) {
    FakeRunner runner;
    add_slurm_cluster(runner);
    SlurmProbe probe(runner, options());

    auto r = probe.resources("a100");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.is_partitioned());
    EXPECT_TRUE(r.value.partitions().empty());
}

TEST(SlurmProbe, PartitionWithoutNodes) {
    FakeRunner runner;
    runner.on("scontrol show partition -o", "PartitionName=empty Nodes=(null) State=INACTIVE\n");
    SlurmProbe probe(runner, options());

    auto r = probe.list_partitions();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value[0].cpu_count, 0);
    EXPECT_EQ(r.value[0].node_count, 0);
    EXPECT_FALSE(runner.called("scontrol show node"));
}

TEST(SlurmProbe, NodeQueryExitCodeIgnored) {
    FakeRunner runner;
    runner.on("scontrol show partition -o", "PartitionName=p Nodes=n[1-2] State=UP\n");
    runner.on("scontrol show node n[1-2] -o",
              "NodeName=n1 CPUTot=32 RealMemory=128000 State=IDLE\n", 1);
    SlurmProbe probe(runner, options());

    auto r = probe.list_partitions();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value[0].cpu_count, 32);
}

TEST(SlurmProbe, SchedulerFailure) {
    FakeRunner runner;
    runner.on("scontrol show partition -o", "", 1);
    SlurmProbe probe(runner, options());

    auto r = probe.list_partitions();
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::SchedulerUnavailable);
}

TEST(SlurmProbe, NodeTimeoutKeepsOtherPartitions) {
    FakeRunner runner;
    runner.timeout("scontrol show node h100");
    add_slurm_cluster(runner);
    SlurmProbe probe(runner, options());

    auto r = probe.list_partitions();
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].name, "cpu");
    EXPECT_EQ(r.value[0].cpu_count, 192);
    EXPECT_EQ(r.value[1].name, "h100");
    EXPECT_EQ(r.value[1].cpu_count, 0);
    EXPECT_EQ(r.value[1].gpu_count(), 0);
    EXPECT_EQ(r.value[1].node_count, 0);
}

TEST(SlurmProbe, PartitionQueryTimeout) {
    FakeRunner runner;
    runner.timeout("scontrol show partition");
    SlurmProbe probe(runner, options());

    auto r = probe.list_partitions();
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ProbeTimeout);
}

TEST(SlurmProbe, ClusterNameAndLifetime) {
    FakeRunner runner;
    add_slurm_cluster(runner);
    SlurmProbe probe(runner, options());

    EXPECT_STREQ(probe.name(), "slurm");

    auto name = probe.cluster_name();
    ASSERT_TRUE(name.is_ok());
    EXPECT_EQ(name.value, "prod");

    // No MaxJobTime in the config: the default partition's MaxTime is used
    auto lifetime = probe.max_job_lifetime();
    ASSERT_TRUE(lifetime.is_ok());
    EXPECT_EQ(lifetime.value, "7-00:00:00");

    auto names = probe.partition_names();
    ASSERT_TRUE(names.is_ok());
    EXPECT_EQ(names.value, (std::vector<std::string>{"cpu", "h100"}));
}

TEST(SlurmProbe, LifetimeUnknown) {
    FakeRunner runner;
    runner.on("scontrol show config", "ClusterName = c\n");
    runner.on("scontrol show partition -o", "PartitionName=p Nodes=n1 State=UP\n");
    SlurmProbe probe(runner, options());

    auto lifetime = probe.max_job_lifetime();
    EXPECT_TRUE(lifetime.is_err());
}
