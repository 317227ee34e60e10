#include <gtest/gtest.h>
#include <managers/cluster_service.hpp>
#include "fakes.hpp"

// Local node with fixed figures, or a failure when cpu_count is 0
class StubLocalProbe : public ResourceProbe {
public:
    explicit StubLocalProbe(int cpus) : cpus_(cpus) {}

    Result<ResourceSet> resources(const std::string&) override {
        calls++;
        if (cpus_ == 0) return Result<ResourceSet>::Err("no cpu information");
        NodeResource node;
        node.cpu_count = cpus_;
        node.mem_total_mb = 16000;
        node.gpus = {{"A100", 2}};
        return Result<ResourceSet>::Ok(ResourceSet::from_node(node));
    }
    const char* name() const override { return "stub"; }

    int calls = 0;

private:
    int cpus_;
};

static ClusterEnvironment with_scheduler() {
    ClusterEnvironment env;
    env.scheduler_present = true;
    env.scheduler_version = "23.02.7";
    return env;
}

TEST(ClusterService, UsesScheduler) {
    FakeRunner runner;
    add_slurm_cluster(runner);
    SlurmProbe slurm(runner, ProbeOptions{});
    StubLocalProbe local(16);
    ClusterService svc(with_scheduler(), &slurm, local);

    auto r = svc.resources();
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.is_partitioned());
    EXPECT_EQ(r.value.partitions().size(), 2u);
    EXPECT_EQ(local.calls, 0);
}

TEST(ClusterService, FallsBackToLocal) {
    FakeRunner runner;
    runner.on("scontrol show partition -o", "", 1);
    SlurmProbe slurm(runner, ProbeOptions{});
    StubLocalProbe local(16);
    ClusterService svc(with_scheduler(), &slurm, local);

    auto r = svc.resources("h100");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.is_partitioned());
    EXPECT_EQ(r.value.node().cpu_count, 16);
}

TEST(ClusterService, FallsBackOnTimeout) {
    FakeRunner runner;
    runner.timeout("scontrol show partition");
    SlurmProbe slurm(runner, ProbeOptions{});
    StubLocalProbe local(8);
    ClusterService svc(with_scheduler(), &slurm, local);

    auto r = svc.resources();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.scope(), ResourceScope::LocalNode);
}

TEST(ClusterService, SlowPartitionKeepsScheduler) {
    FakeRunner runner;
    runner.timeout("scontrol show node h100");
    add_slurm_cluster(runner);
    SlurmProbe slurm(runner, ProbeOptions{});
    StubLocalProbe local(8);
    ClusterService svc(with_scheduler(), &slurm, local);

    auto r = svc.resources();
    ASSERT_TRUE(r.is_ok());
    ASSERT_TRUE(r.value.is_partitioned());
    ASSERT_EQ(r.value.partitions().size(), 2u);
    EXPECT_EQ(r.value.partitions()[0].cpu_count, 192);
    EXPECT_EQ(local.calls, 0);
}

TEST(ClusterService, NoInformation) {
    StubLocalProbe local(0);
    ClusterService svc(ClusterEnvironment{}, nullptr, local);

    auto r = svc.resources();
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("No cluster information available"), std::string::npos);
}

TEST(ClusterService, GpuInventoryFromLocal) {
    StubLocalProbe local(16);
    ClusterService svc(ClusterEnvironment{}, nullptr, local);

    auto inv = svc.gpu_inventory();
    ASSERT_TRUE(inv.is_ok());
    EXPECT_EQ(inv.value.vendor, "nvidia");
    EXPECT_EQ(inv.value.models["A100"], 2);
}

TEST(ClusterService, SummaryWithoutScheduler) {
    StubLocalProbe local(16);
    ClusterEnvironment env;
    env.cloud_provider = "gcp";
    ClusterService svc(env, nullptr, local);

    auto s = svc.summary();
    EXPECT_EQ(s.cluster_name, "local-node");
    EXPECT_EQ(s.slurm_version, "0");
    EXPECT_FALSE(s.scheduler_present);
    EXPECT_TRUE(s.partitions.empty());
    EXPECT_EQ(s.cloud_provider, "gcp");
}

TEST(ClusterService, SummaryWithScheduler) {
    FakeRunner runner;
    add_slurm_cluster(runner);
    SlurmProbe slurm(runner, ProbeOptions{});
    StubLocalProbe local(16);
    ClusterService svc(with_scheduler(), &slurm, local);

    auto s = svc.summary();
    EXPECT_TRUE(s.scheduler_present);
    EXPECT_EQ(s.cluster_name, "prod");
    EXPECT_EQ(s.slurm_version, "23.02.7");
    EXPECT_EQ(s.max_job_lifetime, "7-00:00:00");
    EXPECT_EQ(s.partitions, (std::vector<std::string>{"cpu", "h100"}));
    EXPECT_FALSE(runner.called("scontrol show node"));
}
