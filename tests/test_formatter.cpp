#include <gtest/gtest.h>
#include <cli/formatter.hpp>
#include <nlohmann/json.hpp>

static ResourceSet two_partitions() {
    PartitionResource cpu;
    cpu.name = "cpu";
    cpu.cpu_count = 192;
    cpu.mem_total_mb = 1546000;
    PartitionResource h100;
    h100.name = "h100";
    h100.cpu_count = 192;
    h100.mem_total_mb = 2063000;
    h100.gpus = {{"H100", 8}};
    return ResourceSet::from_partitions({cpu, h100});
}

static ResourceSet one_node() {
    NodeResource node;
    node.cpu_count = 16;
    node.mem_total_mb = 16000;
    return ResourceSet::from_node(node);
}

// ── cpus / mem ──────────────────────────────────────────────

TEST(Formatter, CpusPerPartition) {
    EXPECT_EQ(format_cpus(two_partitions()),
              "CPU information:\n"
              "partition: cpu, cpu_count: 192\n"
              "partition: h100, cpu_count: 192\n");
}

TEST(Formatter, CpusLocalNode) {
    EXPECT_EQ(format_cpus(one_node()), "CPU information:\ncpu_count: 16\n");
}

TEST(Formatter, CpusNoPartitions) {
    EXPECT_EQ(format_cpus(ResourceSet::from_partitions({})), "CPU information:\n");
}

TEST(Formatter, MemPerPartition) {
    EXPECT_EQ(format_mem(two_partitions(), false, 95.0),
              "Mem information:\n"
              "partition: cpu, mem_total_MB: 1546000, mem_total_GB: 1510\n"
              "partition: h100, mem_total_MB: 2063000, mem_total_GB: 2015\n");
}

TEST(Formatter, MemDetailed) {
    EXPECT_EQ(format_mem(one_node(), true, 95.0),
              "Mem information:\n"
              "mem_total_MB: 16000, mem_total_GB: 16, "
              "mem_available_MB: 15200, mem_available_GB: 15\n");
}

// ── gpus ────────────────────────────────────────────────────

static GpuInventory inventory() {
    GpuInventory inv;
    inv.vendor = "nvidia";
    inv.models = {{"H100", 8}, {"A100", 4}};
    return inv;
}

TEST(Formatter, GpusDefault) {
    EXPECT_EQ(format_gpus(inventory(), GpuView::Default),
              "GPU vendor: nvidia\n"
              "GPU information:\n"
              "  A100: 4\n"
              "  H100: 8\n");
}

TEST(Formatter, GpusViews) {
    EXPECT_EQ(format_gpus(inventory(), GpuView::Vendor), "Primary GPU vendor: nvidia\n");
    EXPECT_EQ(format_gpus(inventory(), GpuView::Counts),
              "GPU counts by type:\n  A100: 4\n  H100: 8\n");
    EXPECT_EQ(format_gpus(inventory(), GpuView::Generations),
              "GPU generations available:\n- A100\n- H100\n");
}

TEST(Formatter, GpusNone) {
    GpuInventory empty;
    EXPECT_EQ(format_gpus(empty, GpuView::Default), "GPU vendor: none\nNo GPUs found\n");
    EXPECT_EQ(format_gpus(empty, GpuView::Counts), "No GPUs found\n");
    EXPECT_EQ(format_gpus(empty, GpuView::Vendor), "Primary GPU vendor: none\n");
}

TEST(Formatter, CheckGpu) {
    EXPECT_EQ(format_check_gpu("h100", true), "GPU type h100 is available in the cluster.\n");
    EXPECT_EQ(format_check_gpu("A10", false), "GPU type A10 is NOT available in the cluster.\n");
}

// ── info / aws ──────────────────────────────────────────────

TEST(Formatter, InfoWithScheduler) {
    ClusterSummary s;
    s.cluster_name = "prod";
    s.slurm_version = "23.02.7";
    s.max_job_lifetime = "7-00:00:00";
    s.partitions = {"cpu", "h100"};
    s.cloud_provider = "aws";
    s.scheduler_present = true;
    EXPECT_EQ(format_info(s),
              "Cluster Name: prod\n"
              "Slurm Version: 23.02.7\n"
              "Max Job Lifetime: 7-00:00:00\n"
              "Partitions: cpu, h100\n"
              "Cloud Provider: aws\n");

    s.max_job_lifetime.reset();
    EXPECT_NE(format_info(s).find("Max Job Lifetime: unknown\n"), std::string::npos);
}

TEST(Formatter, InfoLocal) {
    ClusterSummary s;
    s.cluster_name = "local-node";
    s.slurm_version = "0";
    EXPECT_EQ(format_info(s),
              "Cluster Name: local-node\n"
              "Slurm Version: 0\n"
              "Cloud Provider: none\n");
}

TEST(Formatter, AwsNo) {
    EXPECT_EQ(format_aws(false, {}), "This is NOT an AWS cluster.\n");
}

TEST(Formatter, AwsYes) {
    std::string out = format_aws(true, {{"FI_PROVIDER", "efa"}, {"NCCL_PROTO", "simple"}});
    std::string header = "This is an AWS cluster.\n\nRecommended NCCL settings:\n";
    ASSERT_EQ(out.rfind(header, 0), 0u);
    auto j = nlohmann::json::parse(out.substr(header.size()));
    EXPECT_EQ(j["FI_PROVIDER"], "efa");
    EXPECT_EQ(j["NCCL_PROTO"], "simple");
}

// ── job-info / version ──────────────────────────────────────

static JobInfo sample_info() {
    JobInfo info;
    info.job_id = 42;
    info.job_name = "train";
    info.global_rank = 0;
    info.local_rank = 0;
    info.world_size = 8;
    info.local_world_size = 4;
    info.master_addr = "gpu01";
    info.master_port = 31234;
    info.is_slurm_job = true;
    return info;
}

TEST(Formatter, JobInfo) {
    EXPECT_EQ(format_job_info(sample_info()),
              "job_id: 42\n"
              "job_name: train\n"
              "global_rank: 0\n"
              "local_rank: 0\n"
              "world_size: 8\n"
              "local_world_size: 4\n"
              "master_addr: gpu01\n"
              "master_port: 31234\n"
              "is_rank_zero: true\n");
}

TEST(Formatter, JobInfoExports) {
    EXPECT_EQ(format_job_info_exports(sample_info()),
              "export WORLD_SIZE=8\n"
              "export RANK=0\n"
              "export LOCAL_WORLD_SIZE=4\n"
              "export LOCAL_RANK=0\n"
              "export MASTER_ADDR=gpu01\n"
              "export MASTER_PORT=31234\n");
}

TEST(Formatter, Version) {
    EXPECT_EQ(format_version(), "cscope version 0.1.0\n");
}
