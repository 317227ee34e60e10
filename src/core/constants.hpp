#pragma once

#include <cstdint>

constexpr const char* CSCOPE_VERSION = "0.1.0";

// ── Timeouts ────────────────────────────────────────────────
constexpr int PROBE_TIMEOUT_MS          = 5000;   // Max time for a single external command
constexpr int PROBE_POLL_INTERVAL_MS    = 10;     // Child exit polling interval
constexpr int TERMINATE_GRACE_MS        = 2000;   // SIGTERM -> SIGKILL window
constexpr int METADATA_TIMEOUT_SECS     = 2;      // curl timeout for instance metadata

// ── Concurrency ─────────────────────────────────────────────
constexpr int DEFAULT_MAX_PARALLEL      = 8;      // Concurrent scontrol node queries
constexpr int MAX_TRACKED_CHILDREN      = 64;     // Slots in the interrupt registry

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PIPE_READ_BUF_SIZE        = 4096;
constexpr int LOG_OUTPUT_PREVIEW        = 500;

// ── Memory ──────────────────────────────────────────────────
constexpr double DEFAULT_MEMORY_USAGE_PERCENTAGE = 95.0;
constexpr int64_t MB_PER_GB             = 1024;

// ── Job generation ──────────────────────────────────────────
constexpr int MIN_MASTER_PORT           = 20000;
constexpr int MAX_MASTER_PORT           = 60000;

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_OK                   = 0;
constexpr int EXIT_FAILURE_CODE         = 1;
constexpr int EXIT_USAGE                = 2;
constexpr int EXIT_INTERRUPTED          = 130;

// ── Well-known names ────────────────────────────────────────
constexpr const char* LOCAL_CLUSTER_NAME = "local-node";
constexpr const char* NO_SLURM_VERSION   = "0";
