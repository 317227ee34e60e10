#pragma once

#include <string>
#include <vector>
#include <map>
#include <core/types.hpp>

// Parsers for `scontrol ... -o` output: one record per line, whitespace
// separated Key=Value tokens in any order.  Pure functions, no I/O.

using SlurmRecord = std::map<std::string, std::string>;

// Split one line into its Key=Value pairs.  A token without '=' belongs to
// the previous value (e.g. "OS=Linux 5.15.0-91-generic").
SlurmRecord parse_record_line(const std::string& line);

// Node states that make a node unavailable for new work
const std::vector<std::string>& node_down_states();

// True when no flag of a compound state ("MIXED+DRAIN", "DOWN*") is in the
// down set.
bool node_state_available(const std::string& state);

// GPUs in a GRES string: "gpu:h100:8(S:0-1)", "gpu:8", "gpu:a100:4,gpu:v100:2".
// "(null)" and non-GPU entries yield nothing; untyped GPUs get model "UNKNOWN".
std::vector<GpuCount> parse_gres(const std::string& gres);

// One line of `scontrol show partition -o`
struct PartitionLine {
    std::string name;
    std::string nodes;          // node list expression, empty when "(null)"
    std::string state = "UNKNOWN";
    std::string max_time;
    bool is_default = false;
};

// One line of `scontrol show node -o`
struct NodeLine {
    std::string name;
    int cpus = 0;
    int64_t mem_mb = 0;
    std::vector<GpuCount> gpus;
    std::string state;
    bool available = false;
};

Result<PartitionLine> parse_partition_line(const std::string& line);
Result<NodeLine> parse_node_line(const std::string& line);

// All well-formed partition lines, in scheduler order.  Malformed lines are
// skipped and logged.
std::vector<PartitionLine> parse_partition_listing(const std::string& output);

// Fold node lines into the per-node maxima of a partition.  Fills cpu_count,
// mem_total_mb, gpus, node_count and available_nodes.
void aggregate_nodes(const std::string& output, PartitionResource& into);

// Value of a "Key = Value" line from `scontrol show config`, empty if absent.
std::string parse_config_value(const std::string& output, const std::string& key);

// Version from `sinfo --version` ("slurm 23.02.7" -> "23.02.7").
std::string parse_sinfo_version(const std::string& output);
