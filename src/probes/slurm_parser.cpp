#include "slurm_parser.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](char c) { return c >= '0' && c <= '9'; });
}

SlurmRecord parse_record_line(const std::string& line) {
    SlurmRecord rec;
    std::string last_key;
    for (const auto& tok : split_whitespace(line)) {
        auto eq = tok.find('=');
        if (eq == std::string::npos || eq == 0) {
            if (!last_key.empty()) rec[last_key] += " " + tok;
            continue;
        }
        last_key = tok.substr(0, eq);
        rec[last_key] = tok.substr(eq + 1);
    }
    return rec;
}

const std::vector<std::string>& node_down_states() {
    static const std::vector<std::string> states = {
        "down", "drain", "drained", "draining", "fail", "failing", "maint",
        "powered_down", "powering_down", "powering_up", "future", "inval",
        "perfctrs", "reboot_issued", "not_responding", "unknown",
    };
    return states;
}

bool node_state_available(const std::string& state) {
    if (state.empty()) return false;
    const auto& down = node_down_states();
    for (auto flag : split(to_lower(state), '+')) {
        // Drop marker suffixes such as '*' (not responding) or '~' (powered off)
        while (!flag.empty() && !std::isalpha(static_cast<unsigned char>(flag.back())))
            flag.pop_back();
        if (std::find(down.begin(), down.end(), flag) != down.end()) return false;
    }
    return true;
}

// Split on commas that are not inside parentheses: "gpu:a:2(S:0,1),gpu:b:1"
static std::vector<std::string> split_gres_entries(const std::string& gres) {
    std::vector<std::string> out;
    std::string cur;
    int depth = 0;
    for (char c : gres) {
        if (c == '(') depth++;
        if (c == ')' && depth > 0) depth--;
        if (c == ',' && depth == 0) {
            out.push_back(cur);
            cur.clear();
            continue;
        }
        cur += c;
    }
    out.push_back(cur);
    return out;
}

std::vector<GpuCount> parse_gres(const std::string& gres) {
    std::vector<GpuCount> gpus;
    std::string g = trimmed(gres);
    if (g.empty() || g == "(null)") return gpus;

    for (auto entry : split_gres_entries(g)) {
        auto paren = entry.find('(');
        if (paren != std::string::npos) entry = entry.substr(0, paren);
        trim(entry);

        auto parts = split(entry, ':');
        if (parts.size() < 2 || to_lower(parts[0]) != "gpu") continue;

        std::string model = "UNKNOWN";
        int count = 0;
        if (parts.size() == 2) {
            count = safe_stoi(parts[1], 0);
        } else {
            model = to_upper(parts[1]);
            count = safe_stoi(parts.back(), 0);
        }
        if (count <= 0) continue;

        auto it = std::find_if(gpus.begin(), gpus.end(),
                               [&](const GpuCount& gc) { return gc.model == model; });
        if (it != gpus.end()) it->count += count;
        else gpus.push_back({model, count});
    }
    return gpus;
}

Result<PartitionLine> parse_partition_line(const std::string& line) {
    auto rec = parse_record_line(line);
    auto name = rec.find("PartitionName");
    if (name == rec.end() || name->second.empty()) {
        return Result<PartitionLine>::Err(ErrorKind::MalformedProbeOutput,
                                          "missing PartitionName");
    }

    PartitionLine p;
    p.name = name->second;
    if (rec.count("Nodes") && rec["Nodes"] != "(null)") p.nodes = rec["Nodes"];
    if (rec.count("State")) p.state = to_upper(rec["State"]);
    if (rec.count("MaxTime")) p.max_time = rec["MaxTime"];
    p.is_default = rec.count("Default") && to_upper(rec["Default"]) == "YES";
    return Result<PartitionLine>::Ok(p);
}

Result<NodeLine> parse_node_line(const std::string& line) {
    auto rec = parse_record_line(line);
    auto name = rec.find("NodeName");
    if (name == rec.end() || name->second.empty()) {
        return Result<NodeLine>::Err(ErrorKind::MalformedProbeOutput, "missing NodeName");
    }

    NodeLine n;
    n.name = name->second;

    const std::string cpus = rec.count("CPUTot") ? rec["CPUTot"] : "0";
    const std::string mem = rec.count("RealMemory") ? rec["RealMemory"] : "0";
    if (!all_digits(cpus) || !all_digits(mem)) {
        return Result<NodeLine>::Err(
            ErrorKind::MalformedProbeOutput,
            fmt::format("node {}: unparseable CPUTot='{}' RealMemory='{}'", n.name, cpus, mem));
    }
    n.cpus = safe_stoi(cpus);
    n.mem_mb = safe_stoll(mem);
    n.gpus = parse_gres(rec.count("Gres") ? rec["Gres"] : "");
    n.state = rec.count("State") ? rec["State"] : "";
    n.available = node_state_available(n.state);
    return Result<NodeLine>::Ok(n);
}

std::vector<PartitionLine> parse_partition_listing(const std::string& output) {
    std::vector<PartitionLine> out;
    for (const auto& line : split_lines(output)) {
        auto r = parse_partition_line(line);
        if (r.is_err()) {
            cscope_log(fmt::format("skip partition line ({}): {}", r.error,
                                   line.substr(0, static_cast<size_t>(LOG_OUTPUT_PREVIEW))));
            continue;
        }
        out.push_back(r.value);
    }
    return out;
}

void aggregate_nodes(const std::string& output, PartitionResource& into) {
    for (const auto& line : split_lines(output)) {
        auto r = parse_node_line(line);
        if (r.is_err()) {
            cscope_log(fmt::format("skip node line in {} ({})", into.name, r.error));
            continue;
        }
        const auto& n = r.value;
        into.node_count++;
        if (n.available) into.available_nodes++;
        into.cpu_count = std::max(into.cpu_count, n.cpus);
        into.mem_total_mb = std::max(into.mem_total_mb, n.mem_mb);

        int node_gpus = 0;
        for (const auto& g : n.gpus) node_gpus += g.count;
        into.gpus_per_node = std::max(into.gpus_per_node, node_gpus);

        // Inventory: keep the largest count seen for each model
        for (const auto& g : n.gpus) {
            auto it = std::find_if(into.gpus.begin(), into.gpus.end(),
                                   [&](const GpuCount& gc) { return gc.model == g.model; });
            if (it == into.gpus.end()) into.gpus.push_back(g);
            else it->count = std::max(it->count, g.count);
        }
    }
}

std::string parse_config_value(const std::string& output, const std::string& key) {
    for (const auto& line : split_lines(output)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        if (trimmed(line.substr(0, eq)) == key) return trimmed(line.substr(eq + 1));
    }
    return "";
}

std::string parse_sinfo_version(const std::string& output) {
    auto toks = split_whitespace(output);
    if (toks.empty()) return "";
    return toks.back();
}
