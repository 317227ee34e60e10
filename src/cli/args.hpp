#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <core/types.hpp>

// Options a command accepts.  Value options take `--opt=value` or
// `--opt value`; flags take nothing.
struct CommandSpec {
    std::string usage;                      // "check-gpu <model> [--partition=NAME]"
    std::vector<std::string> value_options; // names without the leading "--"
    std::vector<std::string> flag_options;
    size_t min_positionals = 0;
    size_t max_positionals = 0;
};

struct ParsedArgs {
    std::vector<std::string> positionals;
    std::map<std::string, std::string> values;
    std::set<std::string> flags;
    bool help = false;

    bool flag(const std::string& name) const { return flags.count(name) > 0; }
    std::string value(const std::string& name, const std::string& fallback = "") const;

    // nullopt when absent; InvalidArgument when present but not an integer.
    Result<std::optional<int>> int_value(const std::string& name) const;
};

// Errors are InvalidArgument with a message naming the offending token.
Result<ParsedArgs> parse_args(const std::vector<std::string>& args, const CommandSpec& spec);
