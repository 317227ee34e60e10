#include "args.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <limits>

std::string ParsedArgs::value(const std::string& name, const std::string& fallback) const {
    auto it = values.find(name);
    return it == values.end() ? fallback : it->second;
}

Result<std::optional<int>> ParsedArgs::int_value(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) return Result<std::optional<int>>::Ok(std::nullopt);

    constexpr int bad = std::numeric_limits<int>::min();
    int v = safe_stoi(it->second, bad);
    if (v == bad) {
        return Result<std::optional<int>>::Err(ErrorKind::InvalidArgument,
            fmt::format("--{} expects an integer, got '{}'", name, it->second));
    }
    return Result<std::optional<int>>::Ok(v);
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

Result<ParsedArgs> parse_args(const std::vector<std::string>& args, const CommandSpec& spec) {
    ParsedArgs out;
    bool options_done = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& tok = args[i];

        if (options_done || !starts_with(tok, "-") || tok == "-") {
            out.positionals.push_back(tok);
            continue;
        }
        if (tok == "--") {
            options_done = true;
            continue;
        }
        if (tok == "-h" || tok == "--help") {
            out.help = true;
            continue;
        }
        if (!starts_with(tok, "--")) {
            return Result<ParsedArgs>::Err(ErrorKind::InvalidArgument,
                                           fmt::format("Unknown option: {}", tok));
        }

        std::string name = tok.substr(2);
        std::optional<std::string> inline_value;
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            inline_value = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        if (contains(spec.value_options, name)) {
            if (inline_value) {
                out.values[name] = *inline_value;
            } else if (i + 1 < args.size()) {
                out.values[name] = args[++i];
            } else {
                return Result<ParsedArgs>::Err(ErrorKind::InvalidArgument,
                                               fmt::format("Option --{} requires a value", name));
            }
        } else if (contains(spec.flag_options, name)) {
            if (inline_value) {
                return Result<ParsedArgs>::Err(ErrorKind::InvalidArgument,
                                               fmt::format("Option --{} takes no value", name));
            }
            out.flags.insert(name);
        } else {
            return Result<ParsedArgs>::Err(ErrorKind::InvalidArgument,
                                           fmt::format("Unknown option: --{}", name));
        }
    }

    if (out.help) return Result<ParsedArgs>::Ok(out);

    if (out.positionals.size() < spec.min_positionals) {
        return Result<ParsedArgs>::Err(ErrorKind::InvalidArgument, "Missing argument");
    }
    if (out.positionals.size() > spec.max_positionals) {
        return Result<ParsedArgs>::Err(ErrorKind::InvalidArgument,
            fmt::format("Unexpected argument: {}", out.positionals[spec.max_positionals]));
    }
    return Result<ParsedArgs>::Ok(out);
}
