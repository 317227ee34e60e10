#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) return fallback;
        return v;
    } catch (const std::logic_error&) {
        return fallback;
    }
}

int64_t safe_stoll(const std::string& s, int64_t fallback) {
    try {
        size_t pos = 0;
        long long v = std::stoll(s, &pos);
        if (pos != s.size()) return fallback;
        return static_cast<int64_t>(v);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

std::string trimmed(const std::string& s) {
    std::string out = s;
    trim(out);
    return out;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> out;
    std::string field;
    std::istringstream iss(str);
    while (std::getline(iss, field, delimiter)) {
        out.push_back(field);
    }
    if (!str.empty() && str.back() == delimiter) out.emplace_back();
    return out;
}

std::vector<std::string> split_whitespace(const std::string& str) {
    std::vector<std::string> out;
    std::istringstream iss(str);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

std::vector<std::string> split_lines(const std::string& str) {
    std::vector<std::string> out;
    std::istringstream iss(str);
    std::string line;
    while (std::getline(iss, line)) {
        trim(line);
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += " ";
        if (a.find(' ') != std::string::npos) {
            out += "'" + a + "'";
        } else {
            out += a;
        }
    }
    return out;
}
