#pragma once

#include <string>
#include <vector>
#include <cstdint>

// Safe integer parse: returns fallback on failure (no exceptions).
// Trailing garbage is rejected ("12abc" -> fallback).
int safe_stoi(const std::string& s, int fallback = 0);
int64_t safe_stoll(const std::string& s, int64_t fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Copying variant of trim().
std::string trimmed(const std::string& s);

std::string to_lower(std::string s);
std::string to_upper(std::string s);

// Split on a delimiter, keeping empty fields.
std::vector<std::string> split(const std::string& str, char delimiter);

// Split on runs of whitespace, dropping empty fields.
std::vector<std::string> split_whitespace(const std::string& str);

// Split into non-empty, trimmed lines.
std::vector<std::string> split_lines(const std::string& str);

bool starts_with(const std::string& s, const std::string& prefix);
bool contains_ci(const std::string& haystack, const std::string& needle);

// Join a command vector for logging/error messages.
std::string join_command(const std::vector<std::string>& argv);
