#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), or the temp dir if unset.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Read a whole file.  Returns nullopt if it cannot be opened.
std::optional<std::string> read_file(const std::string& path);

// Environment variable lookup.  Returns nullopt if unset.
std::optional<std::string> get_env(const std::string& name);

} // namespace platform
