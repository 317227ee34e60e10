#include "file_reader.hpp"
#include <platform/platform.hpp>
#include <filesystem>

namespace fs = std::filesystem;

std::optional<std::string> SystemFileReader::read(const std::string& path) {
    return platform::read_file(path);
}

std::vector<std::string> SystemFileReader::list_dir(const std::string& path) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) return names;
    for (const auto& entry : it) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}
