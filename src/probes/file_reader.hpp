#pragma once

#include <string>
#include <vector>
#include <optional>

// Read-only view of host files (/proc, /sys).  Tests substitute an in-memory
// tree.
class FileReader {
public:
    virtual ~FileReader() = default;
    virtual std::optional<std::string> read(const std::string& path) = 0;
    // Entry names in a directory; empty if it does not exist.
    virtual std::vector<std::string> list_dir(const std::string& path) = 0;
};

class SystemFileReader : public FileReader {
public:
    std::optional<std::string> read(const std::string& path) override;
    std::vector<std::string> list_dir(const std::string& path) override;
};
