#include "log.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

static std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "cscope_debug.log").string();
    return path;
}

std::string cscope_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_storage();
}

void set_cscope_log_path(const std::string& path) {
    if (path.empty()) return;
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path;
}

void cscope_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::string line = fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (!out) return;
    out << line;
}

void cscope_log_cmd(const std::string& label, const std::vector<std::string>& argv,
                    const CommandResult& r) {
    cscope_log(fmt::format("{} CMD: {}", label, join_command(argv)));
    if (r.timed_out) {
        cscope_log(fmt::format("{} timed out", label));
        return;
    }
    cscope_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                           r.stdout_data.size(),
                           r.stdout_data.substr(0, LOG_OUTPUT_PREVIEW)));
    if (!r.stderr_data.empty())
        cscope_log(fmt::format("{} stderr={}", label,
                               r.stderr_data.substr(0, LOG_OUTPUT_PREVIEW)));
}
