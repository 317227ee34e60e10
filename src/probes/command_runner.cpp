#include "command_runner.hpp"
#include <core/log.hpp>
#include <platform/process.hpp>

CommandResult SubprocessRunner::run(const std::vector<std::string>& argv, int timeout_ms) {
    auto result = platform::run_command(argv, timeout_ms);
    cscope_log_cmd("run", argv, result);
    return result;
}
