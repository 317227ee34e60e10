#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Handle to a spawned child process.  The child runs in its own process group
// with stdin on /dev/null and, when capturing, stdout/stderr on pipes.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns exit code (128+N if killed by signal N).
    // timeout_ms = -1 means indefinite wait; -1 is returned on timeout.
    int wait(int timeout_ms = -1);

    // Terminate the process group (SIGTERM, then SIGKILL after a grace period).
    void terminate();

    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

private:
    void close_pipes();
    void reap(int status);

    int pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               bool capture_output);
};

// Spawn a child process.  Searches PATH for program.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool capture_output = true);

// Run argv[0] with the remaining arguments, capturing stdout and stderr.
// The child is killed once timeout_ms elapses and the result is marked
// timed_out.  A program that cannot be executed exits with 127.
CommandResult run_command(const std::vector<std::string>& argv, int timeout_ms);

// Install SIGINT/SIGTERM handlers that kill every in-flight child process
// group before the process exits with status 130.
void install_interrupt_handler();

// Number of children currently tracked for interrupt cleanup.
int tracked_child_count();

} // namespace platform
