#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>

namespace platform {

// ── Child registry ───────────────────────────────────────────
// Fixed slots of lock-free atomics so the signal handler can walk them.

static std::array<std::atomic<int>, MAX_TRACKED_CHILDREN> g_children{};

static void track_child(int pid) {
    for (auto& slot : g_children) {
        int expected = 0;
        if (slot.compare_exchange_strong(expected, pid)) return;
    }
}

static void untrack_child(int pid) {
    for (auto& slot : g_children) {
        int expected = pid;
        if (slot.compare_exchange_strong(expected, 0)) return;
    }
}

int tracked_child_count() {
    int n = 0;
    for (const auto& slot : g_children) {
        if (slot.load() > 0) n++;
    }
    return n;
}

extern "C" void cscope_interrupt_handler(int sig) {
    for (auto& slot : g_children) {
        int pid = slot.load();
        if (pid > 0) {
            kill(-pid, SIGKILL);
            waitpid(pid, nullptr, 0);
        }
    }
    (void)sig;
    _exit(EXIT_INTERRUPTED);
}

void install_interrupt_handler() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = cscope_interrupt_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_pipes();
    if (pid_ > 0 && !reaped_) {
        terminate();
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    stdout_fd_ = other.stdout_fd_;
    stderr_fd_ = other.stderr_fd_;
    reaped_ = other.reaped_;
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
    other.stdout_fd_ = -1;
    other.stderr_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_pipes();
        pid_ = other.pid_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.stdout_fd_ = -1;
        other.stderr_fd_ = -1;
    }
    return *this;
}

void ProcessHandle::close_pipes() {
    if (stdout_fd_ >= 0) { close(stdout_fd_); stdout_fd_ = -1; }
    if (stderr_fd_ >= 0) { close(stderr_fd_); stderr_fd_ = -1; }
}

void ProcessHandle::reap(int status) {
    reaped_ = true;
    untrack_child(pid_);
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reap(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        pid_t ret;
        do {
            ret = waitpid(pid_, &status, 0);
        } while (ret < 0 && errno == EINTR);
        if (ret == pid_) reap(status);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            reap(status);
            return exit_code_;
        }
        sleep_ms(PROBE_POLL_INTERVAL_MS);
        elapsed += PROBE_POLL_INTERVAL_MS;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(-pid_, SIGTERM);
    for (int waited = 0; waited < TERMINATE_GRACE_MS; waited += 100) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reap(status);
            return;
        }
        sleep_ms(100);
    }
    kill(-pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) {
        reap(status);
    } else {
        reaped_ = true;
        untrack_child(pid_);
    }
}

// ── spawn ────────────────────────────────────────────────────

static bool make_pipe(int fds[2]) {
#ifdef __linux__
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool capture_output) {
    ProcessHandle handle;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (capture_output) {
        if (!make_pipe(out_pipe)) return handle;
        if (!make_pipe(err_pipe)) {
            close(out_pipe[0]);
            close(out_pipe[1]);
            return handle;
        }
    }

    // Build argv before fork: the child may only make async-signal-safe calls.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        if (capture_output) {
            close(out_pipe[0]); close(out_pipe[1]);
            close(err_pipe[0]); close(err_pipe[1]);
        }
        return handle;  // fork failed
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        } else {
            close(STDIN_FILENO);
        }

        if (capture_output) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    setpgid(pid, pid);
    track_child(pid);
    handle.pid_ = pid;
    if (capture_output) {
        close(out_pipe[1]);
        close(err_pipe[1]);
        handle.stdout_fd_ = out_pipe[0];
        handle.stderr_fd_ = err_pipe[0];
    }
    return handle;
}

// ── run_command ──────────────────────────────────────────────

CommandResult run_command(const std::vector<std::string>& argv, int timeout_ms) {
    CommandResult result;
    if (argv.empty()) return result;

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    ProcessHandle proc = spawn(argv[0], args, true);
    if (!proc.valid()) {
        result.exit_code = 127;
        result.stderr_data = "failed to spawn " + argv[0];
        return result;
    }

    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

    bool out_open = true;
    bool err_open = true;
    char buf[PIPE_READ_BUF_SIZE];

    while (out_open || err_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd fds[2];
        int nfds = 0;
        int out_idx = -1, err_idx = -1;
        if (out_open) { fds[nfds] = {proc.stdout_fd(), POLLIN, 0}; out_idx = nfds++; }
        if (err_open) { fds[nfds] = {proc.stderr_fd(), POLLIN, 0}; err_idx = nfds++; }

        int rc = poll(fds, static_cast<nfds_t>(nfds), static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = read(proc.stdout_fd(), buf, sizeof(buf));
            if (n > 0) result.stdout_data.append(buf, static_cast<size_t>(n));
            else if (n == 0 || errno != EINTR) out_open = false;
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = read(proc.stderr_fd(), buf, sizeof(buf));
            if (n > 0) result.stderr_data.append(buf, static_cast<size_t>(n));
            else if (n == 0 || errno != EINTR) err_open = false;
        }
    }

    if (result.timed_out) {
        proc.terminate();
        result.exit_code = -1;
        return result;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - clock::now()).count();
    int code = proc.wait(std::max(static_cast<int>(remaining), PROBE_POLL_INTERVAL_MS));
    if (code == -1 && proc.running()) {
        proc.terminate();
        result.timed_out = true;
        return result;
    }
    if (code == -1) code = proc.wait(0);
    result.exit_code = code;
    return result;
}

} // namespace platform
