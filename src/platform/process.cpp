#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <chrono>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    if (valid() && !reaped_) {
        terminate();
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

static int decode_status(int status) {
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

bool ProcessHandle::running() const {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        auto* self = const_cast<ProcessHandle*>(this);
        self->reaped_ = true;
        self->exit_code_ = decode_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;

    if (timeout_ms < 0) {
        int status;
        if (waitpid(pid_, &status, 0) == pid_) {
            reaped_ = true;
            exit_code_ = decode_status(status);
        }
        return exit_code_;
    }

    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (!running()) return exit_code_;
        sleep_ms(100);
        elapsed += 100;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        if (!running()) return;
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    reaped_ = true;
    exit_code_ = -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn_piped(const std::string& program,
                          const std::vector<std::string>& args,
                          int& stdout_fd, int& stderr_fd) {
    ProcessHandle handle;
    stdout_fd = -1;
    stderr_fd = -1;

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) return handle;
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return handle;
    }

    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
        return handle;
    }

    if (pid == 0) {
        // Child process
        close(STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);

        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);
    stdout_fd = out_pipe[0];
    stderr_fd = err_pipe[0];
    handle.pid_ = pid;
    return handle;
}

// ── run_capture ──────────────────────────────────────────────

CommandResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_ms) {
    CommandResult result{-1, "", ""};

    int out_fd = -1;
    int err_fd = -1;
    ProcessHandle proc = spawn_piped(program, args, out_fd, err_fd);
    if (!proc.valid()) {
        result.stderr_data = "failed to start " + program;
        return result;
    }

    auto start = std::chrono::steady_clock::now();
    bool timed_out = false;
    char buf[4096];

    struct pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    int open_fds = 2;

    while (open_fds > 0) {
        if (timeout_ms >= 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            if (elapsed >= timeout_ms) {
                timed_out = true;
                break;
            }
        }

        int ready = poll(fds, 2, 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }

    for (auto& p : fds) {
        if (p.fd >= 0) close(p.fd);
    }

    if (timed_out) {
        proc.terminate();
        result.exit_code = -1;
        result.stderr_data += "timed out after " + std::to_string(timeout_ms / 1000) + "s";
        return result;
    }

    result.exit_code = proc.wait();
    return result;
}

} // namespace platform
