#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Opaque handle to a spawned child process.
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
    bool running() const;

    // Wait for the process to exit. Returns exit code, -1 on timeout or signal.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // SIGTERM, then SIGKILL after 2s.
    void terminate();

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    friend ProcessHandle spawn_piped(const std::string& program,
                                     const std::vector<std::string>& args,
                                     int& stdout_fd, int& stderr_fd);
};

// Spawn a child with stdin closed and stdout/stderr connected to pipes whose
// read ends are returned through `stdout_fd` / `stderr_fd` (-1 on failure).
ProcessHandle spawn_piped(const std::string& program,
                          const std::vector<std::string>& args,
                          int& stdout_fd, int& stderr_fd);

// Run a program to completion and capture its output. The child is killed
// after `timeout_ms` (-1 = no limit) and the result has exit code -1.
// Exit code 127 means the program could not be executed.
CommandResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_ms = -1);

} // namespace platform
