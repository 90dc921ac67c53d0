#pragma once

#include <string>
#include <vector>

namespace platform {

// Exit code reported by wait() when the timeout elapsed first.
constexpr int WAIT_TIMED_OUT = -1;

// Owning handle to a spawned child process and the read end of its
// combined stdout/stderr pipe. A handle destroyed while the child is still
// running terminates and reaps it.
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

    // Wait for the process to exit. Returns its exit status, 128 + signal
    // number if it was killed, or WAIT_TIMED_OUT.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Terminate the process group (SIGTERM, then SIGKILL after a grace period).
    void terminate();

    // Hand the output fd to the caller, who becomes responsible for closing it.
    int release_output_fd();

    int native_handle() const { return pid_; }

private:
    void reap(int status);
    void close_output();

    int pid_ = -1;
    int out_fd_ = -1;
    bool exited_ = false;
    int exit_code_ = -1;

    friend ProcessHandle spawn_captured(const std::string& program,
                                        const std::vector<std::string>& args,
                                        std::string& error);
};

// Spawn `program args...` (PATH lookup) in a new process group with stdin on
// /dev/null and stdout+stderr merged into one pipe (see release_output_fd).
// On failure returns an invalid handle and fills `error`.
ProcessHandle spawn_captured(const std::string& program,
                             const std::vector<std::string>& args,
                             std::string& error);

} // namespace platform
