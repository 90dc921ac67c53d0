#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace platform {

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    if (valid() && !exited_) terminate();
    close_output();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    out_fd_ = other.out_fd_;
    exited_ = other.exited_;
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
    other.out_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (valid() && !exited_) terminate();
        close_output();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        exited_ = other.exited_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.out_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::reap(int status) {
    exited_ = true;
    exit_code_ = decode_status(status);
}

void ProcessHandle::close_output() {
    if (out_fd_ >= 0) {
        close(out_fd_);
        out_fd_ = -1;
    }
}

int ProcessHandle::release_output_fd() {
    int fd = out_fd_;
    out_fd_ = -1;
    return fd;
}

bool ProcessHandle::running() {
    if (!valid() || exited_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reap(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (!valid()) return 1;
    if (exited_) return exit_code_;

    if (timeout_ms < 0) {
        int status;
        pid_t ret;
        do {
            ret = waitpid(pid_, &status, 0);
        } while (ret < 0 && errno == EINTR);
        if (ret != pid_) {
            exited_ = true;
            exit_code_ = 1;
            return exit_code_;
        }
        reap(status);
        return exit_code_;
    }

    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (!running()) return exited_ ? exit_code_ : 1;
        sleep_ms(WAIT_POLL_MS);
        elapsed += WAIT_POLL_MS;
    }
    return running() ? WAIT_TIMED_OUT : exit_code_;
}

void ProcessHandle::terminate() {
    if (!valid() || exited_) return;
    // The child leads its own group, so pipeline stages die with it.
    if (kill(-pid_, SIGTERM) != 0) kill(pid_, SIGTERM);
    for (int waited = 0; waited < TERMINATE_GRACE_MS; waited += WAIT_POLL_MS) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reap(status);
            return;
        }
        sleep_ms(WAIT_POLL_MS);
    }
    if (kill(-pid_, SIGKILL) != 0) kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) {
        reap(status);
    } else {
        exited_ = true;
    }
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn_captured(const std::string& program,
                             const std::vector<std::string>& args,
                             std::string& error) {
    ProcessHandle handle;

    // Build argv before forking; only async-signal-safe calls in the child.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    // O_CLOEXEC so a concurrent spawn never inherits this pipe and holds
    // the write end open past our child's exit.
    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        error = std::string("pipe failed: ") + std::strerror(errno);
        return handle;
    }
    // Reports exec failure: closes silently on successful exec.
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        error = std::string("pipe failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return handle;
    }

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return handle;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));

        int code = errno;
        ssize_t unused = write(err_pipe[1], &code, sizeof(code));
        (void)unused;
        _exit(127);  // exec failed
    }

    // Parent. Set the group here too so terminate() never races the child.
    setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    handle.pid_ = pid;
    handle.out_fd_ = out_pipe[0];

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n > 0) {
        error = "exec " + program + " failed: " + std::strerror(exec_errno);
        handle.wait();
        handle.close_output();
        handle.pid_ = -1;
    }
    return handle;
}

} // namespace platform
