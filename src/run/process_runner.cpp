#include "process_runner.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include "transaction.hpp"
#include <fmt/format.h>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

const char* run_state_name(RunState state) {
    switch (state) {
        case RunState::NotStarted: return "not-started";
        case RunState::Running:    return "running";
        case RunState::Succeeded:  return "succeeded";
        case RunState::Failed:     return "failed";
    }
    return "unknown";
}

std::string CommandResult::failure_message() const {
    if (!setup_error.empty()) {
        return fmt::format("Shell command could not be started: {}\n{}", command, setup_error);
    }
    if (timed_out) {
        return fmt::format("Shell command timed out: {}\n{}", command, join(log_tail, "\n"));
    }
    return fmt::format("Shell command failed: {}\n{}", command, join(log_tail, "\n"));
}

// ── Command wrapping ─────────────────────────────────────────

std::string wrap_shell_command(const std::string& command, int width) {
    std::string out;
    out.reserve(command.size() + command.size() / 16);

    bool in_single = false;
    bool in_ansi = false;       // $'...' honours backslash escapes
    bool in_double = false;
    bool in_comment = false;
    bool escaped = false;
    bool heredoc_pending = false;
    bool verbatim = false;      // inside a heredoc body: copy the rest untouched
    int line_len = 0;

    for (size_t i = 0; i < command.size(); i++) {
        char c = command[i];
        out += c;
        if (verbatim) continue;
        line_len = (c == '\n') ? 0 : line_len + 1;

        if (escaped) { escaped = false; continue; }
        if (in_comment) {
            if (c == '\n') {
                in_comment = false;
                if (heredoc_pending) verbatim = true;
            }
            continue;
        }
        if (in_single) { if (c == '\'') in_single = false; continue; }
        if (in_ansi) {
            if (c == '\\') escaped = true;
            else if (c == '\'') in_ansi = false;
            continue;
        }
        if (in_double) {
            if (c == '\\') escaped = true;
            else if (c == '"') in_double = false;
            continue;
        }

        switch (c) {
            case '\\':
                escaped = true;
                break;
            case '\'':
                if (i > 0 && command[i - 1] == '$') in_ansi = true;
                else in_single = true;
                break;
            case '"':
                in_double = true;
                break;
            case '#':
                if (i == 0 || std::isspace(static_cast<unsigned char>(command[i - 1])))
                    in_comment = true;
                break;
            case '<':
                if (i > 0 && command[i - 1] == '<') heredoc_pending = true;
                break;
            case '\n':
                if (heredoc_pending) verbatim = true;
                break;
            case ' ':
            case '\t': {
                bool word_follows = i + 1 < command.size() &&
                                    !std::isspace(static_cast<unsigned char>(command[i + 1]));
                if (line_len >= width && word_follows) {
                    out += "\\\n";
                    line_len = 0;
                }
                break;
            }
            default:
                break;
        }
    }
    return out;
}

// ── ProcessRunner ────────────────────────────────────────────

ProcessRunner::ProcessRunner(Logger& logger, RunnerConfig config)
    : logger_(logger), config_(std::move(config)) {}

Result<fs::path> ProcessRunner::write_script(const fs::path& dir, const std::string& command) const {
    fs::path script = dir / CMD_SCRIPT_NAME;
    std::ofstream out(script, std::ios::trunc);
    if (!out) {
        return Result<fs::path>::Err(ErrorKind::IOError,
                                     "Cannot write command script " + script.string());
    }
    out << "set -o pipefail\n"
        << wrap_shell_command(command, config_.script_wrap_width) << "\n";
    out.close();
    if (!out) {
        return Result<fs::path>::Err(ErrorKind::IOError,
                                     "Failed writing command script " + script.string());
    }
    return Result<fs::path>::Ok(script);
}

void ProcessRunner::drain_output(int fd, LogBuffer& buffer) {
    char buf[PIPE_READ_BUF_SIZE];
    std::string pending;

    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;

        pending.append(buf, static_cast<size_t>(n));
        size_t start = 0;
        size_t nl;
        while ((nl = pending.find('\n', start)) != std::string::npos) {
            std::string line = pending.substr(start, nl - start);
            logger_.info(line);
            buffer.push(std::move(line));
            start = nl + 1;
        }
        pending.erase(0, start);
    }

    // Final line without a trailing newline
    if (!pending.empty()) {
        logger_.info(pending);
        buffer.push(std::move(pending));
    }
    close(fd);
}

CommandResult ProcessRunner::execute(const std::string& command,
                                     const std::optional<fs::path>& script_dir) {
    CommandResult result;
    result.command = command;

    std::vector<std::string> args;
    // The script gets a private sub-directory so it never shares a name with
    // an output staged in script_dir.
    std::optional<TempDirGuard> script_guard;
    if (script_dir) {
        std::error_code ec;
        fs::path own_dir = platform::make_unique_dir(*script_dir, CMD_SCRIPT_DIR_PREFIX, ec);
        if (ec) {
            result.state = RunState::Failed;
            result.setup_error = fmt::format("Cannot create script directory in {}: {}",
                                             script_dir->string(), ec.message());
            return result;
        }
        script_guard.emplace(own_dir);

        auto script = write_script(own_dir, command);
        if (script.is_err()) {
            result.state = RunState::Failed;
            result.setup_error = script.error;
            return result;
        }
        args = {script.value.string()};
    } else {
        args = {"-c", std::string(PIPEFAIL_PREAMBLE) + command};
    }

    std::string spawn_error;
    platform::ProcessHandle proc = platform::spawn_captured(config_.shell, args, spawn_error);
    if (!proc.valid()) {
        result.state = RunState::Failed;
        result.setup_error = spawn_error;
        return result;
    }
    result.state = RunState::Running;
    logger_.debug(fmt::format("Started pid {}: {}", proc.native_handle(), command));

    LogBuffer buffer(config_.log_buffer_lines);
    int fd = proc.release_output_fd();
    std::thread reader([this, fd, &buffer] { drain_output(fd, buffer); });

    int timeout_ms = config_.timeout_secs > 0 ? config_.timeout_secs * 1000 : -1;
    int exit_code = proc.wait(timeout_ms);
    if (exit_code == platform::WAIT_TIMED_OUT) {
        logger_.warn(fmt::format("Command exceeded {}s, terminating: {}", config_.timeout_secs, command));
        proc.terminate();
        result.timed_out = true;
        exit_code = proc.wait();
    }
    reader.join();

    result.exit_code = exit_code;
    if (exit_code == 0 && !result.timed_out) {
        result.state = RunState::Succeeded;
    } else {
        result.state = RunState::Failed;
        result.log_tail = buffer.items();
    }
    logger_.debug(fmt::format("pid {} {} (exit {})", proc.native_handle(),
                              run_state_name(result.state), exit_code));
    return result;
}

Result<void> ProcessRunner::check_run(const std::string& command,
                                      const std::optional<fs::path>& script_dir) {
    CommandResult result = execute(command, script_dir);
    if (result.success()) return Result<void>::Ok();

    std::string msg = result.failure_message();
    logger_.error(msg);
    ErrorKind kind = result.setup_error.empty() ? ErrorKind::Command : ErrorKind::IOError;
    return Result<void>::Err(kind, msg);
}
