#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <core/config.hpp>
#include <core/log.hpp>
#include "log_buffer.hpp"

namespace fs = std::filesystem;

enum class RunState { NotStarted, Running, Succeeded, Failed };

const char* run_state_name(RunState state);

struct CommandResult {
    RunState state = RunState::NotStarted;
    int exit_code = -1;
    bool timed_out = false;
    std::string command;
    std::vector<std::string> log_tail;   // retained output, oldest first; empty on success
    std::string setup_error;             // script could not be written or bash not spawned

    bool success() const { return state == RunState::Succeeded; }

    // "Shell command failed: <command>\n<log tail>"
    std::string failure_message() const;
};

// Runs shell commands through `bash` with pipefail, streaming the merged
// stdout/stderr into the log line by line.
//
// Each run uses two concurrent tasks: the child process and one reader
// thread that exclusively owns the output pipe. The reader logs every line
// at info level and keeps the last `log_buffer_lines` in a LogBuffer for the
// failure report. execute() returns only after both the child has exited and
// the reader has hit end-of-stream.
class ProcessRunner {
public:
    ProcessRunner(Logger& logger, RunnerConfig config = RunnerConfig{});

    // Run `command`. Without script_dir: bash -c "set -o pipefail; <command>".
    // With script_dir: the command is written, wrapped, to a script in a fresh
    // txcmd* sub-directory of script_dir (removed afterwards) and run as
    // `bash <script>`, which sidesteps argv length limits for very long
    // generated commands.
    CommandResult execute(const std::string& command,
                          const std::optional<fs::path>& script_dir = std::nullopt);

    // execute(), then turn failure into an error result: Command for a
    // non-zero exit or timeout, IOError when the command could not be
    // started. Failures are logged at error level before returning.
    Result<void> check_run(const std::string& command,
                           const std::optional<fs::path>& script_dir = std::nullopt);

    const RunnerConfig& config() const { return config_; }
    Logger& logger() { return logger_; }

private:
    Result<fs::path> write_script(const fs::path& dir, const std::string& command) const;
    void drain_output(int fd, LogBuffer& buffer);

    Logger& logger_;
    RunnerConfig config_;
};

// Wrap a shell command at unquoted blanks using backslash-newline
// continuations so no line exceeds `width` where a break is possible.
// Quoted strings, comments, and heredoc bodies are never split.
std::string wrap_shell_command(const std::string& command, int width);
