#pragma once

#include <string>
#include <cstddef>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

// Settings for the process runner and transactions. Every field has a
// working default; a config file only overrides what it names.
struct RunnerConfig {
    std::string tx_prefix = TX_DIR_PREFIX;
    std::size_t log_buffer_lines = LOG_BUFFER_LINES;
    std::string shell = DEFAULT_SHELL;
    int script_wrap_width = SCRIPT_WRAP_WIDTH;
    int timeout_secs = DEFAULT_TIMEOUT_SECS;     // 0 disables the timeout
    LogConfig log;
};

// Load a YAML config file:
//
//   transaction:
//     prefix: txtmp
//   process:
//     shell: bash
//     log_buffer_lines: 100
//     script_wrap_width: 200
//     timeout_secs: 0
//   log:
//     file: /var/log/txrun.log
//     console: true
//     level: info
//     timestamp_pattern: "%Y-%m-%d %H:%M:%S"
Result<RunnerConfig> load_config(const fs::path& path);

// Load ~/.txrun/config.yaml if it exists, defaults otherwise.
Result<RunnerConfig> load_default_config();

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

bool config_exists();
