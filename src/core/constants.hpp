#pragma once

#include <cstddef>

// ── Transactions ────────────────────────────────────────────
constexpr const char* TX_DIR_PREFIX       = "txtmp";  // staging dir next to outputs
constexpr const char* TEMP_DIR_PREFIX     = "tmp";    // scratch dirs from with_temp_dir
constexpr const char* COPY_TMP_SUFFIX     = ".txcopy";

// ── Process execution ───────────────────────────────────────
constexpr const char* DEFAULT_SHELL       = "bash";
constexpr const char* PIPEFAIL_PREAMBLE   = "set -o pipefail; ";
constexpr const char* CMD_SCRIPT_DIR_PREFIX = "txcmd";  // private dir holding the script
constexpr const char* CMD_SCRIPT_NAME     = "txrun-cmd.sh";
constexpr std::size_t LOG_BUFFER_LINES    = 100;    // retained output lines for failure reports
constexpr int SCRIPT_WRAP_WIDTH           = 200;    // max script line length before continuation
constexpr int DEFAULT_TIMEOUT_SECS        = 0;      // 0 = wait forever
constexpr int TERMINATE_GRACE_MS          = 2000;   // SIGTERM -> SIGKILL window
constexpr int WAIT_POLL_MS                = 50;
constexpr int PIPE_READ_BUF_SIZE          = 4096;

// ── Logging ─────────────────────────────────────────────────
constexpr const char* DEFAULT_TIMESTAMP_PATTERN = "%Y-%m-%d %H:%M:%S";

// ── Config locations ────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME     = ".txrun";
constexpr const char* CONFIG_FILE_NAME    = "config.yaml";

// ── Version ─────────────────────────────────────────────────
constexpr const char* TXRUN_VERSION       = "0.1.0";
