#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <core/constants.hpp>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char* log_level_name(LogLevel level);

// Parse "debug" / "info" / "warn" / "error" (case-insensitive). Returns false on
// an unknown name and leaves `out` untouched.
bool parse_log_level(const std::string& name, LogLevel& out);

struct LogConfig {
    std::string file;                                        // append target, "" = none
    bool console = true;                                     // mirror to stderr
    LogLevel level = LogLevel::Info;
    std::string timestamp_pattern = DEFAULT_TIMESTAMP_PATTERN;
};

// Line-oriented log sink. One instance is created by the caller and passed
// to whatever needs to log; nothing here is process-global.
//
// Every line is "[<timestamp>] LEVEL message". Writes are serialized so the
// process reader thread and the calling thread can share one Logger.
class Logger {
public:
    explicit Logger(LogConfig config = LogConfig{});

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& msg);

    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void info(const std::string& msg)  { log(LogLevel::Info, msg); }
    void warn(const std::string& msg)  { log(LogLevel::Warn, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

    bool enabled(LogLevel level) const { return level >= config_.level; }
    const LogConfig& config() const { return config_; }

private:
    LogConfig config_;
    std::mutex mutex_;
    std::ofstream file_;
};
