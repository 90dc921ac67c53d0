#include "log.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") { out = LogLevel::Debug; return true; }
    if (lower == "info")  { out = LogLevel::Info;  return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
    if (lower == "error") { out = LogLevel::Error; return true; }
    return false;
}

Logger::Logger(LogConfig config) : config_(std::move(config)) {
    if (!config_.file.empty()) {
        std::error_code ec;
        fs::path parent = fs::path(config_.file).parent_path();
        if (!parent.empty()) fs::create_directories(parent, ec);
        file_.open(config_.file, std::ios::app);
        if (!file_ && config_.console) {
            std::cerr << fmt::format("[{}] WARN cannot open log file {}\n",
                                     now_formatted(config_.timestamp_pattern), config_.file);
        }
    }
}

void Logger::log(LogLevel level, const std::string& msg) {
    if (!enabled(level)) return;

    std::string line = fmt::format("[{}] {} {}\n", now_formatted(config_.timestamp_pattern),
                                   log_level_name(level), msg);

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        file_ << line;
        file_.flush();
    }
    if (config_.console) {
        std::cerr << line;
    }
}
