#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

bool config_exists() {
    return fs::exists(get_config_path());
}

static void parse_transaction_config(const YAML::Node& node, RunnerConfig& cfg) {
    if (!node || !node.IsMap()) return;
    cfg.tx_prefix = node["prefix"].as<std::string>(cfg.tx_prefix);
}

static Result<void> parse_process_config(const YAML::Node& node, RunnerConfig& cfg) {
    if (!node || !node.IsMap()) return Result<void>::Ok();

    cfg.shell = node["shell"].as<std::string>(cfg.shell);
    cfg.script_wrap_width = node["script_wrap_width"].as<int>(cfg.script_wrap_width);
    cfg.timeout_secs = node["timeout_secs"].as<int>(cfg.timeout_secs);

    int lines = node["log_buffer_lines"].as<int>(static_cast<int>(cfg.log_buffer_lines));
    if (lines <= 0) {
        return Result<void>::Err(ErrorKind::InvalidState,
            fmt::format("process.log_buffer_lines must be positive, got {}", lines));
    }
    cfg.log_buffer_lines = static_cast<std::size_t>(lines);

    if (cfg.timeout_secs < 0) {
        return Result<void>::Err(ErrorKind::InvalidState,
            fmt::format("process.timeout_secs must not be negative, got {}", cfg.timeout_secs));
    }
    if (cfg.script_wrap_width < 20) {
        return Result<void>::Err(ErrorKind::InvalidState,
            fmt::format("process.script_wrap_width too small: {}", cfg.script_wrap_width));
    }
    return Result<void>::Ok();
}

static Result<void> parse_log_config(const YAML::Node& node, LogConfig& log) {
    if (!node || !node.IsMap()) return Result<void>::Ok();

    log.file = node["file"].as<std::string>(log.file);
    log.console = node["console"].as<bool>(log.console);
    log.timestamp_pattern = node["timestamp_pattern"].as<std::string>(log.timestamp_pattern);

    if (node["level"]) {
        std::string level = node["level"].as<std::string>();
        if (!parse_log_level(level, log.level)) {
            return Result<void>::Err(ErrorKind::InvalidState,
                                     "Unknown log level: " + level);
        }
    }
    return Result<void>::Ok();
}

Result<RunnerConfig> load_config(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<RunnerConfig>::Err(ErrorKind::IOError,
                                         "Config file not found: " + path.string());
    }

    RunnerConfig cfg;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<RunnerConfig>::Ok(cfg);
        }
        if (!root.IsMap()) {
            return Result<RunnerConfig>::Err(ErrorKind::InvalidState,
                "Config root must be a mapping: " + path.string());
        }

        parse_transaction_config(root["transaction"], cfg);

        auto proc = parse_process_config(root["process"], cfg);
        if (proc.is_err()) {
            return Result<RunnerConfig>::Err(proc.kind, proc.error);
        }

        auto log = parse_log_config(root["log"], cfg.log);
        if (log.is_err()) {
            return Result<RunnerConfig>::Err(log.kind, log.error);
        }
    } catch (const YAML::BadFile& e) {
        return Result<RunnerConfig>::Err(ErrorKind::IOError,
            fmt::format("Failed to read config {}: {}", path.string(), e.what()));
    } catch (const YAML::Exception& e) {
        return Result<RunnerConfig>::Err(ErrorKind::InvalidState,
            fmt::format("Failed to parse config {}: {}", path.string(), e.what()));
    }

    if (cfg.tx_prefix.empty() || cfg.tx_prefix.find('/') != std::string::npos) {
        return Result<RunnerConfig>::Err(ErrorKind::InvalidState,
            "transaction.prefix must be a non-empty file name: '" + cfg.tx_prefix + "'");
    }

    return Result<RunnerConfig>::Ok(cfg);
}

Result<RunnerConfig> load_default_config() {
    if (!config_exists()) {
        return Result<RunnerConfig>::Ok(RunnerConfig{});
    }
    return load_config(get_config_path());
}
