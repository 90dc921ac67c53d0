#include "command.hpp"
#include "idempotency.hpp"
#include "transaction.hpp"
#include <core/path_utils.hpp>
#include <core/utils.hpp>
#include <fmt/args.h>

// ── CommandBuilder ───────────────────────────────────────────

CommandBuilder::CommandBuilder(std::string tmpl) : template_(std::move(tmpl)) {}

CommandBuilder& CommandBuilder::arg(const std::string& name, const std::string& value) {
    args_.emplace_back(name, value);
    return *this;
}

Result<std::string> CommandBuilder::build() const {
    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (const auto& [name, value] : args_) {
        store.push_back(fmt::arg(name.c_str(), value));
    }
    try {
        return Result<std::string>::Ok(fmt::vformat(template_, store));
    } catch (const fmt::format_error& e) {
        return Result<std::string>::Err(ErrorKind::InvalidState,
            fmt::format("Bad command template '{}': {}", template_, e.what()));
    }
}

// ── CommandRunner ────────────────────────────────────────────

CommandRunner::CommandRunner(ProcessRunner& runner) : runner_(runner) {}

template <typename Render>
Result<std::string> CommandRunner::run_single(const std::string& out_file,
                                              const std::vector<std::string>& exts,
                                              Render&& render) {
    if (!needs_run(out_file)) {
        runner_.logger().debug("Output exists, skipping: " + out_file);
        return Result<std::string>::Ok(out_file);
    }

    auto ran = with_tx_file(out_file, exts,
        [&](const std::string& tx_out_file) -> Result<void> {
            Result<std::string> filled = render();
            if (filled.is_err()) return Result<void>::Err(filled.kind, filled.error);

            std::string tx_cmd = replace_all(filled.value, out_file, tx_out_file);
            return runner_.check_run(tx_cmd, parent_directory(tx_out_file));
        },
        runner_.config().tx_prefix);

    if (ran.is_err()) return Result<std::string>::Err(ran.kind, ran.error);
    return Result<std::string>::Ok(out_file);
}

Result<std::string> CommandRunner::run_cmd(const std::string& out_file, const std::string& command,
                                           const std::vector<std::string>& exts) {
    return run_single(out_file, exts, [&]() { return Result<std::string>::Ok(command); });
}

Result<std::string> CommandRunner::run_cmd(const std::string& out_file, const CommandBuilder& command,
                                           const std::vector<std::string>& exts) {
    return run_single(out_file, exts, [&]() { return command.build(); });
}

Result<FileInfo> CommandRunner::run_cmd_files(const FileInfo& file_info,
                                              const std::vector<std::string>& need_tx,
                                              const std::vector<std::string>& exts,
                                              const std::vector<Arg>& args) {
    for (const auto& key : need_tx) {
        if (file_info.count(key) == 0) {
            return Result<FileInfo>::Err(ErrorKind::InvalidState,
                                         "Transaction key not in file info: " + key);
        }
    }
    if (!need_tx.empty() && !needs_run(paths_for(file_info, need_tx))) {
        runner_.logger().debug("Outputs exist, skipping: " + render_args(args));
        return Result<FileInfo>::Ok(file_info);
    }

    auto ran = with_tx_files(file_info, need_tx, exts,
        [&](const FileInfo& tx_file_info) -> Result<void> {
            std::string cmd = render_args(substitute_keys(args, tx_file_info));
            std::optional<fs::path> script_dir;
            if (!need_tx.empty()) script_dir = parent_directory(tx_file_info.at(need_tx.front()));
            return runner_.check_run(cmd, script_dir);
        },
        runner_.config().tx_prefix);

    if (ran.is_err()) return Result<FileInfo>::Err(ran.kind, ran.error);
    return Result<FileInfo>::Ok(file_info);
}
