#pragma once

#include <string>
#include <vector>
#include <utility>
#include <fmt/format.h>
#include <core/types.hpp>
#include "file_info.hpp"
#include "process_runner.hpp"

// Command line template with explicitly bound {name} placeholders.
// Literal braces are written {{ and }}.
//
//     CommandBuilder("sort -k{col} {in} > {out}")
//         .arg("col", 2).arg("in", input).arg("out", output)
class CommandBuilder {
public:
    explicit CommandBuilder(std::string tmpl);

    CommandBuilder& arg(const std::string& name, const std::string& value);

    CommandBuilder& arg(const std::string& name, const fs::path& value) {
        return arg(name, value.string());
    }

    template <typename T>
    CommandBuilder& arg(const std::string& name, const T& value) {
        return arg(name, fmt::format("{}", value));
    }

    // Render the template. An unbound or malformed placeholder is InvalidState.
    Result<std::string> build() const;

    const std::string& template_text() const { return template_; }

private:
    std::string template_;
    std::vector<std::pair<std::string, std::string>> args_;
};

// Idempotent, transactional runs of shell commands producing output files.
class CommandRunner {
public:
    explicit CommandRunner(ProcessRunner& runner);

    // Run `command` to produce `out_file` unless it already exists and is
    // non-empty. Every occurrence of out_file in the command is redirected
    // to a staged path inside a transaction directory beside it; the result
    // is renamed onto out_file (with any `exts` side files) only if the
    // command succeeds. Returns out_file whether or not the command ran.
    Result<std::string> run_cmd(const std::string& out_file, const std::string& command,
                                const std::vector<std::string>& exts = {});

    Result<std::string> run_cmd(const std::string& out_file, const CommandBuilder& command,
                                const std::vector<std::string>& exts = {});

    // Multi-output form. The need_tx outputs are staged together, Slot
    // arguments are resolved against the staged paths, and all outputs are
    // promoted as a set. Skipped when every need_tx output already exists.
    // A need_tx key missing from file_info is InvalidState and nothing runs.
    // Returns file_info (final paths).
    Result<FileInfo> run_cmd_files(const FileInfo& file_info,
                                   const std::vector<std::string>& need_tx,
                                   const std::vector<std::string>& exts,
                                   const std::vector<Arg>& args);

private:
    template <typename Render>
    Result<std::string> run_single(const std::string& out_file,
                                   const std::vector<std::string>& exts,
                                   Render&& render);

    ProcessRunner& runner_;
};
