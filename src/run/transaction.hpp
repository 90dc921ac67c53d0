#pragma once

#include <string>
#include <vector>
#include <utility>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "file_info.hpp"

namespace fs = std::filesystem;

// ## Transactions
// Output files are written inside a private transaction directory and only
// renamed onto their final path after the work succeeded, so an interrupted
// or failed step never leaves a partial file where a later run would take
// it for finished output.
//
//     auto r = with_tx_file("out/calls.vcf", {".idx"},
//         [&](const std::string& tx_out) -> Result<void> {
//             return runner.check_run("caller > " + tx_out, parent_directory(tx_out));
//         });
//
// The transaction directory is removed on every exit path, including
// exceptions thrown by the work. A process killed outright (SIGKILL, power
// loss) can still leave a txtmp* directory behind.

// Atomically create root/<prefix>XXXXXX, creating `root` first if needed.
Result<fs::path> make_temp_dir(const fs::path& root, const std::string& prefix);

// Owns a directory and removes it, with everything inside, on destruction.
class TempDirGuard {
public:
    explicit TempDirGuard(fs::path dir);
    ~TempDirGuard();

    TempDirGuard(const TempDirGuard&) = delete;
    TempDirGuard& operator=(const TempDirGuard&) = delete;

    const fs::path& path() const { return dir_; }

private:
    fs::path dir_;
};

struct StagedFiles {
    FileInfo file_info;   // need_tx keys point into tx_dir
    fs::path tx_dir;
};

// Create a transaction directory beside the first need_tx output and point
// each need_tx key at tx_dir/<base name>. Other keys are copied unchanged.
// The caller owns tx_dir (see with_tx_files for the scoped form).
Result<StagedFiles> stage_files(const FileInfo& file_info,
                                const std::vector<std::string>& need_tx,
                                const std::string& prefix = TX_DIR_PREFIX);

// Rename staged outputs onto their final paths, plus any `staged + ext`
// side files (indexes) that exist. A staged primary output that was never
// produced is an IOError.
Result<void> promote_files(const FileInfo& staged,
                           const FileInfo& file_info,
                           const std::vector<std::string>& need_tx,
                           const std::vector<std::string>& exts);

// Atomic rename. Across filesystems (EXDEV) falls back to copy_then_rename.
Result<void> move_file(const fs::path& from, const fs::path& to);

// Copy `from` to a unique sibling of `to`, rename that onto `to`, then
// remove `from`. `to` is never visible half-written.
Result<void> copy_then_rename(const fs::path& from, const fs::path& to);

// ── Scoped forms ────────────────────────────────────────────

// Run work(dir) with a fresh directory under `base`, removed afterwards.
template <typename Work>
auto with_temp_dir(const fs::path& base, const std::string& prefix, Work&& work)
    -> decltype(work(std::declval<const fs::path&>())) {
    using R = decltype(work(std::declval<const fs::path&>()));
    auto dir = make_temp_dir(base, prefix);
    if (dir.is_err()) return R::Err(dir.kind, dir.error);
    TempDirGuard guard(dir.value);
    return work(guard.path());
}

template <typename Work>
auto with_temp_dir(const fs::path& base, Work&& work)
    -> decltype(work(std::declval<const fs::path&>())) {
    return with_temp_dir(base, TEMP_DIR_PREFIX, std::forward<Work>(work));
}

// Run work(staged_file_info) with the need_tx outputs redirected into a
// transaction directory; promote them (and their exts side files) only if
// the work succeeded. With no need_tx keys the work runs on file_info as-is.
template <typename Work>
auto with_tx_files(const FileInfo& file_info,
                   const std::vector<std::string>& need_tx,
                   const std::vector<std::string>& exts,
                   Work&& work,
                   const std::string& prefix = TX_DIR_PREFIX)
    -> decltype(work(std::declval<const FileInfo&>())) {
    using R = decltype(work(std::declval<const FileInfo&>()));
    if (need_tx.empty()) return work(file_info);

    auto staged = stage_files(file_info, need_tx, prefix);
    if (staged.is_err()) return R::Err(staged.kind, staged.error);
    TempDirGuard guard(staged.value.tx_dir);

    R out = work(static_cast<const FileInfo&>(staged.value.file_info));
    if (out.is_err()) return out;

    auto promoted = promote_files(staged.value.file_info, file_info, need_tx, exts);
    if (promoted.is_err()) return R::Err(promoted.kind, promoted.error);
    return out;
}

// Single-output form: work(tx_path) writes to the staged path.
template <typename Work>
auto with_tx_file(const std::string& path,
                  const std::vector<std::string>& exts,
                  Work&& work,
                  const std::string& prefix = TX_DIR_PREFIX)
    -> decltype(work(std::declval<const std::string&>())) {
    const std::string key = "out";
    return with_tx_files(FileInfo{{key, path}}, {key}, exts,
        [&](const FileInfo& staged) { return work(staged.at(key)); },
        prefix);
}
