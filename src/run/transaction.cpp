#include "transaction.hpp"
#include <core/path_utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <system_error>

namespace fs = std::filesystem;

Result<fs::path> make_temp_dir(const fs::path& root, const std::string& prefix) {
    std::error_code ec;
    // create_directories tolerates a concurrent creator winning the race.
    fs::create_directories(root, ec);
    if (ec && !fs::is_directory(root)) {
        return Result<fs::path>::Err(ErrorKind::IOError,
            fmt::format("Cannot create directory {}: {}", root.string(), ec.message()));
    }

    fs::path dir = platform::make_unique_dir(root, prefix, ec);
    if (ec) {
        return Result<fs::path>::Err(ErrorKind::IOError,
            fmt::format("Cannot create temporary directory in {}: {}", root.string(), ec.message()));
    }
    return Result<fs::path>::Ok(dir);
}

// ── TempDirGuard ─────────────────────────────────────────────

TempDirGuard::TempDirGuard(fs::path dir) : dir_(std::move(dir)) {}

TempDirGuard::~TempDirGuard() {
    if (dir_.empty()) return;
    std::error_code ec;
    fs::remove_all(dir_, ec);
}

// ── Staging ──────────────────────────────────────────────────

Result<StagedFiles> stage_files(const FileInfo& file_info,
                                const std::vector<std::string>& need_tx,
                                const std::string& prefix) {
    if (need_tx.empty()) {
        return Result<StagedFiles>::Err(ErrorKind::InvalidState,
                                        "No files given for transaction staging");
    }
    for (const auto& key : need_tx) {
        auto it = file_info.find(key);
        if (it == file_info.end()) {
            return Result<StagedFiles>::Err(ErrorKind::InvalidState,
                "Transaction key not in file info: " + key);
        }
        if (it->second.empty() || base_name(it->second).empty()) {
            return Result<StagedFiles>::Err(ErrorKind::InvalidState,
                "Transaction key has no usable file path: " + key);
        }
    }

    fs::path parent = parent_directory(file_info.at(need_tx.front()));
    if (parent.empty()) {
        return Result<StagedFiles>::Err(ErrorKind::InvalidState,
            "Cannot resolve parent directory of " + file_info.at(need_tx.front()));
    }

    auto tx_dir = make_temp_dir(parent, prefix);
    if (tx_dir.is_err()) {
        return Result<StagedFiles>::Err(tx_dir.kind, tx_dir.error);
    }

    StagedFiles staged;
    staged.file_info = file_info;
    staged.tx_dir = tx_dir.value;
    for (const auto& key : need_tx) {
        staged.file_info[key] = (staged.tx_dir / base_name(file_info.at(key))).string();
    }
    return Result<StagedFiles>::Ok(staged);
}

// ── Promotion ────────────────────────────────────────────────

Result<void> copy_then_rename(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::path dest_dir = to.parent_path().empty() ? fs::path(".") : to.parent_path();
    fs::path tmp = platform::make_unique_file(dest_dir, to.filename().string() + COPY_TMP_SUFFIX, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IOError,
            fmt::format("Cannot create temporary file beside {}: {}", to.string(), ec.message()));
    }

    fs::copy_file(from, tmp, fs::copy_options::overwrite_existing, ec);
    if (!ec) fs::rename(tmp, to, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Result<void>::Err(ErrorKind::IOError,
            fmt::format("Failed to copy {} to {}: {}", from.string(), to.string(), ec.message()));
    }

    fs::remove(from, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IOError,
            fmt::format("Copied {} but could not remove source: {}", from.string(), ec.message()));
    }
    return Result<void>::Ok();
}

Result<void> move_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return Result<void>::Ok();

    if (ec == std::errc::cross_device_link) {
        return copy_then_rename(from, to);
    }
    return Result<void>::Err(ErrorKind::IOError,
        fmt::format("Failed to rename {} to {}: {}", from.string(), to.string(), ec.message()));
}

Result<void> promote_files(const FileInfo& staged,
                           const FileInfo& file_info,
                           const std::vector<std::string>& need_tx,
                           const std::vector<std::string>& exts) {
    for (const auto& key : need_tx) {
        auto safe_it = staged.find(key);
        auto final_it = file_info.find(key);
        if (safe_it == staged.end() || final_it == file_info.end()) {
            return Result<void>::Err(ErrorKind::InvalidState,
                                     "Transaction key not in file info: " + key);
        }
        const std::string& tx_safe = safe_it->second;
        const std::string& tx_final = final_it->second;

        std::error_code ec;
        if (!fs::is_regular_file(tx_safe, ec)) {
            return Result<void>::Err(ErrorKind::IOError,
                fmt::format("Expected output was not produced: {} (final path {})", tx_safe, tx_final));
        }
        auto moved = move_file(tx_safe, tx_final);
        if (moved.is_err()) return moved;

        for (const auto& ext : exts) {
            if (!file_exists(tx_safe + ext)) continue;
            auto side = move_file(tx_safe + ext, tx_final + ext);
            if (side.is_err()) return side;
        }
    }
    return Result<void>::Ok();
}
