#include "path_utils.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <system_error>

namespace fs = std::filesystem;

fs::path parent_directory(const std::string& path) {
    if (path.empty()) return {};
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec) return {};
    return abs.lexically_normal().parent_path();
}

std::string base_name(const std::string& path) {
    return fs::path(path).filename().string();
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::optional<std::uintmax_t> file_size(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

std::optional<fs::file_time_type> modified_time(const std::string& path) {
    std::error_code ec;
    auto t = fs::last_write_time(path, ec);
    if (ec) return std::nullopt;
    return t;
}

// Index of the extension dot within the final component, npos if none.
// A leading dot (".bashrc") is part of the name, not an extension.
static size_t extension_dot(const std::string& fname) {
    size_t slash = fname.find_last_of('/');
    size_t name_start = (slash == std::string::npos) ? 0 : slash + 1;
    size_t dot = fname.find_last_of('.');
    if (dot == std::string::npos || dot <= name_start) return std::string::npos;
    return dot;
}

std::string file_root(const std::string& fname) {
    size_t dot = extension_dot(fname);
    return dot == std::string::npos ? fname : fname.substr(0, dot);
}

std::string file_extension(const std::string& fname) {
    size_t dot = extension_dot(fname);
    return dot == std::string::npos ? "" : fname.substr(dot);
}

std::string add_file_part(const std::string& fname, const std::string& part,
                          const std::string& out_dir) {
    std::string out_fname = file_root(fname) + "-" + part + file_extension(fname);
    if (out_dir.empty()) return out_fname;
    return (fs::path(out_dir) / base_name(out_fname)).string();
}

std::string remove_file_part(const std::string& fname, const std::string& part) {
    return replace_all(fname, "-" + part, "");
}

std::string remove_zip_ext(const std::string& fname) {
    static const char* exts[] = {".tar.gz", ".tar.bz2", ".gz", ".bz2", ".zip"};
    std::string out = fname;
    for (const char* ext : exts) {
        if (ends_with(out, ext)) {
            out.erase(out.size() - std::string(ext).size());
        }
    }
    return out;
}

bool remove_path(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(path, ec))) return true;
    if (fs::is_directory(fs::symlink_status(path, ec))) {
        fs::remove_all(path, ec);
    } else {
        fs::remove(path, ec);
    }
    return !ec;
}

std::string abspath(const std::string& path) {
    std::string expanded = path;
    if (expanded == "~") {
        expanded = platform::home_dir().string();
    } else if (starts_with(expanded, "~/")) {
        expanded = (platform::home_dir() / expanded.substr(2)).string();
    }
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(expanded), ec);
    if (ec) return expanded;
    return abs.lexically_normal().string();
}
