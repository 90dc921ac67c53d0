#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

// ── Filesystem queries ──────────────────────────────────────
// Thin non-throwing wrappers; a path that cannot be stat'ed reads as absent.

// Parent directory of the absolute form of `path` ("out.txt" -> cwd).
fs::path parent_directory(const std::string& path);

// Final path component: "/a/b/c.txt" -> "c.txt".
std::string base_name(const std::string& path);

bool file_exists(const std::string& path);
bool is_directory(const std::string& path);

// Size in bytes of a regular file; empty if it does not exist.
std::optional<std::uintmax_t> file_size(const std::string& path);

// Last modification time; empty if the path does not exist.
std::optional<fs::file_time_type> modified_time(const std::string& path);

// ── Naming ──────────────────────────────────────────────────
// Generate new file names from existing ones.

// Retrieve file name without extension: /path/to/fname.txt -> /path/to/fname
std::string file_root(const std::string& fname);

// Extension of the final component including the dot, "" if none.
std::string file_extension(const std::string& fname);

// Add file extender: base.txt -> base-part.txt. With out_dir, the result is
// relocated there keeping only its base name.
std::string add_file_part(const std::string& fname, const std::string& part,
                          const std::string& out_dir = "");

// Remove file specialization extender: base-part.txt -> base.txt
std::string remove_file_part(const std::string& fname, const std::string& part);

// Remove compression/archive extensions: test.tar.gz -> test, test.txt.gz -> test.txt
std::string remove_zip_ext(const std::string& fname);

// ── Manipulation ────────────────────────────────────────────

// Remove a file or directory tree only if it exists. Returns false on error.
bool remove_path(const std::string& path);

// Normalized absolute path with a leading ~ expanded to the home directory.
std::string abspath(const std::string& path);
