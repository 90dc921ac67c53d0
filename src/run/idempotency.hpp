#pragma once

#include <string>
#include <vector>
#include <filesystem>

// ## Idempotent processing
// Avoid re-running a step when its output files already exist.

// True if any output needs a run: it does not exist or is an empty file.
// A zero-byte file counts as not produced (process killed before writing).
bool needs_run(const std::vector<std::string>& paths);

// True iff `derived` was modified no earlier than `parent`. A missing
// derived file is never up to date; a missing parent never invalidates an
// existing derived file.
bool is_up_to_date(const std::string& derived, const std::string& parent);

// ── Flattening front end ────────────────────────────────────
// needs_run("a.txt", std::vector<std::string>{"b", "c"}, nested_groups)

namespace detail {

inline void collect_paths(std::vector<std::string>& out, const std::string& p) {
    out.push_back(p);
}

inline void collect_paths(std::vector<std::string>& out, const char* p) {
    out.emplace_back(p);
}

inline void collect_paths(std::vector<std::string>& out, const std::filesystem::path& p) {
    out.push_back(p.string());
}

template <typename T>
void collect_paths(std::vector<std::string>& out, const std::vector<T>& group) {
    for (const auto& item : group) collect_paths(out, item);
}

} // namespace detail

template <typename First, typename... Rest>
bool needs_run(const First& first, const Rest&... rest) {
    std::vector<std::string> paths;
    detail::collect_paths(paths, first);
    (detail::collect_paths(paths, rest), ...);
    return needs_run(paths);
}
