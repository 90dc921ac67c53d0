#pragma once

#include <string>
#include <filesystem>
#include <system_error>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Atomically create a new directory root/<prefix>XXXXXX with a random suffix
// (mkdtemp). Returns an empty path and sets ec on failure.
std::filesystem::path make_unique_dir(const std::filesystem::path& root,
                                      const std::string& prefix,
                                      std::error_code& ec);

// Atomically create a new empty file dir/<prefix>XXXXXX (mkstemp).
// Returns an empty path and sets ec on failure.
std::filesystem::path make_unique_file(const std::filesystem::path& dir,
                                       const std::string& prefix,
                                       std::error_code& ec);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
