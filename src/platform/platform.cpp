#include "platform.hpp"
#include <cerrno>
#include <cstdlib>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

// mkdtemp/mkstemp rewrite the trailing XXXXXX in place, so the template
// lives in a mutable buffer.
static std::vector<char> make_template(const fs::path& root, const std::string& prefix) {
    std::string tmpl = (root / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    return buf;
}

fs::path make_unique_dir(const fs::path& root, const std::string& prefix,
                         std::error_code& ec) {
    ec.clear();
    auto buf = make_template(root, prefix);
    if (!mkdtemp(buf.data())) {
        ec = std::error_code(errno, std::generic_category());
        return {};
    }
    return fs::path(buf.data());
}

fs::path make_unique_file(const fs::path& dir, const std::string& prefix,
                          std::error_code& ec) {
    ec.clear();
    auto buf = make_template(dir, prefix);
    int fd = mkstemp(buf.data());
    if (fd < 0) {
        ec = std::error_code(errno, std::generic_category());
        return {};
    }
    close(fd);
    return fs::path(buf.data());
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
