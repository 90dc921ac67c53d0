#include "utils.hpp"
#include "types.hpp"
#include <chrono>
#include <ctime>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:         return "none";
        case ErrorKind::IOError:      return "io";
        case ErrorKind::InvalidState: return "invalid-state";
        case ErrorKind::Command:      return "command";
    }
    return "unknown";
}

std::string now_formatted(const std::string& pattern) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), pattern.c_str(), &tm_buf);
    return std::string(buf, n);
}

std::string replace_all(const std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (true) {
        size_t hit = s.find(from, pos);
        if (hit == std::string::npos) break;
        out.append(s, pos, hit - pos);
        out += to;
        pos = hit + from.size();
    }
    out.append(s, pos, std::string::npos);
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}
