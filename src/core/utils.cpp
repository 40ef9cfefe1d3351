#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

static std::string format_local(std::time_t t) {
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string format_unix_time(std::int64_t seconds) {
    return format_local(static_cast<std::time_t>(seconds));
}

std::int64_t unix_now() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
}

bool parse_int64(const std::string& s, std::int64_t& out) {
    if (s.empty()) return false;
    try {
        size_t pos = 0;
        long long v = std::stoll(s, &pos, 10);
        if (pos != s.size()) return false;
        out = static_cast<std::int64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
