#include "log.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>

static std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "solo_debug.log").string();
    return path;
}

void set_log_path(const std::filesystem::path& path) {
    log_path_storage() = path.string();
}

const std::string& solo_log_path() {
    return log_path_storage();
}

void solo_log(const std::string& msg) {
    std::ofstream out(solo_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

void solo_warn(const std::string& msg) {
    solo_log("WARN " + msg);
}
