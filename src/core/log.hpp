#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log path: $TANDEM_LOG if set, otherwise <tmp>/tandem_debug.log
inline std::string tandem_log_path() {
    static std::string path = [] {
        const char* env = std::getenv("TANDEM_LOG");
        if (env && *env) return std::string(env);
        return (platform::temp_dir() / "tandem_debug.log").string();
    }();
    return path;
}

inline void tandem_log(const std::string& msg) {
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);

    std::ofstream out(tandem_log_path(), std::ios::app);
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
    out << "[" << ts << "] [" << platform::current_pid() << "] " << msg << "\n";
}
