#pragma once

#include <string>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string ghx_log_path() {
    static std::string path = (platform::temp_dir() / "ghx_debug.log").string();
    return path;
}

// GH_DEBUG=1 (or any value but 0/false) turns on debug logging.
inline bool ghx_log_enabled() {
    static bool enabled = env_flag_enabled("GH_DEBUG");
    return enabled;
}

inline void ghx_log(const std::string& msg) {
    if (!ghx_log_enabled()) return;

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

    std::string line = fmt::format("[{}] {}", ts, msg);
    std::cerr << line << "\n";

    std::ofstream out(ghx_log_path(), std::ios::app);
    if (out) out << line << "\n";
}

template <typename... Args>
inline void ghx_logf(fmt::format_string<Args...> f, Args&&... args) {
    if (!ghx_log_enabled()) return;
    ghx_log(fmt::format(f, std::forward<Args>(args)...));
}
