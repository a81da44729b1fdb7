#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <algorithm>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string& probe_log_path_ref() {
    static std::string path = (platform::temp_dir() / "mailprobe_debug.log").string();
    return path;
}

inline const std::string& probe_log_path() {
    return probe_log_path_ref();
}

// Redirect the debug log. An empty path keeps the current one.
inline void set_probe_log_path(const std::string& path) {
    if (!path.empty()) probe_log_path_ref() = path;
}

inline void probe_log(const std::string& msg) {
    std::ofstream out(probe_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

// Log one side of the conversation, truncated and with CR/LF made visible.
inline void probe_log_io(const std::string& label, const std::string& data,
                         size_t max_len = 200) {
    std::string shown;
    shown.reserve(std::min(data.size(), max_len) + 8);
    for (size_t i = 0; i < data.size() && i < max_len; ++i) {
        char c = data[i];
        if (c == '\r') shown += "\\r";
        else if (c == '\n') shown += "\\n";
        else shown += c;
    }
    if (data.size() > max_len) shown += "...";
    probe_log(fmt::format("{} ({} bytes): {}", label, data.size(), shown));
}
