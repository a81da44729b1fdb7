#include "utils.hpp"
#include <chrono>
#include <ctime>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        // Reject trailing garbage like "10x"
        if (used != s.size()) return fallback;
        return v;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::vector<std::string> split_args(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    bool in_quotes = false;
    bool have_token = false;

    for (char c : s) {
        if (c == '"') {
            in_quotes = !in_quotes;
            have_token = true;
            continue;
        }
        if (!in_quotes && (c == ' ' || c == '\t')) {
            if (have_token) {
                out.push_back(cur);
                cur.clear();
                have_token = false;
            }
            continue;
        }
        cur += c;
        have_token = true;
    }
    if (have_token) out.push_back(cur);
    return out;
}
