#pragma once
#include <string>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace chatbackup {

namespace fs = std::filesystem;

inline std::string home_dir() {
#ifdef _WIN32
    const char* h = std::getenv("USERPROFILE");
    if (!h) h = std::getenv("HOMEDRIVE");
#else
    const char* h = std::getenv("HOME");
#endif
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && (p[1] == '/' || p[1] == '\\')) {
        return home_dir() + p.substr(1);
    }
    return p;
}

inline std::string default_config_path() {
    return home_dir() + "/.chatbackup/config.json";
}

inline std::string default_data_dir() {
    return home_dir() + "/.chatbackup/data";
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline std::tm local_tm(std::time_t t) {
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

// Local time as ISO-8601 with microseconds: 2024-01-15T09:30:00.123456
inline std::string iso_now() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;
    std::tm tm = local_tm(t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::ostringstream ss;
    ss << buf << '.' << std::setw(6) << std::setfill('0') << us;
    return ss.str();
}

// Suffix used for rotated log files: 20240115_093000
inline std::string rotation_stamp() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = local_tm(t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

inline int64_t epoch_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Truncate to at most max_chars UTF-8 code points without splitting one.
inline std::string utf8_prefix(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    size_t i = 0;
    while (i < s.size() && chars < max_chars) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 1;
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;
        if (i + len > s.size()) break;
        i += len;
        chars++;
    }
    return s.substr(0, i);
}

} // namespace chatbackup
