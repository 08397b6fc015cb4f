#pragma once

#include <string>
#include <string_view>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <fstream>
#include <iostream>
#include <mutex>

namespace redactor::utils {

// ============================================================================
// Time Utilities
// ============================================================================

/// ISO-8601 UTC with a 'Z' suffix, used in persisted documents
inline std::string format_timestamp_utc(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    return std::format("{}.{:03d}Z", time_buf, static_cast<int>(ms.count()));
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

/// Lowercase hex encoding of raw bytes
[[nodiscard]] inline std::string to_hex(const unsigned char* data, size_t len) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hex += hex_chars[(data[i] >> 4) & 0x0F];
        hex += hex_chars[data[i] & 0x0F];
    }
    return hex;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged, optional file mirror)
//
// Callers log identities, sizes, counts and placeholders. Never raw values.
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    struct State {
        std::mutex mutex;
        Level min_level = Level::INFO;
        std::ofstream file;
    };

    inline State& state() {
        static State s;
        return s;
    }

    inline void write(Level level, const std::string& msg) {
        auto& st = state();
        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(st.mutex);
        if (level < st.min_level) return;
        std::cerr << formatted;
        if (st.file.is_open()) {
            st.file << formatted;
            st.file.flush();
        }
    }
} // namespace detail

inline void set_level(Level level) {
    auto& st = detail::state();
    std::lock_guard<std::mutex> lock(st.mutex);
    st.min_level = level;
}

/// Accepts "debug", "info", "warn"/"warning", "error"; false on anything else
inline bool parse_level(const std::string& name, Level& out) {
    const std::string lower = to_lower(name);
    if (lower == "debug") { out = Level::DEBUG; return true; }
    if (lower == "info") { out = Level::INFO; return true; }
    if (lower == "warn" || lower == "warning") { out = Level::WARN; return true; }
    if (lower == "error") { out = Level::ERROR; return true; }
    return false;
}

/// Mirror log lines to a file (append). Returns false if it cannot be opened.
inline bool set_file(const std::string& path) {
    auto& st = detail::state();
    std::lock_guard<std::mutex> lock(st.mutex);
    if (st.file.is_open()) st.file.close();
    if (path.empty()) return true;
    st.file.open(path, std::ios::app);
    return st.file.is_open();
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace redactor::utils
