#pragma once

#include <string>
#include <string_view>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <fstream>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <type_traits>

namespace ccdash::utils {

// ============================================================================
// Time Utilities
// ============================================================================

inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds{1000};
        --time;
    }

    std::tm tm_buf;
    ::localtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    char tz_buf[8];
    std::strftime(tz_buf, sizeof(tz_buf), "%z", &tm_buf);

    return std::format("{}.{:03d}{}", time_buf, static_cast<int>(ms.count()), tz_buf);
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

[[nodiscard]] inline int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

[[nodiscard]] inline std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) {
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{ms})};
}

// ============================================================================
// Numeric Parsing (std::from_chars, locale independent)
// ============================================================================

/// a + b, clamped to the int64_t range instead of overflowing.
[[nodiscard]] inline int64_t saturating_add(int64_t a, int64_t b) {
    constexpr auto kMax = std::numeric_limits<int64_t>::max();
    constexpr auto kMin = std::numeric_limits<int64_t>::min();
    if (b > 0 && a > kMax - b) return kMax;
    if (b < 0 && a < kMin - b) return kMin;
    return a + b;
}

// Parse integer, returns std::nullopt on failure or trailing garbage
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

/**
 * @brief Parse an RFC 3339 timestamp into a UTC time point.
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS", an optional fraction of any length
 * (truncated to microseconds) and a "Z" or "+hh:mm" / "-hh:mm" offset.
 * A lowercase 't' or a space separator is accepted as well.
 */
[[nodiscard]] inline std::optional<std::chrono::system_clock::time_point>
parse_rfc3339(std::string_view s) {
    if (s.size() < 20) return std::nullopt;
    if (s[4] != '-' || s[7] != '-' || s[13] != ':' || s[16] != ':') return std::nullopt;
    if (s[10] != 'T' && s[10] != 't' && s[10] != ' ') return std::nullopt;

    const auto year = try_parse_int<int>(s.substr(0, 4));
    const auto month = try_parse_int<unsigned>(s.substr(5, 2));
    const auto day = try_parse_int<unsigned>(s.substr(8, 2));
    const auto hour = try_parse_int<int>(s.substr(11, 2));
    const auto minute = try_parse_int<int>(s.substr(14, 2));
    const auto second = try_parse_int<int>(s.substr(17, 2));
    if (!year || !month || !day || !hour || !minute || !second) return std::nullopt;
    if (*hour > 23 || *minute > 59 || *second > 60) return std::nullopt;

    const std::chrono::year_month_day ymd{
        std::chrono::year{*year}, std::chrono::month{*month}, std::chrono::day{*day}};
    if (!ymd.ok()) return std::nullopt;

    size_t pos = 19;
    int64_t micros = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        const size_t frac_start = pos;
        int digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (s[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (pos == frac_start) return std::nullopt;
        for (; digits < 6; ++digits) micros *= 10;
    }

    if (pos >= s.size()) return std::nullopt;

    int offset_minutes = 0;
    if (s[pos] == 'Z' || s[pos] == 'z') {
        ++pos;
    } else if (s[pos] == '+' || s[pos] == '-') {
        if (pos + 6 != s.size() || s[pos + 3] != ':') return std::nullopt;
        const auto oh = try_parse_int<int>(s.substr(pos + 1, 2));
        const auto om = try_parse_int<int>(s.substr(pos + 4, 2));
        if (!oh || !om || *oh > 23 || *om > 59) return std::nullopt;
        offset_minutes = *oh * 60 + *om;
        if (s[pos] == '-') offset_minutes = -offset_minutes;
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    const auto tp = std::chrono::sys_days{ymd}
        + std::chrono::hours{*hour}
        + std::chrono::minutes{*minute - offset_minutes}
        + std::chrono::seconds{*second}
        + std::chrono::microseconds{micros};
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(tp);
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

[[nodiscard]] inline bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start_);
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, level-tagged, stderr or file)
// ============================================================================

namespace log {

enum class Level { INFO, WARN, ERROR };

namespace detail {
    struct Sink {
        std::mutex mutex;
        Level min_level = Level::INFO;
        std::ofstream file;
    };

    inline Sink& sink() {
        static Sink s;
        return s;
    }

    inline void write(Level level, const std::string& msg) {
        auto& s = sink();
        const char* tag = "";
        switch (level) {
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

        std::lock_guard<std::mutex> lock(s.mutex);
        if (level < s.min_level) return;
        if (s.file.is_open()) {
            s.file << formatted;
            s.file.flush();
        } else {
            std::cerr << formatted;
        }
    }
} // namespace detail

/// Parse "info" / "warn" / "error" (case-insensitive).
[[nodiscard]] inline std::optional<Level> parse_level(const std::string& name) {
    const auto lower = to_lower(name);
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

/**
 * @brief Set the minimum level and the output target.
 * @param file Append to this file; empty keeps stderr
 * @return false if the file could not be opened (stderr stays in use)
 */
inline bool configure(Level min_level, const std::string& file = "") {
    auto& s = detail::sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.min_level = min_level;
    if (s.file.is_open()) s.file.close();
    if (file.empty()) return true;
    s.file.open(file, std::ios::app);
    return s.file.is_open();
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

} // namespace ccdash::utils
