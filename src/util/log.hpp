#pragma once
#include <fmt/format.h>
#include <cstdio>
#include <ctime>
#include <string>

namespace csvsa {

enum class log_level { error = 0, warn = 1, info = 2, debug = 3 };

inline std::string now_iso_utc() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

namespace detail {
// Set once by main() before the pipeline starts.
inline log_level& log_threshold() {
    static log_level level = log_level::info;
    return level;
}

inline const char* level_name(log_level l) {
    switch (l) {
        case log_level::error: return "ERROR";
        case log_level::warn:  return "WARN";
        case log_level::info:  return "INFO";
        default:               return "DEBUG";
    }
}
}

inline void set_log_level(log_level l) { detail::log_threshold() = l; }

inline void vlog(log_level l, fmt::string_view fmt_str, fmt::format_args args) {
    if (static_cast<int>(l) > static_cast<int>(detail::log_threshold())) return;
    fmt::print(stderr, "{} - {} - {}\n", now_iso_utc(), detail::level_name(l),
               fmt::vformat(fmt_str, args));
}

template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args&&... args) {
    vlog(log_level::error, f, fmt::make_format_args(args...));
}
template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args&&... args) {
    vlog(log_level::warn, f, fmt::make_format_args(args...));
}
template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args&&... args) {
    vlog(log_level::info, f, fmt::make_format_args(args...));
}
template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args&&... args) {
    vlog(log_level::debug, f, fmt::make_format_args(args...));
}
}
