#pragma once
// ═══════════════════════════════════════════════════════════════════
//  miniql/console.h — Leveled console logging with colors
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    console::setLevel(console::Level::Debug);
//    console::debug("Resolving", "Query.hello");
//    console::warn("Query failed:", err.what());
//
// ═══════════════════════════════════════════════════════════════════

#include "value.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace miniql::console {

// ── Severity threshold; messages below it are dropped ──
enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Silent = 4 };

namespace detail {

// ANSI color codes
struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Green   = "\033[32m";
    static constexpr const char* Gray    = "\033[90m";
};

inline std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::Warn};
    return level;
}

// Stringify a single argument
template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_same_v<std::decay_t<T>, Json>) {
        return arg.dump(2);
    } else if constexpr (std::is_same_v<std::decay_t<T>, Value>) {
        return arg.toJson().dump(2);
    } else if constexpr (std::is_convertible_v<T, std::string_view>) {
        return std::string(std::string_view(arg));
    } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return arg ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        if constexpr (std::is_floating_point_v<T>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        }
        return std::to_string(arg);
    } else {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    }
}

inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
void print(std::ostream& os, const char* color, const char* prefix, const Args&... args) {
    std::ostringstream line;
    line << detail::Colors::Gray << "[" << timestamp() << "] "
         << color << prefix << detail::Colors::Reset;

    bool first = true;
    auto printOne = [&](const auto& arg) {
        if (!first) line << " ";
        first = false;
        line << stringify(arg);
    };
    (printOne(args), ...);
    line << '\n';
    os << line.str() << std::flush;
}

} // namespace detail

// ── Threshold control ──
inline void setLevel(Level level) {
    detail::threshold().store(level);
}

inline Level level() {
    return detail::threshold().load();
}

inline bool enabled(Level messageLevel) {
    return messageLevel != Level::Silent && messageLevel >= level();
}

// ── Parse "debug", "info", "warn", "error" or "silent" (any case) ──
inline std::optional<Level> parseLevel(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "silent" || lower == "off") return Level::Silent;
    return std::nullopt;
}

// ── console::log ──
template <typename... Args>
void log(const Args&... args) {
    if (!enabled(Level::Info)) return;
    detail::print(std::cout, detail::Colors::Reset, "", args...);
}

// ── console::info ──
template <typename... Args>
void info(const Args&... args) {
    if (!enabled(Level::Info)) return;
    detail::print(std::cout, detail::Colors::Blue, "ℹ ", args...);
}

// ── console::success ──
template <typename... Args>
void success(const Args&... args) {
    if (!enabled(Level::Info)) return;
    detail::print(std::cout, detail::Colors::Green, "✔ ", args...);
}

// ── console::warn ──
template <typename... Args>
void warn(const Args&... args) {
    if (!enabled(Level::Warn)) return;
    detail::print(std::cerr, detail::Colors::Yellow, "⚠ ", args...);
}

// ── console::error ──
template <typename... Args>
void error(const Args&... args) {
    if (!enabled(Level::Error)) return;
    detail::print(std::cerr, detail::Colors::Red, "✖ ", args...);
}

// ── console::debug ──
template <typename... Args>
void debug(const Args&... args) {
    if (!enabled(Level::Debug)) return;
    detail::print(std::cout, detail::Colors::Cyan, "● ", args...);
}

} // namespace miniql::console
