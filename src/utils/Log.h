// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file Log.h
 * @brief Lightweight leveled logging with compile-time format checking
 *
 * Messages are formatted with std::format (checked at compile time) and
 * tagged with the calling file and line. Each line reaches std::cerr in a
 * single insertion, so lines from concurrent request threads stay whole.
 *
 * @section usage Usage Example
 * @code
 * AuthKeep::Log::set_level(AuthKeep::Log::Level::Debug);
 * AuthKeep::Log::info("OTP session created (subject {})", hashed_identifier);
 * AuthKeep::Log::warning("Argon2 time cost {} below recommended minimum", t);
 * AuthKeep::Log::error("Failed to persist store snapshot: {}", path);
 * @endcode
 *
 * @warning Never pass plaintext codes, passphrases or raw identifiers to
 *          any of these functions. Log hashes and opaque ids only.
 *
 * @note Default log level is Info (Debug messages are hidden)
 */

#ifndef AUTHKEEP_LOG_H
#define AUTHKEEP_LOG_H

#include <atomic>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace AuthKeep::Log {

/**
 * @brief Log severity levels
 */
enum class Level {
    Debug,     ///< Detailed debugging information (verbose)
    Info,      ///< General informational messages
    Warning,   ///< Warning conditions (potential issues)
    Error      ///< Error conditions (operation failures)
};

/**
 * @brief Current minimum log level
 *
 * Atomic because the level may be changed by configuration reload while
 * request threads are logging.
 */
inline std::atomic<Level> current_level{Level::Info};

namespace detail {
    /**
     * @brief Convert log level to display string
     * @return Fixed-width string representation (5 chars for alignment)
     */
    inline constexpr std::string_view level_to_string(Level level) noexcept {
        switch (level) {
            case Level::Debug:   return "DEBUG";
            case Level::Info:    return "INFO ";
            case Level::Warning: return "WARN ";
            case Level::Error:   return "ERROR";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Generate UTC timestamp with millisecond precision
     * @return Formatted timestamp string (YYYY-MM-DDTHH:MM:SS.mmmZ)
     */
    inline std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm{};
        gmtime_r(&time_t, &tm);

        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec, ms.count());
    }
}

/**
 * @brief Format string paired with the caller's source location
 *
 * Implicitly constructed from a string literal at the call site, so the
 * location recorded is the caller's and not this header's.
 */
template<typename... Args>
struct LocatedFormat {
    std::format_string<Args...> fmt;
    std::source_location loc;

    template<typename T>
    consteval LocatedFormat(const T& s,
                            std::source_location l = std::source_location::current())
        : fmt(s), loc(l) {}
};

template<typename... Args>
using located_format = LocatedFormat<std::type_identity_t<Args>...>;

namespace detail {
    /**
     * @brief Strip the directory part of a compiler-provided file name
     */
    inline constexpr std::string_view basename(std::string_view path) noexcept {
        auto pos = path.find_last_of('/');
        return pos == std::string_view::npos ? path : path.substr(pos + 1);
    }

    template<typename... Args>
    void write(Level level, const std::source_location& loc,
               std::format_string<Args...> fmt, Args&&... args) {
        if (level < current_level.load(std::memory_order_relaxed)) {
            return;
        }

        // [TIMESTAMP] LEVEL: message (file:line)
        std::cerr << std::format("[{}] {}: {} ({}:{})\n",
            get_timestamp(), level_to_string(level),
            std::format(fmt, std::forward<Args>(args)...),
            basename(loc.file_name()), loc.line());
    }
}

template<typename... Args>
void debug(located_format<Args...> fmt, Args&&... args) {
    detail::write(Level::Debug, fmt.loc, fmt.fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void info(located_format<Args...> fmt, Args&&... args) {
    detail::write(Level::Info, fmt.loc, fmt.fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void warning(located_format<Args...> fmt, Args&&... args) {
    detail::write(Level::Warning, fmt.loc, fmt.fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void error(located_format<Args...> fmt, Args&&... args) {
    detail::write(Level::Error, fmt.loc, fmt.fmt, std::forward<Args>(args)...);
}

/**
 * @brief Whether a message at @p level would currently be written
 */
[[nodiscard]] inline bool enabled(Level level) noexcept {
    return level >= current_level.load(std::memory_order_relaxed);
}

/**
 * @brief Set minimum log level at runtime
 * @param level New minimum log level
 */
inline void set_level(Level level) {
    current_level.store(level, std::memory_order_relaxed);
}

/**
 * @brief Parse a level name as written in the configuration file
 * @param name One of "debug", "info", "warning", "error"
 * @return Parsed level, or std::nullopt for unknown names
 */
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) noexcept {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warning" || name == "warn") return Level::Warning;
    if (name == "error") return Level::Error;
    return std::nullopt;
}

} // namespace AuthKeep::Log

#endif // AUTHKEEP_LOG_H
