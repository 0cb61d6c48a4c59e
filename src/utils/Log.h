// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file Log.h
 * @brief Lightweight leveled logging for the keychain reader
 *
 * Header-only logger built on C++23 std::format. Format strings are checked
 * at compile time and every line carries a millisecond timestamp and the
 * file:line of the call site.
 *
 * @section usage Usage Example
 * @code
 * AgileKeychain::Log::set_level(AgileKeychain::Log::Level::Debug);
 *
 * AgileKeychain::Log::debug("Decoding {} key records", records.size());
 * AgileKeychain::Log::info("Recovered key {}", identifier);
 * AgileKeychain::Log::warning("Key {} failed validation", identifier);
 * AgileKeychain::Log::error("Cannot read {}: {}", path, reason);
 * @endcode
 *
 * @warning Never pass passphrases or key bytes to the logger. Identifiers,
 *          counts and paths are fine.
 *
 * @note Default level is Info. Output goes to std::cerr.
 */

#ifndef AGILEKEYCHAIN_LOG_H
#define AGILEKEYCHAIN_LOG_H

#include <chrono>
#include <concepts>
#include <ctime>
#include <format>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace AgileKeychain::Log {

/**
 * @brief Log severity levels, lowest first
 */
enum class Level {
    Debug,     ///< Per-record decoding and derivation steps
    Info,      ///< Keychain opened, keys recovered
    Warning,   ///< Record rejected, document malformed
    Error      ///< OpenSSL failures, unreadable files
};

/**
 * @brief Current minimum level. Change via set_level().
 */
inline Level current_level = Level::Info;

namespace detail {
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
     * @brief Local timestamp, YYYY-MM-DD HH:MM:SS.mmm
     */
    inline std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t, &tm);

        return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));
    }

    /**
     * @brief Format string bundled with the caller's source location
     *
     * The location default argument is evaluated at the call site of
     * debug()/info()/..., not inside this header.
     */
    template<typename... Args>
    struct LocatedFormat {
        std::format_string<Args...> fmt;
        std::source_location loc;

        template<typename S>
            requires std::convertible_to<const S&, std::string_view>
        consteval LocatedFormat(const S& s,
                                std::source_location l = std::source_location::current())
            : fmt(s), loc(l) {}
    };
}  // namespace detail

/**
 * @brief Emit one line if @p level passes the filter
 *
 * Format: [TIMESTAMP] LEVEL: message (file:line)
 */
template<typename... Args>
void log(Level level, const std::source_location& loc,
         std::format_string<Args...> fmt, Args&&... args) {
    if (level < current_level) {
        return;
    }

    auto message = std::format(fmt, std::forward<Args>(args)...);
    std::cerr << std::format("[{}] {}: {} ({}:{})\n",
        detail::get_timestamp(), detail::level_to_string(level), message,
        loc.file_name(), loc.line());
}

template<typename... Args>
void debug(detail::LocatedFormat<std::type_identity_t<Args>...> fmt, Args&&... args) {
    log(Level::Debug, fmt.loc, fmt.fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void info(detail::LocatedFormat<std::type_identity_t<Args>...> fmt, Args&&... args) {
    log(Level::Info, fmt.loc, fmt.fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void warning(detail::LocatedFormat<std::type_identity_t<Args>...> fmt, Args&&... args) {
    log(Level::Warning, fmt.loc, fmt.fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void error(detail::LocatedFormat<std::type_identity_t<Args>...> fmt, Args&&... args) {
    log(Level::Error, fmt.loc, fmt.fmt, std::forward<Args>(args)...);
}

/**
 * @brief Set minimum log level at runtime
 *
 * Intended to be called once at start-up, before any keychain is opened.
 */
inline void set_level(Level level) {
    current_level = level;
}

} // namespace AgileKeychain::Log

#endif // AGILEKEYCHAIN_LOG_H
