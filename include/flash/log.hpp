#pragma once

/// @file include/flash/log.hpp
/// @brief Levelled stderr logging on top of {fmt}.
///
/// Output format: `[LEVEL] component: message`.
/// The threshold is process-wide and may be changed from any thread.

#include <fmt/core.h>

#include <cstdint>
#include <exception>
#include <string_view>
#include <utility>

namespace flash::log {

enum class Level : std::uint8_t { Debug, Info, Warn, Error, Off };

void  set_level(Level level) noexcept;
[[nodiscard]] Level level() noexcept;
[[nodiscard]] bool  enabled(Level level) noexcept;

[[nodiscard]] std::string_view to_string(Level level) noexcept;

/// Write one already-formatted line. Never throws.
void write(Level level, std::string_view component, std::string_view message) noexcept;

template <typename... Args>
void emit(Level lvl, std::string_view component,
          fmt::format_string<Args...> format, Args&&... args) noexcept {
    if (!enabled(lvl)) return;
    try {
        write(lvl, component, fmt::format(format, std::forward<Args>(args)...));
    } catch (const std::exception& ex) {
        write(Level::Error, component, ex.what());
    }
}

template <typename... Args>
void debug(std::string_view component, fmt::format_string<Args...> format, Args&&... args) noexcept {
    emit(Level::Debug, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::string_view component, fmt::format_string<Args...> format, Args&&... args) noexcept {
    emit(Level::Info, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(std::string_view component, fmt::format_string<Args...> format, Args&&... args) noexcept {
    emit(Level::Warn, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void error(std::string_view component, fmt::format_string<Args...> format, Args&&... args) noexcept {
    emit(Level::Error, component, format, std::forward<Args>(args)...);
}

} // namespace flash::log
