/// @file src/core/log.cpp
/// @brief stderr sink and level threshold for flash::log.

#include "flash/log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace flash::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex         g_write_mutex;

} // namespace

void set_level(Level lvl) noexcept {
    g_level.store(lvl, std::memory_order_relaxed);
}

Level level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl) noexcept {
    const Level threshold = level();
    return threshold != Level::Off && lvl >= threshold;
}

std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off:   return "OFF";
    }
    return "?";
}

void write(Level lvl, std::string_view component, std::string_view message) noexcept {
    // One line per call; the mutex keeps lines from different markets whole.
    std::lock_guard lock(g_write_mutex);
    try {
        fmt::print(stderr, "[{}] {}: {}\n", to_string(lvl), component, message);
    } catch (const std::exception&) {
        std::fputs("[ERROR] log: write failed\n", stderr);
    }
}

} // namespace flash::log
