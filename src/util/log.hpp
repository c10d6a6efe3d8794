//
//  log.hpp
//  uttt - Minimal leveled logging to std::clog
//
//  std::format based, one line per record with a UTC timestamp
//

#pragma once

#include <atomic>
#include <chrono>
#include <format>
#include <iostream>
#include <mutex>
#include <string_view>

namespace uttt::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

inline std::atomic<int>& threshold() {
    static std::atomic<int> value{static_cast<int>(Level::Info)};
    return value;
}

inline void set_level(Level level) {
    threshold().store(static_cast<int>(level));
}

inline bool enabled(Level level) {
    return static_cast<int>(level) >= threshold().load();
}

constexpr std::string_view level_tag(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        default: return "";
    }
}

inline void write(Level level, std::string_view message) {
    static std::mutex output_mutex;
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());

    std::lock_guard<std::mutex> lock(output_mutex);
    std::clog << std::format("[{:%Y-%m-%dT%H:%M:%S}Z] [{}] {}\n", now, level_tag(level), message);
}

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Debug)) write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Info)) write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Warn)) write(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Error)) write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace uttt::log
