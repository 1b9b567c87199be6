/**
 * @file log.hpp
 * @brief Level-gated diagnostics in the "[Component] message" form
 *
 * Messages go to std::cerr unless a different sink is installed (tests capture
 * output through a std::ostringstream).
 */

#pragma once

#include "adaptr/config.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string_view>

namespace adaptr {

constexpr const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Off:     return "OFF";
        default:                return "?";
    }
}

class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Warning, std::ostream* sink = &std::cerr)
        : level_(level), sink_(sink) {}

    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        const LogLevel threshold = level_.load(std::memory_order_relaxed);
        return threshold != LogLevel::Off && level >= threshold;
    }

    void log(LogLevel level, std::string_view component, std::string_view message) const {
        if (!enabled(level) || level == LogLevel::Off) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        *sink_ << "[" << component << "] " << message << "\n";
    }

    void debug(std::string_view component, std::string_view message) const { log(LogLevel::Debug, component, message); }
    void info(std::string_view component, std::string_view message) const { log(LogLevel::Info, component, message); }
    void warning(std::string_view component, std::string_view message) const { log(LogLevel::Warning, component, message); }
    void error(std::string_view component, std::string_view message) const { log(LogLevel::Error, component, message); }

    void set_level(LogLevel level) noexcept { level_.store(level, std::memory_order_relaxed); }
    void set_sink(std::ostream* sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = sink;
    }
    [[nodiscard]] LogLevel level() const noexcept { return level_.load(std::memory_order_relaxed); }

private:
    std::atomic<LogLevel> level_;
    std::ostream* sink_;
    mutable std::mutex mutex_;
};

} // namespace adaptr
