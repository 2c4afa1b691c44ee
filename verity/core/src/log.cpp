#include "verity/core/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

namespace verity {
namespace {

std::atomic<log_level> g_level{log_level::warn};

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

log_sink& sink_slot() {
    static log_sink sink;
    return sink;
}

} // namespace

void set_log_level(log_level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

log_level current_log_level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

void set_log_sink(log_sink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    sink_slot() = std::move(sink);
}

void log(log_level level, std::string_view component, std::string_view message) {
    if (level == log_level::off || level < current_log_level()) {
        return;
    }
    log_sink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex());
        if (!sink_slot()) {
            std::cerr << "[verity][" << component << "] " << log_level_name(level) << ": " << message
                      << "\n";
            return;
        }
        sink = sink_slot();
    }
    sink(level, component, message);
}

std::optional<log_level> parse_log_level(std::string_view name) noexcept {
    if (name == "debug" || name == "DEBUG") {
        return log_level::debug;
    }
    if (name == "info" || name == "INFO") {
        return log_level::info;
    }
    if (name == "warn" || name == "WARN" || name == "warning" || name == "WARNING") {
        return log_level::warn;
    }
    if (name == "error" || name == "ERROR") {
        return log_level::error;
    }
    if (name == "off" || name == "OFF") {
        return log_level::off;
    }
    return std::nullopt;
}

std::string_view log_level_name(log_level level) noexcept {
    switch (level) {
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warn:
        return "warn";
    case log_level::error:
        return "error";
    case log_level::off:
        return "off";
    }
    return "unknown";
}

} // namespace verity
