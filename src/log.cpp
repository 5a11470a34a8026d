// =============================================================================
// log.cpp - Leveled diagnostics
// =============================================================================

#include "lendcore/log.hpp"
#include <iostream>

namespace lendcore {

namespace {

std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::Info)};
std::atomic<std::ostream*> g_sink{nullptr};
std::mutex g_write_mutex;

} // namespace

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off" || name == "none") return LogLevel::Off;
    return LogLevel::Info;
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "info";
}

namespace log {

void set_level(LogLevel level) {
    g_level.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

LogLevel level() {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void set_sink(std::ostream* sink) {
    g_sink.store(sink, std::memory_order_release);
}

bool enabled(LogLevel lvl) {
    if (lvl == LogLevel::Off) return false;
    return static_cast<uint8_t>(lvl) >= g_level.load(std::memory_order_relaxed);
}

void write(LogLevel lvl, const std::string& component, const std::string& message) {
    std::ostream* sink = g_sink.load(std::memory_order_acquire);
    std::ostream& out = sink ? *sink : std::cerr;

    std::lock_guard lock(g_write_mutex);
    out << "[" << to_string(lvl) << "] " << component << ": " << message << std::endl;
}

} // namespace log

} // namespace lendcore
