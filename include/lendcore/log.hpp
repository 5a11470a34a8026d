#ifndef LENDCORE_LOG_HPP
#define LENDCORE_LOG_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace lendcore {

// =============================================================================
// Leveled diagnostics to std::cerr
// =============================================================================

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

// "debug" | "info" | "warn" | "error" | "off"; unknown names map to Info
LogLevel parse_log_level(const std::string& name);
const char* to_string(LogLevel level);

namespace log {

void set_level(LogLevel level);
LogLevel level();

// Redirect output (tests); nullptr restores std::cerr
void set_sink(std::ostream* sink);

bool enabled(LogLevel level);
void write(LogLevel level, const std::string& component, const std::string& message);

} // namespace log

} // namespace lendcore

// Stream-style helpers; the message expression is only evaluated when enabled
#define LENDCORE_LOG(lvl, component, expr) do { \
    if (::lendcore::log::enabled(lvl)) { \
        std::ostringstream lendcore_log_os_; \
        lendcore_log_os_ << expr; \
        ::lendcore::log::write(lvl, component, lendcore_log_os_.str()); \
    } \
} while(0)

#define LENDCORE_DEBUG(component, expr) LENDCORE_LOG(::lendcore::LogLevel::Debug, component, expr)
#define LENDCORE_INFO(component, expr) LENDCORE_LOG(::lendcore::LogLevel::Info, component, expr)
#define LENDCORE_WARN(component, expr) LENDCORE_LOG(::lendcore::LogLevel::Warn, component, expr)
#define LENDCORE_ERROR(component, expr) LENDCORE_LOG(::lendcore::LogLevel::Error, component, expr)

#endif // LENDCORE_LOG_HPP
