#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace semroute {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Per-probe and per-score detail
    Debug = 1,  // Probe failures, attempt failures
    Info  = 2,  // Registration, lifecycle, recovery
    Warn  = 3,  // Circuit opened, request exhausted all providers
    Error = 4,  // Probe task crashed
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// Log Record - Immutable snapshot of a log event
// ─────────────────────────────────────────────────────────────────────────────
// `component` names the engine part that emitted the event: registry, health,
// circuit, router, failover, engine.

struct LogRecord {
    LogLevel level;
    std::string component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string_view comp,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , component(comp)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Check if a level would be logged (for avoiding expensive formatting)
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(
        LogLevel level,
        std::string_view component,
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            log(LogRecord(level, component, std::string(msg), loc));
        }
    }

    template<typename... Args>
    void write_fmt(
        LogLevel level,
        std::string_view component,
        std::format_string<Args...> fmt,
        Args&&... args
    ) {
        if (should_log(level)) {
            log(LogRecord(level, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - Discards all logs (zero overhead when disabled)
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

// Get the global logger instance (defaults to NullLogger)
[[nodiscard]] ILogger& get_logger() noexcept;

// Set a new global logger (takes ownership). nullptr restores NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Convenience macros with automatic source location.
// The message expression is only evaluated when the level is enabled.

#define SEMROUTE_LOG_AT(level, component, msg) \
    do { if (::semroute::get_logger().should_log(level)) \
         ::semroute::get_logger().write(level, component, msg); } while(false)

#define SEMROUTE_LOG_TRACE(component, msg) SEMROUTE_LOG_AT(::semroute::LogLevel::Trace, component, msg)
#define SEMROUTE_LOG_DEBUG(component, msg) SEMROUTE_LOG_AT(::semroute::LogLevel::Debug, component, msg)
#define SEMROUTE_LOG_INFO(component, msg)  SEMROUTE_LOG_AT(::semroute::LogLevel::Info, component, msg)
#define SEMROUTE_LOG_WARN(component, msg)  SEMROUTE_LOG_AT(::semroute::LogLevel::Warn, component, msg)
#define SEMROUTE_LOG_ERROR(component, msg) SEMROUTE_LOG_AT(::semroute::LogLevel::Error, component, msg)

}  // namespace semroute
