#pragma once

#include "archmcp/error.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace archmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
        case LogLevel::Off:   return "off";
    }
    return "unknown";
}

/// Parse a level name as written in config files and on the command line.
/// Accepts the names produced by to_string() plus "warning" and "critical".
[[nodiscard]] Result<LogLevel> parse_log_level(std::string_view text);

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    /// Format and log in one step; the message is only built when the level is enabled.
    template <typename... Args>
    void logf(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(level)) {
            log(LogRecord(level, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

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

/// The process-wide logger (NullLogger until set_logger() is called)
[[nodiscard]] ILogger& get_logger() noexcept;

/// Replace the process-wide logger; nullptr restores the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// The level check happens before the message expression is evaluated, and the
// record captures the caller's source location.
#define ARCHMCP_LOG_AT(level, msg)                                           \
    do {                                                                     \
        ::archmcp::ILogger& archmcp_logger_ = ::archmcp::get_logger();       \
        if (archmcp_logger_.should_log(level)) {                             \
            archmcp_logger_.log(::archmcp::LogRecord((level), (msg)));       \
        }                                                                    \
    } while (false)

#define ARCHMCP_LOG_TRACE(msg) ARCHMCP_LOG_AT(::archmcp::LogLevel::Trace, msg)
#define ARCHMCP_LOG_DEBUG(msg) ARCHMCP_LOG_AT(::archmcp::LogLevel::Debug, msg)
#define ARCHMCP_LOG_INFO(msg)  ARCHMCP_LOG_AT(::archmcp::LogLevel::Info, msg)
#define ARCHMCP_LOG_WARN(msg)  ARCHMCP_LOG_AT(::archmcp::LogLevel::Warn, msg)
#define ARCHMCP_LOG_ERROR(msg) ARCHMCP_LOG_AT(::archmcp::LogLevel::Error, msg)
#define ARCHMCP_LOG_FATAL(msg) ARCHMCP_LOG_AT(::archmcp::LogLevel::Fatal, msg)

}  // namespace archmcp
