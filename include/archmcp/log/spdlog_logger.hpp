#pragma once

#include "archmcp/log/logger.hpp"

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace archmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Logging Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct LoggingConfig {
    LogLevel level{LogLevel::Info};

    /// Also write to this file (parent directories are created)
    std::optional<std::string> file;

    /// spdlog pattern syntax
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v"};

    /// Hand records to a background thread instead of writing inline
    bool async{false};
    std::size_t async_queue_size{8192};
};

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog sinks
// ─────────────────────────────────────────────────────────────────────────────
// The console sink writes to stderr so that stdout stays free for tools that
// pipe the server's output.

class SpdlogLogger final : public ILogger {
public:
    /// Wrap an existing spdlog logger
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level);

    ~SpdlogLogger() override;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    void set_level(LogLevel level) noexcept;

    void flush();

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

/// Build the server logger described by config: a colored stderr sink, plus a
/// file sink when config.file is set. Fails with a Configuration error when the
/// log file cannot be opened.
[[nodiscard]] Result<std::unique_ptr<SpdlogLogger>> make_server_logger(const LoggingConfig& config);

}  // namespace archmcp
