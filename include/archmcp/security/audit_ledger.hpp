#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Audit Ledger
// ═══════════════════════════════════════════════════════════════════════════
// Append-only record of executed operations, one JSON document per line.
// Each append is written and flushed under a mutex, so records from
// concurrent connections never interleave within a line.

#include "archmcp/error.hpp"
#include "archmcp/json/json.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace archmcp {

/// Random (version 4) UUID in canonical 8-4-4-4-12 form
[[nodiscard]] std::string make_uuid_v4();

/// ISO-8601 UTC with millisecond precision, e.g. "2024-05-01T10:00:00.123Z"
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point when);

struct AuditableOperation {
    std::string id;
    std::string name;
    Json parameters = Json::object();
    std::optional<std::string> user_context;
    std::chrono::system_clock::time_point timestamp;
    std::chrono::milliseconds duration{0};

    /// Empty on success, otherwise Error::describe() of the failure
    std::optional<std::string> failure;

    std::string session_id;

    [[nodiscard]] bool succeeded() const noexcept { return failure.has_value() == false; }

    [[nodiscard]] Json to_json() const;
};

class AuditLedger {
public:
    /// Create missing parent directories and open path for appending
    [[nodiscard]] static Result<std::unique_ptr<AuditLedger>> open(const std::filesystem::path& path);

    AuditLedger(const AuditLedger&) = delete;
    AuditLedger& operator=(const AuditLedger&) = delete;

    /// Write one record and flush. Io error if the write does not reach the file.
    [[nodiscard]] Result<void> append(const AuditableOperation& operation);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] std::size_t records_written() const;

private:
    AuditLedger(std::filesystem::path path, std::ofstream out);

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::ofstream out_;
    std::size_t records_written_{0};
};

}  // namespace archmcp
