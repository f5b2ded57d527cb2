#pragma once

#include "archmcp/log/logger.hpp"
#include "archmcp/security/audit_ledger.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/strand.hpp>

#include <chrono>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace archmcp {

// ─────────────────────────────────────────────────────────────────────────────
// SecurityManager - session identity plus the audit ledger
// ─────────────────────────────────────────────────────────────────────────────
//
// One instance per server process. The session id is fixed at construction
// and stamped on every audit record. Ledger writes run one at a time on a
// strand of the given executor; audited callers suspend until theirs is done.

class SecurityManager {
public:
    SecurityManager(asio::any_io_executor executor,
                    bool require_auth,
                    std::unique_ptr<AuditLedger> ledger,
                    std::optional<std::string> user_context);

    /// Open the ledger at audit_log_path; the user context is taken from $USER
    [[nodiscard]] static Result<std::unique_ptr<SecurityManager>> create(
        asio::any_io_executor executor,
        bool require_auth,
        const std::filesystem::path& audit_log_path
    );

    [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }
    [[nodiscard]] const std::optional<std::string>& user_context() const noexcept { return user_context_; }
    [[nodiscard]] bool require_auth() const noexcept { return require_auth_; }
    [[nodiscard]] const AuditLedger& ledger() const noexcept { return *ledger_; }

    /// Hook for per-operation authorization; logs the check when
    /// require_auth is set and currently admits everything.
    [[nodiscard]] Result<void> check_permission(std::string_view operation) const;

    /// Run operation, append one audit record describing it, and return the
    /// operation's own result. An exception escaping the operation becomes an
    /// Other error. If the record cannot be written the ledger error is
    /// returned instead, even when the operation succeeded.
    template <typename T>
    [[nodiscard]] asio::awaitable<Result<T>> execute_with_audit(
        std::string operation_name,
        Json parameters,
        asio::awaitable<Result<T>> operation
    );

private:
    [[nodiscard]] asio::awaitable<Result<void>> record(AuditableOperation entry) const;
    [[nodiscard]] asio::awaitable<Result<void>> write_record(AuditableOperation entry) const;

    asio::strand<asio::any_io_executor> ledger_strand_;
    bool require_auth_;
    std::unique_ptr<AuditLedger> ledger_;
    std::optional<std::string> user_context_;
    std::string session_id_;
};

template <typename T>
asio::awaitable<Result<T>> SecurityManager::execute_with_audit(
    std::string operation_name,
    Json parameters,
    asio::awaitable<Result<T>> operation)
{
    AuditableOperation entry;
    entry.id = make_uuid_v4();
    entry.name = std::move(operation_name);
    entry.parameters = std::move(parameters);
    entry.user_context = user_context_;
    entry.session_id = session_id_;
    entry.timestamp = std::chrono::system_clock::now();

    get_logger().logf(LogLevel::Info, "starting audited operation {} ({})", entry.name, entry.id);

    const auto started = std::chrono::steady_clock::now();
    std::optional<Result<T>> outcome;
    try {
        outcome.emplace(co_await std::move(operation));
    } catch (const std::exception& e) {
        // A throwing provider is a failed operation and is recorded as one
        outcome.emplace(tl::unexpected(Error::other(std::string("operation threw: ") + e.what())));
    }
    Result<T> result = std::move(*outcome);
    entry.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (result.has_value()) {
        get_logger().logf(LogLevel::Info, "operation {} completed in {} ms", entry.id, entry.duration.count());
    } else {
        entry.failure = result.error().describe();
        get_logger().logf(LogLevel::Error, "operation {} failed: {}", entry.id, *entry.failure);
    }

    if (auto written = co_await record(std::move(entry)); !written) {
        co_return tl::unexpected(written.error());
    }
    co_return result;
}

}  // namespace archmcp
