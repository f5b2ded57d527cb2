#include "archmcp/security/security_manager.hpp"

#include <asio/co_spawn.hpp>
#include <asio/use_awaitable.hpp>

#include <cstdlib>
#include <stdexcept>

namespace archmcp {

SecurityManager::SecurityManager(asio::any_io_executor executor,
                                 bool require_auth,
                                 std::unique_ptr<AuditLedger> ledger,
                                 std::optional<std::string> user_context)
    : ledger_strand_(asio::make_strand(std::move(executor)))
    , require_auth_(require_auth)
    , ledger_(std::move(ledger))
    , user_context_(std::move(user_context))
    , session_id_(make_uuid_v4())
{
    if (ledger_ == nullptr) {
        throw std::invalid_argument("SecurityManager: ledger cannot be null");
    }
    get_logger().logf(LogLevel::Info, "security session {} (audit log {})",
                      session_id_, ledger_->path().string());
}

Result<std::unique_ptr<SecurityManager>> SecurityManager::create(
    asio::any_io_executor executor,
    bool require_auth,
    const std::filesystem::path& audit_log_path)
{
    auto ledger = AuditLedger::open(audit_log_path);
    if (!ledger) {
        return tl::unexpected(ledger.error());
    }

    std::optional<std::string> user;
    if (const char* name = std::getenv("USER"); (name != nullptr) && (*name != '\0')) {
        user = name;
    }

    return std::make_unique<SecurityManager>(std::move(executor), require_auth, std::move(*ledger), std::move(user));
}

Result<void> SecurityManager::check_permission(std::string_view operation) const {
    if (require_auth_) {
        get_logger().logf(LogLevel::Debug, "permission check for operation {}", operation);
    }
    return {};
}

asio::awaitable<Result<void>> SecurityManager::record(AuditableOperation entry) const {
    co_return co_await asio::co_spawn(ledger_strand_, write_record(std::move(entry)), asio::use_awaitable);
}

asio::awaitable<Result<void>> SecurityManager::write_record(AuditableOperation entry) const {
    auto written = ledger_->append(entry);
    if (!written) {
        get_logger().logf(LogLevel::Error, "audit record for {} not written: {}",
                          entry.id, written.error().describe());
    }
    co_return written;
}

}  // namespace archmcp
