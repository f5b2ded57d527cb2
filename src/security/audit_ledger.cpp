#include "archmcp/security/audit_ledger.hpp"

#include <array>
#include <cstdint>
#include <format>
#include <random>
#include <system_error>

namespace archmcp {

std::string make_uuid_v4() {
    thread_local std::mt19937_64 rng{std::random_device{}()};

    std::array<std::uint8_t, 16> bytes{};
    for (std::size_t i = 0; i < bytes.size(); i += 8) {
        std::uint64_t chunk = rng();
        for (std::size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<std::uint8_t>(chunk >> (j * 8));
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    static constexpr char kHex[] = "0123456789abcdef";
    std::string text;
    text.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if ((i == 4) || (i == 6) || (i == 8) || (i == 10)) {
            text.push_back('-');
        }
        text.push_back(kHex[bytes[i] >> 4]);
        text.push_back(kHex[bytes[i] & 0x0F]);
    }
    return text;
}

std::string format_timestamp(std::chrono::system_clock::time_point when) {
    return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::milliseconds>(when));
}

Json AuditableOperation::to_json() const {
    Json j = {
        {"id", id},
        {"name", name},
        {"parameters", parameters},
        {"user_context", user_context.has_value() ? Json(*user_context) : Json(nullptr)},
        {"timestamp", format_timestamp(timestamp)},
        {"duration_ms", duration.count()},
        {"session_id", session_id}
    };
    if (failure.has_value()) {
        j["status"] = "error";
        j["result"] = *failure;
    } else {
        j["status"] = "success";
        j["result"] = "Success";
    }
    return j;
}

// ─────────────────────────────────────────────────────────────────────────────
// AuditLedger
// ─────────────────────────────────────────────────────────────────────────────

AuditLedger::AuditLedger(std::filesystem::path path, std::ofstream out)
    : path_(std::move(path))
    , out_(std::move(out))
{}

Result<std::unique_ptr<AuditLedger>> AuditLedger::open(const std::filesystem::path& path) {
    if (path.empty()) {
        return tl::unexpected(Error::configuration("audit log path is empty"));
    }

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return tl::unexpected(Error::io(
                "cannot create audit log directory " + path.parent_path().string() + ": " + ec.message()));
        }
    }

    std::ofstream out(path, std::ios::out | std::ios::app);
    if (out.is_open() == false) {
        return tl::unexpected(Error::io("cannot open audit log " + path.string()));
    }

    return std::unique_ptr<AuditLedger>(new AuditLedger(path, std::move(out)));
}

Result<void> AuditLedger::append(const AuditableOperation& operation) {
    // Serialize outside the lock
    std::string line = operation.to_json().dump(-1, ' ', false, Json::error_handler_t::replace);
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(mutex_);
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    out_.flush();
    if (out_.fail()) {
        out_.clear();
        return tl::unexpected(Error::io("failed to write audit record to " + path_.string()));
    }
    ++records_written_;
    return {};
}

std::size_t AuditLedger::records_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_written_;
}

}  // namespace archmcp
