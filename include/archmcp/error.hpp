#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Error
// ═══════════════════════════════════════════════════════════════════════════
// Domain error type shared by every layer of the server: registry, audit,
// command execution, compositor IPC and the providers built on top of them.
//
// Errors travel as values (tl::expected). The dispatcher is the only place
// that turns them into JSON-RPC error objects (see to_rpc_error()).

#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace archmcp {

/// Error categories for server operations
enum class ErrorCode {
    Protocol,          ///< Malformed message or invalid request shape
    InvalidParams,     ///< Missing or mistyped arguments
    NotFound,          ///< Unknown tool, resource or method
    PermissionDenied,  ///< Operation requires privilege not held
    ResourceLocked,    ///< Conflicting operation in progress
    Configuration,     ///< Missing environment or invalid setup
    SystemCommand,     ///< External process failed
    Timeout,           ///< Operation exceeded its wall-clock budget
    Ipc,               ///< Compositor socket could not be used
    Io,                ///< Local file or stream failure
    Other              ///< Unclassified cause
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Protocol:         return "Protocol";
        case ErrorCode::InvalidParams:    return "InvalidParams";
        case ErrorCode::NotFound:         return "NotFound";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::ResourceLocked:   return "ResourceLocked";
        case ErrorCode::Configuration:    return "Configuration";
        case ErrorCode::SystemCommand:    return "SystemCommand";
        case ErrorCode::Timeout:          return "Timeout";
        case ErrorCode::Ipc:              return "Ipc";
        case ErrorCode::Io:               return "Io";
        case ErrorCode::Other:            return "Other";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code{ErrorCode::Other};
    std::string message;

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static Error protocol(std::string msg) {
        return {ErrorCode::Protocol, std::move(msg)};
    }

    [[nodiscard]] static Error invalid_params(std::string msg) {
        return {ErrorCode::InvalidParams, std::move(msg)};
    }

    [[nodiscard]] static Error not_found(std::string msg) {
        return {ErrorCode::NotFound, std::move(msg)};
    }

    [[nodiscard]] static Error permission_denied(std::string msg) {
        return {ErrorCode::PermissionDenied, std::move(msg)};
    }

    [[nodiscard]] static Error resource_locked(std::string msg) {
        return {ErrorCode::ResourceLocked, std::move(msg)};
    }

    [[nodiscard]] static Error configuration(std::string msg) {
        return {ErrorCode::Configuration, std::move(msg)};
    }

    [[nodiscard]] static Error system_command(std::string msg) {
        return {ErrorCode::SystemCommand, std::move(msg)};
    }

    [[nodiscard]] static Error timeout(std::string msg) {
        return {ErrorCode::Timeout, std::move(msg)};
    }

    [[nodiscard]] static Error ipc(std::string msg) {
        return {ErrorCode::Ipc, std::move(msg)};
    }

    [[nodiscard]] static Error io(std::string msg) {
        return {ErrorCode::Io, std::move(msg)};
    }

    [[nodiscard]] static Error other(std::string msg) {
        return {ErrorCode::Other, std::move(msg)};
    }

    /// Human-readable form, e.g. "Permission denied: requires root"
    [[nodiscard]] std::string describe() const;
};

/// Result type for server operations
template <typename T>
using Result = tl::expected<T, Error>;

}  // namespace archmcp
