#include "archmcp/error.hpp"

namespace archmcp {

namespace {

[[nodiscard]] std::string_view kind_prefix(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Protocol:         return "Protocol error";
        case ErrorCode::InvalidParams:    return "Invalid params";
        case ErrorCode::NotFound:         return "Not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::ResourceLocked:   return "Resource locked";
        case ErrorCode::Configuration:    return "Invalid configuration";
        case ErrorCode::SystemCommand:    return "System command failed";
        case ErrorCode::Timeout:          return "Timed out";
        case ErrorCode::Ipc:              return "IPC error";
        case ErrorCode::Io:               return "IO error";
        case ErrorCode::Other:            return "Other error";
    }
    return "Error";
}

}  // namespace

std::string Error::describe() const {
    std::string text(kind_prefix(code));
    if (message.empty() == false) {
        text += ": ";
        text += message;
    }
    return text;
}

}  // namespace archmcp
