#pragma once

#include "archmcp/error.hpp"
#include "archmcp/json/json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace archmcp {

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

// ─────────────────────────────────────────────────────────────────────────────
// Standard JSON-RPC 2.0 error codes
// ─────────────────────────────────────────────────────────────────────────────

namespace rpc_code {
inline constexpr std::int64_t kParseError     = -32700;
inline constexpr std::int64_t kInvalidRequest = -32600;
inline constexpr std::int64_t kMethodNotFound = -32601;
inline constexpr std::int64_t kInvalidParams  = -32602;
inline constexpr std::int64_t kInternalError  = -32603;
}  // namespace rpc_code

// ─────────────────────────────────────────────────────────────────────────────
// Request id: string, number or null
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcId {
    std::variant<std::nullptr_t, std::int64_t, std::string> value{nullptr};

    static JsonRpcId null();
    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::nullptr_t>(value);
    }

    [[nodiscard]] Json to_json() const;
    static Result<JsonRpcId> from_json(const Json& node);

    friend bool operator==(const JsonRpcId&, const JsonRpcId&) = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Error object
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcError {
    std::int64_t code{rpc_code::kInternalError};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] static JsonRpcError parse_error(std::string detail);
    [[nodiscard]] static JsonRpcError invalid_request(std::string detail);
    [[nodiscard]] static JsonRpcError method_not_found(std::string_view method);
    [[nodiscard]] static JsonRpcError invalid_params(std::string detail);
    [[nodiscard]] static JsonRpcError internal_error(std::string detail);

    [[nodiscard]] Json to_json() const;
    static Result<JsonRpcError> from_json(const Json& node);
};

/// Map a domain error onto the wire. InvalidParams becomes -32602, Protocol
/// becomes -32600, every other kind is -32603. data.kind names the ErrorCode.
[[nodiscard]] JsonRpcError to_rpc_error(const Error& error);

// ─────────────────────────────────────────────────────────────────────────────
// Request / Notification
// ─────────────────────────────────────────────────────────────────────────────
// A message without an "id" member is a notification and is parsed into a
// JsonRpcRequest whose id() is empty.

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::optional<JsonRpcId> id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    [[nodiscard]] const std::optional<JsonRpcId>& id() const noexcept { return id_; }
    [[nodiscard]] const std::optional<Json>& params() const noexcept { return params_; }

    [[nodiscard]] bool is_notification() const noexcept { return id_.has_value() == false; }

    [[nodiscard]] Json to_json() const;

    /// Validate the envelope. A missing "jsonrpc" member is tolerated, any other
    /// version is rejected. Failures are Protocol errors carrying the id when
    /// one could be recovered (see recover_id()).
    static Result<JsonRpcRequest> from_json(const Json& payload);

    /// Best-effort id extraction for error responses to invalid requests
    [[nodiscard]] static JsonRpcId recover_id(const Json& payload);

private:
    std::string method_;
    std::optional<JsonRpcId> id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    [[nodiscard]] const std::optional<Json>& params() const noexcept { return params_; }

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    std::optional<Json> params_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Response: exactly one of result or error
// ─────────────────────────────────────────────────────────────────────────────

class JsonRpcResponse {
public:
    [[nodiscard]] static JsonRpcResponse success(JsonRpcId id, Json result);
    [[nodiscard]] static JsonRpcResponse failure(JsonRpcId id, JsonRpcError error);

    [[nodiscard]] const JsonRpcId& id() const noexcept { return id_; }

    [[nodiscard]] bool is_error() const noexcept {
        return std::holds_alternative<JsonRpcError>(outcome_);
    }

    /// Precondition: !is_error()
    [[nodiscard]] const Json& result() const { return std::get<Json>(outcome_); }

    /// Precondition: is_error()
    [[nodiscard]] const JsonRpcError& error() const { return std::get<JsonRpcError>(outcome_); }

    [[nodiscard]] Json to_json() const;

    /// Rejects documents carrying both or neither of result and error
    static Result<JsonRpcResponse> from_json(const Json& payload);

private:
    JsonRpcResponse(JsonRpcId id, std::variant<Json, JsonRpcError> outcome);

    JsonRpcId id_;
    std::variant<Json, JsonRpcError> outcome_;
};

}  // namespace archmcp
