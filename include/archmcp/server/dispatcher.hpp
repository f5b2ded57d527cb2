#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Dispatcher - one JSON-RPC line in, at most one JSON-RPC line out
// ─────────────────────────────────────────────────────────────────────────────
//
// Methods: initialize, initialized (alias notifications/initialized),
// tools/list, tools/call, resources/list, resources/read, completion/complete.
//
// Every request with an id gets exactly one response, error or result.
// Notifications are dispatched but never answered. A tools/call that names a
// registered tool is admitted by the AdmissionController and recorded by the
// SecurityManager's audit ledger; an unknown tool is rejected before either.
//
// ─────────────────────────────────────────────────────────────────────────────

#include "archmcp/protocol/json_rpc.hpp"
#include "archmcp/protocol/mcp_types.hpp"
#include "archmcp/security/security_manager.hpp"
#include "archmcp/server/admission_controller.hpp"
#include "archmcp/server/capability_registry.hpp"

#include <asio/awaitable.hpp>
#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace archmcp {

class Dispatcher {
public:
    Dispatcher(CapabilityRegistry& registry,
               AdmissionController& admission,
               SecurityManager& security,
               Implementation server_info);

    /// Handle one framed message (without or with its trailing newline).
    /// Returns the serialized response, or nullopt for notifications and
    /// blank lines.
    [[nodiscard]] asio::awaitable<std::optional<std::string>> handle_message(std::string_view line);

    /// Handle a decoded request. nullopt for notifications.
    [[nodiscard]] asio::awaitable<std::optional<JsonRpcResponse>> handle_request(const JsonRpcRequest& request);

    [[nodiscard]] const Implementation& server_info() const noexcept { return server_info_; }

private:
    using Outcome = tl::expected<Json, JsonRpcError>;

    [[nodiscard]] asio::awaitable<Outcome> route(const std::string& method, const std::optional<Json>& params);

    [[nodiscard]] Outcome on_initialize(const std::optional<Json>& params) const;
    [[nodiscard]] Outcome on_tools_list() const;
    [[nodiscard]] asio::awaitable<Outcome> on_tools_call(const std::optional<Json>& params);
    [[nodiscard]] Outcome on_resources_list() const;
    [[nodiscard]] asio::awaitable<Outcome> on_resources_read(const std::optional<Json>& params);

    [[nodiscard]] asio::awaitable<Result<ToolResult>> run_tool(std::string name, ToolArgs args);

    CapabilityRegistry& registry_;
    AdmissionController& admission_;
    SecurityManager& security_;
    Implementation server_info_;
};

/// Single-line serialization; invalid UTF-8 in tool output is replaced
[[nodiscard]] std::string serialize_response(const JsonRpcResponse& response);

}  // namespace archmcp
