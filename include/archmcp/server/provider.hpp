#pragma once

#include "archmcp/error.hpp"
#include "archmcp/protocol/mcp_types.hpp"

#include <asio/awaitable.hpp>

#include <string>
#include <vector>

namespace archmcp {

// ─────────────────────────────────────────────────────────────────────────────
// IProvider - a pluggable set of tools and resources
// ─────────────────────────────────────────────────────────────────────────────
//
// tools() and resources() are read once, at registration; a provider must
// not change its declarations afterwards. The handlers may be entered
// concurrently from several connections.

class IProvider {
public:
    virtual ~IProvider() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual std::vector<Tool> tools() const = 0;

    [[nodiscard]] virtual std::vector<Resource> resources() const = 0;

    /// args is always a JSON object
    [[nodiscard]] virtual asio::awaitable<Result<ToolResult>> handle_tool_call(
        const std::string& tool_name,
        ToolArgs args
    ) = 0;

    [[nodiscard]] virtual asio::awaitable<Result<std::string>> handle_resource_read(
        const std::string& uri
    ) = 0;
};

}  // namespace archmcp
