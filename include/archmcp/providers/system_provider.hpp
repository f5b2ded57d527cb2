#pragma once

#include "archmcp/config/server_config.hpp"
#include "archmcp/server/provider.hpp"
#include "archmcp/system/command_executor.hpp"

namespace archmcp {

// ─────────────────────────────────────────────────────────────────────────────
// SystemProvider - command execution and host information
// ─────────────────────────────────────────────────────────────────────────────
//
//   system_exec    {command, args[], require_root=false, timeout?}
//   system://info  hostname, kernel, machine, uptime, effective uid

class SystemProvider final : public IProvider {
public:
    explicit SystemProvider(CommandConfig config);

    [[nodiscard]] std::string name() const override { return "system"; }
    [[nodiscard]] std::vector<Tool> tools() const override;
    [[nodiscard]] std::vector<Resource> resources() const override;

    [[nodiscard]] asio::awaitable<Result<ToolResult>> handle_tool_call(
        const std::string& tool_name,
        ToolArgs args
    ) override;

    [[nodiscard]] asio::awaitable<Result<std::string>> handle_resource_read(
        const std::string& uri
    ) override;

private:
    [[nodiscard]] asio::awaitable<Result<ToolResult>> exec(const ToolArgs& args);

    CommandExecutor executor_;
};

/// JSON snapshot served as system://info
[[nodiscard]] Result<Json> collect_system_info();

}  // namespace archmcp
