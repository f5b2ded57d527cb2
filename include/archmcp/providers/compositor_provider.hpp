#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// CompositorProvider - Hyprland tools and resources
// ─────────────────────────────────────────────────────────────────────────────
//
// Tools:      hyprland_dispatch, hyprland_keyword, hyprland_window_info,
//             hyprland_workspaces, hyprland_monitors, hyprland_reload
// Resources:  hyprland://config, hyprland://layout, hyprland://events
//
// The IPC client is created on first use and shared by every call. When the
// event socket is reachable a background pump keeps the most recent events
// for hyprland://events.

#include "archmcp/async/async_semaphore.hpp"
#include "archmcp/compositor/ipc_client.hpp"
#include "archmcp/config/server_config.hpp"
#include "archmcp/server/provider.hpp"

#include <asio/any_io_executor.hpp>

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

namespace archmcp {

class CompositorProvider final : public IProvider {
public:
    CompositorProvider(asio::any_io_executor executor,
                       CompositorConfig config,
                       EnvLookup env = process_environment());
    ~CompositorProvider() override;

    CompositorProvider(const CompositorProvider&) = delete;
    CompositorProvider& operator=(const CompositorProvider&) = delete;

    [[nodiscard]] std::string name() const override { return "hyprland"; }
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
    struct EventHistory {
        explicit EventHistory(std::size_t limit) : capacity(limit) {}

        std::mutex mutex;
        std::deque<Json> events;
        std::size_t capacity;
        std::uint64_t received{0};
        bool connected{false};
    };

    [[nodiscard]] asio::awaitable<Result<std::shared_ptr<CompositorIpcClient>>> client();

    static asio::awaitable<void> pump_events(std::shared_ptr<CompositorIpcClient> client,
                                             std::shared_ptr<EventHistory> history);

    [[nodiscard]] asio::awaitable<Result<ToolResult>> window_info(CompositorIpcClient& ipc, const ToolArgs& args);
    [[nodiscard]] asio::awaitable<Result<std::string>> read_layout(CompositorIpcClient& ipc);
    [[nodiscard]] Result<std::string> read_config_file() const;
    [[nodiscard]] std::string read_events(const CompositorIpcClient& ipc) const;

    asio::any_io_executor executor_;
    CompositorConfig config_;
    EnvLookup env_;

    AsyncSemaphore init_gate_;
    std::shared_ptr<CompositorIpcClient> client_;  // guarded by init_gate_ until set
    std::shared_ptr<EventHistory> history_;
};

}  // namespace archmcp
