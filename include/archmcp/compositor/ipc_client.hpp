#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Compositor IPC Client
// ═══════════════════════════════════════════════════════════════════════════
//
// Two Unix sockets under $XDG_RUNTIME_DIR/hypr/$HYPRLAND_INSTANCE_SIGNATURE/:
//
//   .socket.sock   control: write one command, read the reply until the
//                  compositor closes the connection. The client reconnects
//                  after every command, so callers see one persistent handle.
//   .socket2.sock  events: long-lived, newline-delimited "<kind>>><payload>"
//                  records (see compositor_event.hpp). Optional.
//
// Commands are serialized end to end (write, read, reconnect) by an internal
// gate, so one client may be shared by concurrent coroutines. next_event()
// must only be awaited by one coroutine at a time.
//
// ═══════════════════════════════════════════════════════════════════════════

#include "archmcp/async/async_semaphore.hpp"
#include "archmcp/compositor/compositor_event.hpp"
#include "archmcp/config/server_config.hpp"
#include "archmcp/error.hpp"
#include "archmcp/json/json.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/local/stream_protocol.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace archmcp {

struct CompositorSocketPaths {
    std::string runtime_dir;
    std::string instance_signature;

    [[nodiscard]] std::string control_path() const;
    [[nodiscard]] std::string event_path() const;

    /// Config overrides first, then XDG_RUNTIME_DIR / HYPRLAND_INSTANCE_SIGNATURE.
    /// Configuration error when either is missing or empty.
    [[nodiscard]] static Result<CompositorSocketPaths> resolve(const CompositorConfig& config,
                                                               const EnvLookup& env);
};

class CompositorIpcClient {
public:
    struct Options {
        CompositorSocketPaths paths;
        std::size_t max_response_bytes{64 * 1024};
        std::chrono::milliseconds command_timeout{std::chrono::seconds(5)};
    };

    /// Open the control channel. Ipc error when the socket cannot be reached.
    [[nodiscard]] static asio::awaitable<Result<std::unique_ptr<CompositorIpcClient>>> connect(
        asio::any_io_executor executor,
        Options options
    );

    CompositorIpcClient(const CompositorIpcClient&) = delete;
    CompositorIpcClient& operator=(const CompositorIpcClient&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Control channel
    // ─────────────────────────────────────────────────────────────────────────

    /// Send one command and return the reply text. The reply must be valid
    /// UTF-8 and at most max_response_bytes long.
    [[nodiscard]] asio::awaitable<Result<std::string>> send_command(std::string command);

    /// Send "j/<what>" and decode the reply as JSON
    [[nodiscard]] asio::awaitable<Result<Json>> query(std::string_view what);

    [[nodiscard]] asio::awaitable<Result<std::string>> dispatch(std::string_view dispatcher, std::string_view params = {});
    [[nodiscard]] asio::awaitable<Result<std::string>> set_keyword(std::string_view keyword, std::string_view value);
    [[nodiscard]] asio::awaitable<Result<std::string>> reload_config();
    [[nodiscard]] asio::awaitable<Result<std::string>> kill_active();
    [[nodiscard]] asio::awaitable<Result<std::string>> switch_workspace(int id);
    [[nodiscard]] asio::awaitable<Result<std::string>> move_to_workspace(int id);
    [[nodiscard]] asio::awaitable<Result<std::string>> toggle_floating();
    [[nodiscard]] asio::awaitable<Result<std::string>> toggle_fullscreen();

    /// direction: l, r, u or d
    [[nodiscard]] asio::awaitable<Result<std::string>> focus_window(std::string_view direction);

    [[nodiscard]] asio::awaitable<Result<std::string>> resize_active(int dx, int dy);
    [[nodiscard]] asio::awaitable<Result<std::string>> move_active(int dx, int dy);

    [[nodiscard]] asio::awaitable<Result<Json>> windows();
    [[nodiscard]] asio::awaitable<Result<Json>> workspaces();
    [[nodiscard]] asio::awaitable<Result<Json>> monitors();
    [[nodiscard]] asio::awaitable<Result<Json>> active_window();

    /// Control connections re-established after a command
    [[nodiscard]] std::uint64_t reconnect_count() const noexcept { return reconnects_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t commands_sent() const noexcept { return commands_.load(std::memory_order_relaxed); }

    // ─────────────────────────────────────────────────────────────────────────
    // Event channel
    // ─────────────────────────────────────────────────────────────────────────

    /// Ipc error when the event socket is absent; the control channel is unaffected
    [[nodiscard]] asio::awaitable<Result<void>> connect_events();

    [[nodiscard]] bool has_event_channel() const noexcept { return events_.has_value(); }

    /// Next parsed event. Lines that do not parse are counted and skipped.
    /// Ipc error once the channel is closed.
    [[nodiscard]] asio::awaitable<Result<CompositorEvent>> next_event();

    [[nodiscard]] std::uint64_t dropped_events() const noexcept { return dropped_.load(std::memory_order_relaxed); }

    /// Close the event socket; a pending next_event() completes with an Ipc error.
    /// Must run on the client's executor.
    void close_events();

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    using Socket = asio::local::stream_protocol::socket;

    CompositorIpcClient(asio::any_io_executor executor, Options options);

    [[nodiscard]] asio::awaitable<Result<Socket>> open(const std::string& path);
    [[nodiscard]] asio::awaitable<Result<std::string>> exchange(Socket& socket, const std::string& command);

    asio::any_io_executor executor_;
    Options options_;
    AsyncSemaphore command_gate_;

    std::optional<Socket> control_;  // guarded by command_gate_

    std::optional<Socket> events_;
    std::string event_buffer_;

    std::atomic<std::uint64_t> reconnects_{0};
    std::atomic<std::uint64_t> commands_{0};
    std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace archmcp
