#include "archmcp/compositor/ipc_client.hpp"

#include "archmcp/json/fast_json.hpp"
#include "archmcp/log/logger.hpp"

#include <asio/experimental/awaitable_operators.hpp>
#include <asio/read_until.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <simdjson.h>

#include <array>

namespace archmcp {

namespace {

using namespace asio::experimental::awaitable_operators;

constexpr std::size_t kMaxEventLineBytes = 64 * 1024;

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Socket paths
// ─────────────────────────────────────────────────────────────────────────────

std::string CompositorSocketPaths::control_path() const {
    return runtime_dir + "/hypr/" + instance_signature + "/.socket.sock";
}

std::string CompositorSocketPaths::event_path() const {
    return runtime_dir + "/hypr/" + instance_signature + "/.socket2.sock";
}

Result<CompositorSocketPaths> CompositorSocketPaths::resolve(const CompositorConfig& config,
                                                             const EnvLookup& env) {
    CompositorSocketPaths paths;

    paths.runtime_dir = config.runtime_dir.value_or(env("XDG_RUNTIME_DIR").value_or(""));
    if (paths.runtime_dir.empty()) {
        return tl::unexpected(Error::configuration("XDG_RUNTIME_DIR not set"));
    }

    paths.instance_signature = config.instance_signature.value_or(env("HYPRLAND_INSTANCE_SIGNATURE").value_or(""));
    if (paths.instance_signature.empty()) {
        return tl::unexpected(Error::configuration("HYPRLAND_INSTANCE_SIGNATURE not set"));
    }

    return paths;
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection management
// ─────────────────────────────────────────────────────────────────────────────

CompositorIpcClient::CompositorIpcClient(asio::any_io_executor executor, Options options)
    : executor_(executor)
    , options_(std::move(options))
    , command_gate_(executor, 1)
{}

asio::awaitable<Result<std::unique_ptr<CompositorIpcClient>>> CompositorIpcClient::connect(
    asio::any_io_executor executor,
    Options options)
{
    std::unique_ptr<CompositorIpcClient> client(new CompositorIpcClient(std::move(executor), std::move(options)));

    get_logger().logf(LogLevel::Debug, "connecting to compositor: control={}, event={}",
                      client->options_.paths.control_path(), client->options_.paths.event_path());

    auto control = co_await client->open(client->options_.paths.control_path());
    if (!control) {
        co_return tl::unexpected(control.error());
    }
    client->control_.emplace(std::move(*control));
    co_return client;
}

asio::awaitable<Result<CompositorIpcClient::Socket>> CompositorIpcClient::open(const std::string& path) {
    Socket socket(executor_);
    asio::error_code ec;
    try {
        co_await socket.async_connect(asio::local::stream_protocol::endpoint(path),
                                      asio::redirect_error(asio::use_awaitable, ec));
    } catch (const std::exception& e) {
        // endpoint() rejects paths longer than sun_path
        co_return tl::unexpected(Error::ipc("invalid compositor socket path " + path + ": " + e.what()));
    }
    if (ec) {
        co_return tl::unexpected(Error::ipc("failed to connect to compositor socket " + path + ": " + ec.message()));
    }
    co_return socket;
}

// ─────────────────────────────────────────────────────────────────────────────
// Control channel
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<Result<std::string>> CompositorIpcClient::exchange(Socket& socket, const std::string& command) {
    asio::error_code ec;
    co_await asio::async_write(socket, asio::buffer(command), asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return tl::unexpected(Error::ipc("failed to send compositor command: " + ec.message()));
    }

    std::string reply;
    std::array<char, 4096> buffer{};
    for (;;) {
        const std::size_t n = co_await socket.async_read_some(
            asio::buffer(buffer), asio::redirect_error(asio::use_awaitable, ec));
        reply.append(buffer.data(), n);

        if (reply.size() > options_.max_response_bytes) {
            co_return tl::unexpected(Error::ipc(
                "compositor reply exceeds " + std::to_string(options_.max_response_bytes) + " bytes"));
        }
        if (ec == asio::error::eof) {
            break;
        }
        if (ec) {
            co_return tl::unexpected(Error::ipc("failed to read compositor reply: " + ec.message()));
        }
    }

    if (simdjson::validate_utf8(reply.data(), reply.size()) == false) {
        co_return tl::unexpected(Error::ipc("compositor reply is not valid UTF-8"));
    }
    co_return reply;
}

asio::awaitable<Result<std::string>> CompositorIpcClient::send_command(std::string command) {
    auto permit = co_await command_gate_.acquire();
    if (!permit) {
        co_return tl::unexpected(permit.error());
    }

    // A failed reconnect after the previous command is retried here
    if (control_.has_value() == false) {
        auto socket = co_await open(options_.paths.control_path());
        if (!socket) {
            co_return tl::unexpected(socket.error());
        }
        control_.emplace(std::move(*socket));
    }

    get_logger().logf(LogLevel::Debug, "compositor command: {}", command);

    asio::steady_timer deadline(executor_);
    deadline.expires_after(options_.command_timeout);
    auto outcome = co_await (
        exchange(*control_, command) ||
        deadline.async_wait(asio::use_awaitable)
    );

    // The compositor closes the control connection after every reply
    control_.reset();
    auto fresh = co_await open(options_.paths.control_path());
    if (fresh) {
        control_.emplace(std::move(*fresh));
        reconnects_.fetch_add(1, std::memory_order_relaxed);
    } else {
        get_logger().logf(LogLevel::Warn, "compositor reconnect failed, retrying on next command: {}",
                          fresh.error().describe());
    }

    if (outcome.index() == 1) {
        co_return tl::unexpected(Error::timeout(
            "compositor did not answer '" + command + "' within " +
            std::to_string(options_.command_timeout.count()) + " ms"));
    }

    auto reply = std::move(std::get<0>(outcome));
    if (reply) {
        commands_.fetch_add(1, std::memory_order_relaxed);
    }
    co_return reply;
}

asio::awaitable<Result<Json>> CompositorIpcClient::query(std::string_view what) {
    const std::string command = "j/" + std::string(what);
    auto reply = co_await send_command(command);
    if (!reply) {
        co_return tl::unexpected(reply.error());
    }

    auto document = fast_parse(*reply);
    if (!document) {
        co_return tl::unexpected(Error::ipc("invalid JSON in reply to " + command + ": " + document.error().message));
    }
    co_return std::move(*document);
}

asio::awaitable<Result<std::string>> CompositorIpcClient::dispatch(std::string_view dispatcher, std::string_view params) {
    std::string command = "dispatch " + std::string(dispatcher);
    if (params.empty() == false) {
        command += ' ';
        command += params;
    }
    co_return co_await send_command(std::move(command));
}

asio::awaitable<Result<std::string>> CompositorIpcClient::set_keyword(std::string_view keyword, std::string_view value) {
    co_return co_await send_command("keyword " + std::string(keyword) + " " + std::string(value));
}

asio::awaitable<Result<std::string>> CompositorIpcClient::reload_config() {
    co_return co_await send_command("reload");
}

asio::awaitable<Result<std::string>> CompositorIpcClient::kill_active() {
    co_return co_await dispatch("killactive");
}

asio::awaitable<Result<std::string>> CompositorIpcClient::switch_workspace(int id) {
    co_return co_await dispatch("workspace", std::to_string(id));
}

asio::awaitable<Result<std::string>> CompositorIpcClient::move_to_workspace(int id) {
    co_return co_await dispatch("movetoworkspace", std::to_string(id));
}

asio::awaitable<Result<std::string>> CompositorIpcClient::toggle_floating() {
    co_return co_await dispatch("togglefloating");
}

asio::awaitable<Result<std::string>> CompositorIpcClient::toggle_fullscreen() {
    co_return co_await dispatch("fullscreen", "0");
}

asio::awaitable<Result<std::string>> CompositorIpcClient::focus_window(std::string_view direction) {
    co_return co_await dispatch("movefocus", direction);
}

asio::awaitable<Result<std::string>> CompositorIpcClient::resize_active(int dx, int dy) {
    co_return co_await dispatch("resizeactive", std::to_string(dx) + " " + std::to_string(dy));
}

asio::awaitable<Result<std::string>> CompositorIpcClient::move_active(int dx, int dy) {
    co_return co_await dispatch("moveactive", std::to_string(dx) + " " + std::to_string(dy));
}

asio::awaitable<Result<Json>> CompositorIpcClient::windows() {
    co_return co_await query("clients");
}

asio::awaitable<Result<Json>> CompositorIpcClient::workspaces() {
    co_return co_await query("workspaces");
}

asio::awaitable<Result<Json>> CompositorIpcClient::monitors() {
    co_return co_await query("monitors");
}

asio::awaitable<Result<Json>> CompositorIpcClient::active_window() {
    co_return co_await query("activewindow");
}

// ─────────────────────────────────────────────────────────────────────────────
// Event channel
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<Result<void>> CompositorIpcClient::connect_events() {
    auto socket = co_await open(options_.paths.event_path());
    if (!socket) {
        co_return tl::unexpected(socket.error());
    }
    events_.emplace(std::move(*socket));
    event_buffer_.clear();
    co_return Result<void>{};
}

void CompositorIpcClient::close_events() {
    if (events_.has_value()) {
        asio::error_code ec;
        events_->close(ec);
    }
}

asio::awaitable<Result<CompositorEvent>> CompositorIpcClient::next_event() {
    for (;;) {
        if (events_.has_value() == false) {
            co_return tl::unexpected(Error::ipc("compositor event channel is not connected"));
        }

        asio::error_code ec;
        const std::size_t n = co_await asio::async_read_until(
            *events_,
            asio::dynamic_buffer(event_buffer_, kMaxEventLineBytes),
            '\n',
            asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            events_.reset();
            co_return tl::unexpected(Error::ipc("compositor event channel closed: " + ec.message()));
        }

        const std::string line = event_buffer_.substr(0, n);
        event_buffer_.erase(0, n);

        if (auto event = parse_compositor_event(line)) {
            co_return std::move(*event);
        }

        const auto dropped = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
        get_logger().logf(LogLevel::Debug, "dropped malformed compositor event ({} so far): {}",
                          dropped, line.substr(0, line.size() - 1));
    }
}

}  // namespace archmcp
