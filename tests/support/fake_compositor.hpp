#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// FakeCompositor - Unix-socket stand-in for the Hyprland IPC endpoints
// ─────────────────────────────────────────────────────────────────────────────
//
// Listens on <runtime_dir>/hypr/<signature>/.socket.sock (control) and,
// optionally, .socket2.sock (events). Each control connection answers one
// command and is then closed, like the real compositor. Runs on the test's
// io_context; inspect it only while that io_context is not running.

#include "archmcp/config/server_config.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/local/stream_protocol.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <array>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace archmcp::test {

class FakeCompositor {
public:
    using Protocol = asio::local::stream_protocol;
    using ReplyFn = std::function<std::string(const std::string& command)>;

    FakeCompositor(asio::io_context& io,
                   std::filesystem::path runtime_dir,
                   bool with_events = true,
                   std::string signature = "testsig")
        : io_(io)
        , runtime_dir_(std::move(runtime_dir))
        , signature_(std::move(signature))
        , control_acceptor_(io)
        , event_acceptor_(io)
    {
        const auto dir = runtime_dir_ / "hypr" / signature_;
        std::filesystem::create_directories(dir);

        bind(control_acceptor_, dir / ".socket.sock");
        asio::co_spawn(io_, control_loop(), asio::detached);

        if (with_events) {
            bind(event_acceptor_, dir / ".socket2.sock");
            asio::co_spawn(io_, event_loop(), asio::detached);
        }
    }

    ~FakeCompositor() {
        asio::error_code ec;
        control_acceptor_.close(ec);
        event_acceptor_.close(ec);
        for (auto& subscriber : subscribers_) {
            subscriber->close(ec);
        }
    }

    FakeCompositor(const FakeCompositor&) = delete;
    FakeCompositor& operator=(const FakeCompositor&) = delete;

    void set_reply(ReplyFn reply) { reply_ = std::move(reply); }

    /// Hold every reply this long (for client timeouts)
    void set_reply_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    [[nodiscard]] const std::vector<std::string>& commands() const noexcept { return commands_; }
    [[nodiscard]] std::size_t control_connections() const noexcept { return control_connections_; }
    [[nodiscard]] std::size_t event_subscribers() const noexcept { return subscribers_.size(); }

    [[nodiscard]] CompositorConfig config() const {
        CompositorConfig config;
        config.runtime_dir = runtime_dir_.string();
        config.instance_signature = signature_;
        return config;
    }

    /// Environment exposing the fake through the usual variables
    [[nodiscard]] EnvLookup env() const {
        return [runtime = runtime_dir_.string(), signature = signature_](std::string_view name) -> std::optional<std::string> {
            if (name == "XDG_RUNTIME_DIR") return runtime;
            if (name == "HYPRLAND_INSTANCE_SIGNATURE") return signature;
            return std::nullopt;
        };
    }

    /// Write raw bytes to every event subscriber, waiting up to a second for
    /// the first one to be accepted
    asio::awaitable<void> emit(std::string data) {
        for (int attempt = 0; subscribers_.empty() && (attempt < 100); ++attempt) {
            asio::steady_timer timer(io_, std::chrono::milliseconds(10));
            asio::error_code ec;
            co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }
        for (auto& subscriber : subscribers_) {
            asio::error_code ec;
            co_await asio::async_write(*subscriber, asio::buffer(data), asio::redirect_error(asio::use_awaitable, ec));
        }
    }

    /// Close every event connection (the client sees end of stream)
    void drop_event_subscribers() {
        asio::error_code ec;
        for (auto& subscriber : subscribers_) {
            subscriber->close(ec);
        }
        subscribers_.clear();
    }

    static std::string default_reply(const std::string& command) {
        if (command == "j/workspaces") return R"([{"id":1,"name":"1","monitor":"DP-1","windows":2}])";
        if (command == "j/monitors") return R"([{"id":0,"name":"DP-1","width":2560,"height":1440}])";
        if (command == "j/clients") {
            return R"([{"address":"0x1a","class":"kitty","title":"shell","workspace":{"id":1}},)"
                   R"({"address":"0x2b","class":"firefox","title":"web","workspace":{"id":2}}])";
        }
        if (command == "j/activewindow") return R"({"address":"0x1a","class":"kitty","title":"shell"})";
        return "ok";
    }

private:
    static void bind(Protocol::acceptor& acceptor, const std::filesystem::path& path) {
        std::filesystem::remove(path);
        const Protocol::endpoint endpoint(path.string());
        acceptor.open(endpoint.protocol());
        acceptor.bind(endpoint);
        acceptor.listen();
    }

    asio::awaitable<void> control_loop() {
        for (;;) {
            asio::error_code ec;
            auto socket = std::make_shared<Protocol::socket>(io_);
            co_await control_acceptor_.async_accept(*socket, asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                co_return;
            }
            ++control_connections_;
            asio::co_spawn(io_, answer(socket), asio::detached);
        }
    }

    asio::awaitable<void> answer(std::shared_ptr<Protocol::socket> socket) {
        std::array<char, 4096> buffer{};
        asio::error_code ec;
        const std::size_t n = co_await socket->async_read_some(
            asio::buffer(buffer), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            co_return;
        }
        const std::string command(buffer.data(), n);
        commands_.push_back(command);

        if (delay_.count() > 0) {
            asio::steady_timer timer(io_, delay_);
            co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }

        const std::string reply = reply_ ? reply_(command) : default_reply(command);
        co_await asio::async_write(*socket, asio::buffer(reply), asio::redirect_error(asio::use_awaitable, ec));
        socket->close(ec);
    }

    asio::awaitable<void> event_loop() {
        for (;;) {
            asio::error_code ec;
            auto socket = std::make_shared<Protocol::socket>(io_);
            co_await event_acceptor_.async_accept(*socket, asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                co_return;
            }
            subscribers_.push_back(std::move(socket));
        }
    }

    asio::io_context& io_;
    std::filesystem::path runtime_dir_;
    std::string signature_;
    Protocol::acceptor control_acceptor_;
    Protocol::acceptor event_acceptor_;

    ReplyFn reply_;
    std::chrono::milliseconds delay_{0};
    std::vector<std::string> commands_;
    std::size_t control_connections_{0};
    std::vector<std::shared_ptr<Protocol::socket>> subscribers_;
};

}  // namespace archmcp::test
