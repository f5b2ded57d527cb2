// ─────────────────────────────────────────────────────────────────────────────
// Compositor IPC Client Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "archmcp/compositor/ipc_client.hpp"
#include "support/fake_compositor.hpp"
#include "support/run_sync.hpp"
#include "support/temp_dir.hpp"

#include <asio/io_context.hpp>

using namespace archmcp;
using archmcp::test::FakeCompositor;
using archmcp::test::TempDir;
using archmcp::test::run_sync;

namespace {

CompositorIpcClient::Options options_for(const FakeCompositor& fake) {
    CompositorIpcClient::Options options;
    auto paths = CompositorSocketPaths::resolve(fake.config(), fake.env());
    REQUIRE(paths.has_value());
    options.paths = *paths;
    return options;
}

std::unique_ptr<CompositorIpcClient> connect(asio::io_context& io, CompositorIpcClient::Options options) {
    auto client = run_sync(io, CompositorIpcClient::connect(io.get_executor(), std::move(options)));
    REQUIRE(client.has_value());
    return std::move(*client);
}

EnvLookup no_environment() {
    return [](std::string_view) -> std::optional<std::string> { return std::nullopt; };
}

}  // namespace

TEST_CASE("CompositorSocketPaths resolution", "[compositor][ipc]") {
    auto env = [](std::string_view name) -> std::optional<std::string> {
        if (name == "XDG_RUNTIME_DIR") return "/run/user/1000";
        if (name == "HYPRLAND_INSTANCE_SIGNATURE") return "abc_123";
        return std::nullopt;
    };

    SECTION("from the environment") {
        auto paths = CompositorSocketPaths::resolve(CompositorConfig{}, env);
        REQUIRE(paths.has_value());
        REQUIRE(paths->control_path() == "/run/user/1000/hypr/abc_123/.socket.sock");
        REQUIRE(paths->event_path() == "/run/user/1000/hypr/abc_123/.socket2.sock");
    }

    SECTION("config overrides the environment") {
        CompositorConfig config;
        config.instance_signature = "override";
        auto paths = CompositorSocketPaths::resolve(config, env);
        REQUIRE(paths.has_value());
        REQUIRE(paths->control_path() == "/run/user/1000/hypr/override/.socket.sock");
    }

    SECTION("missing signature") {
        auto paths = CompositorSocketPaths::resolve(CompositorConfig{}, [](std::string_view name) -> std::optional<std::string> {
            if (name == "XDG_RUNTIME_DIR") return "/run/user/1000";
            return std::nullopt;
        });
        REQUIRE_FALSE(paths.has_value());
        REQUIRE(paths.error().code == ErrorCode::Configuration);
        REQUIRE(paths.error().message == "HYPRLAND_INSTANCE_SIGNATURE not set");
    }

    SECTION("missing runtime dir") {
        auto paths = CompositorSocketPaths::resolve(CompositorConfig{}, no_environment());
        REQUIRE_FALSE(paths.has_value());
        REQUIRE(paths.error().message == "XDG_RUNTIME_DIR not set");
    }
}

TEST_CASE("CompositorIpcClient connect fails without a compositor", "[compositor][ipc]") {
    TempDir dir;
    asio::io_context io;

    CompositorIpcClient::Options options;
    options.paths = CompositorSocketPaths{dir.path().string(), "nobody"};

    auto client = run_sync(io, CompositorIpcClient::connect(io.get_executor(), options));
    REQUIRE_FALSE(client.has_value());
    REQUIRE(client.error().code == ErrorCode::Ipc);
}

TEST_CASE("CompositorIpcClient queries reconnect after every command", "[compositor][ipc]") {
    TempDir dir;
    asio::io_context io;
    FakeCompositor fake(io, dir.path());
    auto client = connect(io, options_for(fake));

    auto workspaces = run_sync(io, client->workspaces());
    REQUIRE(workspaces.has_value());
    REQUIRE(workspaces->is_array());
    REQUIRE((*workspaces)[0]["name"] == "1");
    REQUIRE(client->reconnect_count() == 1);
    REQUIRE(client->commands_sent() == 1);

    auto monitors = run_sync(io, client->monitors());
    REQUIRE(monitors.has_value());
    REQUIRE((*monitors)[0]["name"] == "DP-1");
    REQUIRE(client->reconnect_count() == 2);

    REQUIRE(fake.commands() == std::vector<std::string>{"j/workspaces", "j/monitors"});
}

TEST_CASE("CompositorIpcClient formats commands", "[compositor][ipc]") {
    TempDir dir;
    asio::io_context io;
    FakeCompositor fake(io, dir.path());
    auto client = connect(io, options_for(fake));

    REQUIRE(run_sync(io, client->dispatch("workspace", "2")).value() == "ok");
    REQUIRE(run_sync(io, client->dispatch("killactive")).has_value());
    REQUIRE(run_sync(io, client->set_keyword("general:gaps_in", "5")).has_value());
    REQUIRE(run_sync(io, client->reload_config()).has_value());
    REQUIRE(run_sync(io, client->resize_active(10, -20)).has_value());
    REQUIRE(run_sync(io, client->focus_window("l")).has_value());
    REQUIRE(run_sync(io, client->kill_active()).has_value());
    REQUIRE(run_sync(io, client->switch_workspace(3)).has_value());
    REQUIRE(run_sync(io, client->move_to_workspace(4)).has_value());
    REQUIRE(run_sync(io, client->toggle_floating()).has_value());
    REQUIRE(run_sync(io, client->toggle_fullscreen()).has_value());
    REQUIRE(run_sync(io, client->move_active(-5, 6)).has_value());

    REQUIRE(fake.commands() == std::vector<std::string>{
        "dispatch workspace 2",
        "dispatch killactive",
        "keyword general:gaps_in 5",
        "reload",
        "dispatch resizeactive 10 -20",
        "dispatch movefocus l",
        "dispatch killactive",
        "dispatch workspace 3",
        "dispatch movetoworkspace 4",
        "dispatch togglefloating",
        "dispatch fullscreen 0",
        "dispatch moveactive -5 6"
    });
}

TEST_CASE("CompositorIpcClient JSON queries decode the reply", "[compositor][ipc]") {
    TempDir dir;
    asio::io_context io;
    FakeCompositor fake(io, dir.path());
    auto client = connect(io, options_for(fake));

    auto windows = run_sync(io, client->windows());
    REQUIRE(windows.has_value());
    REQUIRE(windows->size() == 2);
    REQUIRE((*windows)[1]["class"] == "firefox");

    auto workspaces = run_sync(io, client->workspaces());
    REQUIRE(workspaces.has_value());
    REQUIRE((*workspaces)[0]["windows"] == 2);

    auto monitors = run_sync(io, client->monitors());
    REQUIRE(monitors.has_value());
    REQUIRE((*monitors)[0]["name"] == "DP-1");

    REQUIRE(fake.commands() == std::vector<std::string>{"j/clients", "j/workspaces", "j/monitors"});
}

TEST_CASE("CompositorIpcClient rejects bad replies", "[compositor][ipc]") {
    TempDir dir;
    asio::io_context io;
    FakeCompositor fake(io, dir.path());

    SECTION("reply too large") {
        auto options = options_for(fake);
        options.max_response_bytes = 16;
        auto client = connect(io, options);
        fake.set_reply([](const std::string&) { return std::string(100, 'x'); });

        auto reply = run_sync(io, client->send_command("version"));
        REQUIRE_FALSE(reply.has_value());
        REQUIRE(reply.error().code == ErrorCode::Ipc);
        REQUIRE(client->commands_sent() == 0);
    }

    SECTION("invalid UTF-8") {
        auto client = connect(io, options_for(fake));
        fake.set_reply([](const std::string&) { return std::string("\xff\xfe broken"); });

        auto reply = run_sync(io, client->send_command("version"));
        REQUIRE_FALSE(reply.has_value());
        REQUIRE(reply.error().message.find("UTF-8") != std::string::npos);
    }

    SECTION("invalid JSON for a query") {
        auto client = connect(io, options_for(fake));
        fake.set_reply([](const std::string&) { return std::string("unknown request"); });

        auto reply = run_sync(io, client->workspaces());
        REQUIRE_FALSE(reply.has_value());
        REQUIRE(reply.error().code == ErrorCode::Ipc);
    }
}

TEST_CASE("CompositorIpcClient times out a silent compositor", "[compositor][ipc]") {
    TempDir dir;
    asio::io_context io;
    FakeCompositor fake(io, dir.path());

    auto options = options_for(fake);
    options.command_timeout = std::chrono::milliseconds(50);
    auto client = connect(io, options);

    fake.set_reply_delay(std::chrono::milliseconds(500));
    auto reply = run_sync(io, client->send_command("j/clients"));
    REQUIRE_FALSE(reply.has_value());
    REQUIRE(reply.error().code == ErrorCode::Timeout);

    // The client stays usable
    fake.set_reply_delay(std::chrono::milliseconds(0));
    auto next = run_sync(io, client->send_command("j/activewindow"));
    REQUIRE(next.has_value());
}

TEST_CASE("CompositorIpcClient event channel", "[compositor][ipc][events]") {
    TempDir dir;
    asio::io_context io;

    SECTION("events are parsed and malformed lines skipped") {
        FakeCompositor fake(io, dir.path());
        auto client = connect(io, options_for(fake));
        REQUIRE(run_sync(io, client->connect_events()).has_value());
        REQUIRE(client->has_event_channel());

        run_sync(io, [&]() -> asio::awaitable<void> {
            co_await fake.emit("workspace>>3\nnot an event\nopenwindow>>1a,3,kitty,term, 2\n");

            auto first = co_await client->next_event();
            REQUIRE(first.has_value());
            REQUIRE(std::get<WorkspaceEvent>(*first).name == "3");

            auto second = co_await client->next_event();
            REQUIRE(second.has_value());
            REQUIRE(std::get<WindowOpenedEvent>(*second).title == "term, 2");

            fake.drop_event_subscribers();
            auto closed = co_await client->next_event();
            REQUIRE_FALSE(closed.has_value());
            REQUIRE(closed.error().code == ErrorCode::Ipc);
        }());

        REQUIRE(client->dropped_events() == 1);
        REQUIRE_FALSE(client->has_event_channel());
    }

    SECTION("missing event socket leaves commands working") {
        FakeCompositor fake(io, dir.path(), false);
        auto client = connect(io, options_for(fake));

        auto events = run_sync(io, client->connect_events());
        REQUIRE_FALSE(events.has_value());
        REQUIRE(events.error().code == ErrorCode::Ipc);
        REQUIRE_FALSE(client->has_event_channel());

        REQUIRE(run_sync(io, client->active_window()).has_value());
    }
}
