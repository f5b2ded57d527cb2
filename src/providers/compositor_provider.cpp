#include "archmcp/providers/compositor_provider.hpp"

#include "archmcp/log/logger.hpp"
#include "archmcp/providers/tool_args.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace archmcp {

namespace {

constexpr const char* kConfigUri = "hyprland://config";
constexpr const char* kLayoutUri = "hyprland://layout";
constexpr const char* kEventsUri = "hyprland://events";

std::string pretty(const Json& value) {
    return value.dump(2, ' ', false, Json::error_handler_t::replace);
}

Json empty_schema() {
    return {{"type", "object"}, {"properties", Json::object()}};
}

ToolResult json_result(const Json& value, const char* type) {
    ToolResult result = ToolResult::text(pretty(value));
    result.metadata = Json{{"type", type}};
    return result;
}

}  // namespace

CompositorProvider::CompositorProvider(asio::any_io_executor executor,
                                       CompositorConfig config,
                                       EnvLookup env)
    : executor_(executor)
    , config_(std::move(config))
    , env_(std::move(env))
    , init_gate_(executor, 1)
    , history_(std::make_shared<EventHistory>(config_.event_history))
{}

CompositorProvider::~CompositorProvider() {
    // The pump holds its own reference to the client; closing the event
    // socket ends it.
    if (client_) {
        asio::post(executor_, [client = client_] { client->close_events(); });
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Declarations
// ─────────────────────────────────────────────────────────────────────────────

std::vector<Tool> CompositorProvider::tools() const {
    return {
        Tool{
            "hyprland_dispatch",
            "Execute a Hyprland dispatcher command",
            {
                {"type", "object"},
                {"properties", {
                    {"command", {{"type", "string"}, {"description", "Dispatcher name (e.g. workspace, exec, killactive)"}}},
                    {"args", {{"type", "string"}, {"description", "Dispatcher arguments"}}}
                }},
                {"required", Json::array({"command"})}
            }
        },
        Tool{
            "hyprland_keyword",
            "Set a Hyprland configuration keyword at runtime",
            {
                {"type", "object"},
                {"properties", {
                    {"keyword", {{"type", "string"}, {"description", "Configuration keyword"}}},
                    {"value", {{"type", "string"}, {"description", "New value"}}}
                }},
                {"required", Json::array({"keyword", "value"})}
            }
        },
        Tool{
            "hyprland_window_info",
            "Get information about a window (the active window by default)",
            {
                {"type", "object"},
                {"properties", {
                    {"window_id", {{"type", "string"}, {"description", "Window address; omit for the active window"}}}
                }}
            }
        },
        Tool{"hyprland_workspaces", "List Hyprland workspaces", empty_schema()},
        Tool{"hyprland_monitors", "List Hyprland monitors", empty_schema()},
        Tool{"hyprland_reload", "Reload the Hyprland configuration", empty_schema()},
    };
}

std::vector<Resource> CompositorProvider::resources() const {
    return {
        Resource{kConfigUri, "Hyprland Configuration", "Current Hyprland configuration file", "text/plain"},
        Resource{kLayoutUri, "Window Layout", "Clients, workspaces and monitors", "application/json"},
        Resource{kEventsUri, "Compositor Events", "Most recent compositor events", "application/json"},
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Client lifecycle
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<Result<std::shared_ptr<CompositorIpcClient>>> CompositorProvider::client() {
    auto permit = co_await init_gate_.acquire();
    if (!permit) {
        co_return tl::unexpected(permit.error());
    }
    if (client_) {
        co_return client_;
    }
    if (config_.enabled == false) {
        co_return tl::unexpected(Error::configuration("compositor integration is disabled"));
    }

    auto paths = CompositorSocketPaths::resolve(config_, env_);
    if (!paths) {
        co_return tl::unexpected(paths.error());
    }

    CompositorIpcClient::Options options;
    options.paths = std::move(*paths);
    options.max_response_bytes = config_.max_response_bytes;

    auto connected = co_await CompositorIpcClient::connect(executor_, std::move(options));
    if (!connected) {
        co_return tl::unexpected(connected.error());
    }
    client_ = std::shared_ptr<CompositorIpcClient>(std::move(*connected));

    auto events = co_await client_->connect_events();
    if (events) {
        {
            std::lock_guard lock(history_->mutex);
            history_->connected = true;
        }
        asio::co_spawn(executor_, pump_events(client_, history_), asio::detached);
        ARCHMCP_LOG_INFO("compositor event channel connected");
    } else {
        get_logger().logf(LogLevel::Info, "compositor event channel unavailable: {}", events.error().describe());
    }

    co_return client_;
}

asio::awaitable<void> CompositorProvider::pump_events(std::shared_ptr<CompositorIpcClient> client,
                                                      std::shared_ptr<EventHistory> history) {
    for (;;) {
        auto event = co_await client->next_event();
        if (!event) {
            get_logger().logf(LogLevel::Debug, "compositor event pump stopped: {}", event.error().describe());
            std::lock_guard lock(history->mutex);
            history->connected = false;
            co_return;
        }

        std::lock_guard lock(history->mutex);
        history->events.push_back(to_json(*event));
        ++history->received;
        while (history->events.size() > history->capacity) {
            history->events.pop_front();
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Tools
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<Result<ToolResult>> CompositorProvider::handle_tool_call(const std::string& tool_name,
                                                                         ToolArgs args) {
    auto ipc = co_await client();
    if (!ipc) {
        co_return tl::unexpected(ipc.error());
    }
    CompositorIpcClient& hypr = **ipc;

    if (tool_name == "hyprland_dispatch") {
        auto command = args::required_string(args, "command");
        if (!command) co_return tl::unexpected(command.error());
        auto params = args::optional_string(args, "args");
        if (!params) co_return tl::unexpected(params.error());

        auto reply = co_await hypr.dispatch(*command, params->value_or(""));
        if (!reply) co_return tl::unexpected(reply.error());
        co_return ToolResult::text(std::move(*reply));
    }

    if (tool_name == "hyprland_keyword") {
        auto keyword = args::required_string(args, "keyword");
        if (!keyword) co_return tl::unexpected(keyword.error());
        auto value = args::required_string(args, "value");
        if (!value) co_return tl::unexpected(value.error());

        auto reply = co_await hypr.set_keyword(*keyword, *value);
        if (!reply) co_return tl::unexpected(reply.error());
        co_return ToolResult::text(std::move(*reply));
    }

    if (tool_name == "hyprland_window_info") {
        co_return co_await window_info(hypr, args);
    }

    if (tool_name == "hyprland_workspaces") {
        auto workspaces = co_await hypr.workspaces();
        if (!workspaces) co_return tl::unexpected(workspaces.error());
        co_return json_result(*workspaces, "workspaces");
    }

    if (tool_name == "hyprland_monitors") {
        auto monitors = co_await hypr.monitors();
        if (!monitors) co_return tl::unexpected(monitors.error());
        co_return json_result(*monitors, "monitors");
    }

    if (tool_name == "hyprland_reload") {
        auto reply = co_await hypr.reload_config();
        if (!reply) co_return tl::unexpected(reply.error());
        co_return ToolResult::text("Hyprland configuration reloaded");
    }

    co_return tl::unexpected(Error::not_found("Tool not found: " + tool_name));
}

asio::awaitable<Result<ToolResult>> CompositorProvider::window_info(CompositorIpcClient& ipc, const ToolArgs& args) {
    auto window_id = args::optional_string(args, "window_id");
    if (!window_id) {
        co_return tl::unexpected(window_id.error());
    }

    if (window_id->has_value() == false) {
        auto active = co_await ipc.active_window();
        if (!active) co_return tl::unexpected(active.error());
        co_return json_result(*active, "window_info");
    }

    auto clients = co_await ipc.windows();
    if (!clients) {
        co_return tl::unexpected(clients.error());
    }
    if (clients->is_array()) {
        for (const auto& window : *clients) {
            const auto address = window.find("address");
            if ((address != window.end()) && address->is_string() && (*address == **window_id)) {
                co_return json_result(window, "window_info");
            }
        }
    }
    co_return tl::unexpected(Error::not_found("Window not found: " + **window_id));
}

// ─────────────────────────────────────────────────────────────────────────────
// Resources
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<Result<std::string>> CompositorProvider::handle_resource_read(const std::string& uri) {
    if (uri == kConfigUri) {
        co_return read_config_file();
    }
    if ((uri != kLayoutUri) && (uri != kEventsUri)) {
        co_return tl::unexpected(Error::not_found("Resource not found: " + uri));
    }

    auto ipc = co_await client();
    if (!ipc) {
        co_return tl::unexpected(ipc.error());
    }
    if (uri == kLayoutUri) {
        co_return co_await read_layout(**ipc);
    }
    co_return read_events(**ipc);
}

asio::awaitable<Result<std::string>> CompositorProvider::read_layout(CompositorIpcClient& ipc) {
    auto clients = co_await ipc.windows();
    if (!clients) co_return tl::unexpected(clients.error());
    auto workspaces = co_await ipc.workspaces();
    if (!workspaces) co_return tl::unexpected(workspaces.error());
    auto monitors = co_await ipc.monitors();
    if (!monitors) co_return tl::unexpected(monitors.error());

    co_return pretty(Json{
        {"clients", std::move(*clients)},
        {"workspaces", std::move(*workspaces)},
        {"monitors", std::move(*monitors)}
    });
}

Result<std::string> CompositorProvider::read_config_file() const {
    std::vector<std::filesystem::path> candidates;
    if (auto home = env_("HOME"); home && (home->empty() == false)) {
        candidates.emplace_back(std::filesystem::path(*home) / ".config/hypr/hyprland.conf");
    }
    candidates.emplace_back("/etc/hypr/hyprland.conf");

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) == false) {
            continue;
        }
        std::ifstream in(candidate, std::ios::binary);
        if (in.is_open() == false) {
            return tl::unexpected(Error::io("cannot open " + candidate.string()));
        }
        std::ostringstream contents;
        contents << in.rdbuf();
        return contents.str();
    }
    return tl::unexpected(Error::not_found("Hyprland configuration file not found"));
}

std::string CompositorProvider::read_events(const CompositorIpcClient& ipc) const {
    Json body;
    {
        std::lock_guard lock(history_->mutex);
        Json events = Json::array();
        for (const auto& event : history_->events) {
            events.push_back(event);
        }
        body = {
            {"connected", history_->connected},
            {"received", history_->received},
            {"events", std::move(events)}
        };
    }
    body["dropped"] = ipc.dropped_events();
    return pretty(body);
}

}  // namespace archmcp
