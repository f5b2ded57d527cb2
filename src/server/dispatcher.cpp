#include "archmcp/server/dispatcher.hpp"

#include "archmcp/json/fast_json.hpp"
#include "archmcp/log/logger.hpp"

#include <exception>

namespace archmcp {

namespace {

bool is_blank(std::string_view line) {
    return line.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

}  // namespace

std::string serialize_response(const JsonRpcResponse& response) {
    return response.to_json().dump(-1, ' ', false, Json::error_handler_t::replace);
}

Dispatcher::Dispatcher(CapabilityRegistry& registry,
                       AdmissionController& admission,
                       SecurityManager& security,
                       Implementation server_info)
    : registry_(registry)
    , admission_(admission)
    , security_(security)
    , server_info_(std::move(server_info))
{}

// ─────────────────────────────────────────────────────────────────────────────
// Framing and envelope
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<std::optional<std::string>> Dispatcher::handle_message(std::string_view line) {
    if (is_blank(line)) {
        co_return std::nullopt;
    }

    auto document = fast_parse(line);
    if (!document) {
        ARCHMCP_LOG_DEBUG("rejecting unparseable message: " + document.error().message);
        co_return serialize_response(JsonRpcResponse::failure(
            JsonRpcId::null(), JsonRpcError::parse_error(document.error().message)));
    }

    auto request = JsonRpcRequest::from_json(*document);
    if (!request) {
        ARCHMCP_LOG_DEBUG("rejecting invalid request: " + request.error().message);
        co_return serialize_response(JsonRpcResponse::failure(
            JsonRpcRequest::recover_id(*document), JsonRpcError::invalid_request(request.error().message)));
    }

    auto response = co_await handle_request(*request);
    if (response.has_value() == false) {
        co_return std::nullopt;
    }
    co_return serialize_response(*response);
}

asio::awaitable<std::optional<JsonRpcResponse>> Dispatcher::handle_request(const JsonRpcRequest& request) {
    get_logger().logf(LogLevel::Debug, "dispatching {}{}", request.method(),
                      request.is_notification() ? " (notification)" : "");

    Outcome outcome;
    try {
        outcome = co_await route(request.method(), request.params());
    } catch (const std::exception& e) {
        get_logger().logf(LogLevel::Error, "handler for {} threw: {}", request.method(), e.what());
        outcome = tl::unexpected(JsonRpcError::internal_error(e.what()));
    }

    if (request.is_notification()) {
        if (!outcome) {
            get_logger().logf(LogLevel::Debug, "notification {} failed: {}", request.method(), outcome.error().message);
        }
        co_return std::nullopt;
    }

    const JsonRpcId& id = *request.id();
    if (outcome) {
        co_return JsonRpcResponse::success(id, std::move(*outcome));
    }
    co_return JsonRpcResponse::failure(id, std::move(outcome.error()));
}

asio::awaitable<Dispatcher::Outcome> Dispatcher::route(const std::string& method, const std::optional<Json>& params) {
    if (method == "initialize") {
        co_return on_initialize(params);
    }
    else if ((method == "initialized") || (method == "notifications/initialized")) {
        co_return Json::object();
    }
    else if (method == "tools/list") {
        co_return on_tools_list();
    }
    else if (method == "tools/call") {
        co_return co_await on_tools_call(params);
    }
    else if (method == "resources/list") {
        co_return on_resources_list();
    }
    else if (method == "resources/read") {
        co_return co_await on_resources_read(params);
    }
    else if (method == "completion/complete") {
        co_return Json{{"completion", {{"values", Json::array()}}}};
    }

    co_return tl::unexpected(JsonRpcError::method_not_found(method));
}

// ─────────────────────────────────────────────────────────────────────────────
// Handlers
// ─────────────────────────────────────────────────────────────────────────────

Dispatcher::Outcome Dispatcher::on_initialize(const std::optional<Json>& params) const {
    if (params && (params->is_object() == false)) {
        return tl::unexpected(JsonRpcError::invalid_params("initialize params must be an object"));
    }

    const auto client = InitializeParams::from_json(params.value_or(Json::object()));
    get_logger().logf(LogLevel::Info, "initialize from {} {} (protocol {})",
                      client.client_info.name.empty() ? "<unnamed client>" : client.client_info.name,
                      client.client_info.version, client.protocol_version);
    if (client.protocol_version != MCP_PROTOCOL_VERSION) {
        get_logger().logf(LogLevel::Warn, "client requested protocol {}, answering with {}",
                          client.protocol_version, MCP_PROTOCOL_VERSION);
    }

    InitializeResult result;
    result.server_info = server_info_;
    return result.to_json();
}

Dispatcher::Outcome Dispatcher::on_tools_list() const {
    Json tools = Json::array();
    for (const auto& tool : registry_.list_tools()) {
        tools.push_back(tool.to_json());
    }
    return tools;
}

Dispatcher::Outcome Dispatcher::on_resources_list() const {
    Json resources = Json::array();
    for (const auto& resource : registry_.list_resources()) {
        resources.push_back(resource.to_json());
    }
    return resources;
}

asio::awaitable<Dispatcher::Outcome> Dispatcher::on_tools_call(const std::optional<Json>& params) {
    if ((params.has_value() == false) || (params->is_object() == false)) {
        co_return tl::unexpected(JsonRpcError::invalid_params("tools/call requires an object with 'name'"));
    }
    const auto name_it = params->find("name");
    if ((name_it == params->end()) || (name_it->is_string() == false)) {
        co_return tl::unexpected(JsonRpcError::invalid_params("'name' must be a string"));
    }
    std::string name = name_it->get<std::string>();

    ToolArgs arguments = Json::object();
    if (const auto args_it = params->find("arguments"); (args_it != params->end()) && (args_it->is_null() == false)) {
        if (args_it->is_object() == false) {
            co_return tl::unexpected(JsonRpcError::invalid_params("'arguments' must be an object"));
        }
        arguments = *args_it;
    }

    // Unknown tools never reach admission or the audit ledger
    if (registry_.has_tool(name) == false) {
        co_return tl::unexpected(to_rpc_error(Error::not_found("Tool not found: " + name)));
    }

    auto ticket = co_await admission_.admit(name);
    if (!ticket) {
        co_return tl::unexpected(to_rpc_error(ticket.error()));
    }

    auto result = co_await security_.execute_with_audit<ToolResult>(
        name, arguments, run_tool(name, arguments));
    if (!result) {
        co_return tl::unexpected(to_rpc_error(result.error()));
    }
    co_return result->to_json();
}

asio::awaitable<Result<ToolResult>> Dispatcher::run_tool(std::string name, ToolArgs args) {
    if (auto allowed = security_.check_permission(name); !allowed) {
        co_return tl::unexpected(allowed.error());
    }
    co_return co_await registry_.execute_tool(name, std::move(args));
}

asio::awaitable<Dispatcher::Outcome> Dispatcher::on_resources_read(const std::optional<Json>& params) {
    if ((params.has_value() == false) || (params->is_object() == false)) {
        co_return tl::unexpected(JsonRpcError::invalid_params("resources/read requires an object with 'uri'"));
    }
    const auto uri_it = params->find("uri");
    if ((uri_it == params->end()) || (uri_it->is_string() == false)) {
        co_return tl::unexpected(JsonRpcError::invalid_params("'uri' must be a string"));
    }
    const std::string uri = uri_it->get<std::string>();

    auto content = co_await registry_.read_resource(uri);
    if (!content) {
        co_return tl::unexpected(to_rpc_error(content.error()));
    }
    co_return Json{{"content", std::move(*content)}};
}

}  // namespace archmcp
