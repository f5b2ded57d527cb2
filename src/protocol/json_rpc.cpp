#include "archmcp/protocol/json_rpc.hpp"

namespace archmcp {

namespace {

bool is_valid_params_type(const Json& node) {
    return (node.is_object() == true) || (node.is_array() == true);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::null() {
    return JsonRpcId{nullptr};
}

JsonRpcId JsonRpcId::integer(std::int64_t v) {
    return JsonRpcId{v};
}

JsonRpcId JsonRpcId::string(std::string v) {
    return JsonRpcId{std::move(v)};
}

Json JsonRpcId::to_json() const {
    return std::visit([](const auto& id_value) { return Json(id_value); }, value);
}

Result<JsonRpcId> JsonRpcId::from_json(const Json& node) {
    if (node.is_null() == true) {
        return JsonRpcId::null();
    }
    if (node.is_number_integer() == true) {
        return JsonRpcId::integer(node.get<std::int64_t>());
    }
    if (node.is_string() == true) {
        return JsonRpcId::string(node.get<std::string>());
    }
    return tl::unexpected(Error::protocol("id must be a string, an integer or null"));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcError JsonRpcError::parse_error(std::string detail) {
    return JsonRpcError{rpc_code::kParseError, "Parse error", Json{{"detail", std::move(detail)}}};
}

JsonRpcError JsonRpcError::invalid_request(std::string detail) {
    return JsonRpcError{rpc_code::kInvalidRequest, "Invalid Request", Json{{"detail", std::move(detail)}}};
}

JsonRpcError JsonRpcError::method_not_found(std::string_view method) {
    return JsonRpcError{rpc_code::kMethodNotFound, "Method not found: " + std::string(method), std::nullopt};
}

JsonRpcError JsonRpcError::invalid_params(std::string detail) {
    return JsonRpcError{rpc_code::kInvalidParams, "Invalid params: " + detail, std::nullopt};
}

JsonRpcError JsonRpcError::internal_error(std::string detail) {
    return JsonRpcError{rpc_code::kInternalError, std::move(detail), std::nullopt};
}

Json JsonRpcError::to_json() const {
    Json payload = Json::object();
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

Result<JsonRpcError> JsonRpcError::from_json(const Json& node) {
    if (node.is_object() == false) {
        return tl::unexpected(Error::protocol("error must be an object"));
    }
    const auto code_it = node.find("code");
    if ((code_it == node.end()) || (code_it->is_number_integer() == false)) {
        return tl::unexpected(Error::protocol("error.code must be an integer"));
    }
    const auto message_it = node.find("message");
    if ((message_it == node.end()) || (message_it->is_string() == false)) {
        return tl::unexpected(Error::protocol("error.message must be a string"));
    }

    JsonRpcError error{code_it->get<std::int64_t>(), message_it->get<std::string>(), std::nullopt};
    if (const auto data_it = node.find("data"); data_it != node.end()) {
        error.data = *data_it;
    }
    return error;
}

JsonRpcError to_rpc_error(const Error& error) {
    std::int64_t code = rpc_code::kInternalError;
    if (error.code == ErrorCode::InvalidParams) {
        code = rpc_code::kInvalidParams;
    } else if (error.code == ErrorCode::Protocol) {
        code = rpc_code::kInvalidRequest;
    }
    return JsonRpcError{code, error.describe(), Json{{"kind", to_string(error.code)}}};
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::optional<JsonRpcId> id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (id_.has_value()) {
        payload["id"] = id_->to_json();
    }
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

Result<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(Error::protocol("request must be a JSON object"));
    }

    if (const auto version_it = payload.find("jsonrpc"); version_it != payload.end()) {
        if ((version_it->is_string() == false) || (*version_it != kJsonRpcVersion)) {
            return tl::unexpected(Error::protocol("jsonrpc must equal \"2.0\""));
        }
    }

    const auto method_it = payload.find("method");
    if (method_it == payload.end()) {
        return tl::unexpected(Error::protocol("missing method field"));
    }
    if (method_it->is_string() == false) {
        return tl::unexpected(Error::protocol("method must be a string"));
    }

    std::optional<JsonRpcId> id;
    if (const auto id_it = payload.find("id"); id_it != payload.end()) {
        auto parsed_id = JsonRpcId::from_json(*id_it);
        if (parsed_id.has_value() == false) {
            return tl::unexpected(parsed_id.error());
        }
        id = std::move(*parsed_id);
    }

    std::optional<Json> params;
    if (const auto params_it = payload.find("params"); params_it != payload.end()) {
        // "params": null is treated the same as an absent member
        if (params_it->is_null() == false) {
            if (is_valid_params_type(*params_it) == false) {
                return tl::unexpected(Error::protocol("params must be an object or array"));
            }
            params = *params_it;
        }
    }

    return JsonRpcRequest(method_it->get<std::string>(), std::move(id), std::move(params));
}

JsonRpcId JsonRpcRequest::recover_id(const Json& payload) {
    if (payload.is_object() == false) {
        return JsonRpcId::null();
    }
    const auto id_it = payload.find("id");
    if (id_it == payload.end()) {
        return JsonRpcId::null();
    }
    auto parsed = JsonRpcId::from_json(*id_it);
    return parsed.has_value() ? *parsed : JsonRpcId::null();
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcNotification::JsonRpcNotification(std::string method, std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcResponse::JsonRpcResponse(JsonRpcId id, std::variant<Json, JsonRpcError> outcome)
    : id_(std::move(id)),
      outcome_(std::move(outcome)) {}

JsonRpcResponse JsonRpcResponse::success(JsonRpcId id, Json result) {
    return JsonRpcResponse(std::move(id), std::variant<Json, JsonRpcError>(std::in_place_type<Json>, std::move(result)));
}

JsonRpcResponse JsonRpcResponse::failure(JsonRpcId id, JsonRpcError error) {
    return JsonRpcResponse(std::move(id), std::variant<Json, JsonRpcError>(std::in_place_type<JsonRpcError>, std::move(error)));
}

Json JsonRpcResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    if (is_error()) {
        payload["error"] = error().to_json();
    } else {
        payload["result"] = result();
    }
    return payload;
}

Result<JsonRpcResponse> JsonRpcResponse::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(Error::protocol("response must be a JSON object"));
    }

    const auto id_it = payload.find("id");
    if (id_it == payload.end()) {
        return tl::unexpected(Error::protocol("missing id field"));
    }
    auto id = JsonRpcId::from_json(*id_it);
    if (id.has_value() == false) {
        return tl::unexpected(id.error());
    }

    const bool has_result = payload.contains("result");
    const bool has_error = payload.contains("error");
    if (has_result == has_error) {
        return tl::unexpected(Error::protocol("response must carry exactly one of result or error"));
    }

    if (has_error) {
        auto error = JsonRpcError::from_json(payload.at("error"));
        if (error.has_value() == false) {
            return tl::unexpected(error.error());
        }
        return failure(std::move(*id), std::move(*error));
    }
    return success(std::move(*id), payload.at("result"));
}

}  // namespace archmcp
