#ifndef ARCHMCP_PROTOCOL_MCP_TYPES_HPP
#define ARCHMCP_PROTOCOL_MCP_TYPES_HPP

#include "archmcp/json/json.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace archmcp {

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Version
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        if (j.is_object() == false) {
            return {};
        }
        return {
            j.value("name", ""),
            j.value("version", "")
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════

struct ServerCapabilities {
    struct Tools {
        bool list_changed = true;
    };
    struct Resources {
        bool subscribe = true;
        bool list_changed = true;
    };
    struct Prompts {
        bool list_changed = true;
    };

    std::optional<Tools> tools{Tools{}};
    std::optional<Resources> resources{Resources{}};
    std::optional<Prompts> prompts{Prompts{}};

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (tools) {
            j["tools"] = {{"listChanged", tools->list_changed}};
        }
        if (resources) {
            j["resources"] = {
                {"subscribe", resources->subscribe},
                {"listChanged", resources->list_changed}
            };
        }
        if (prompts) {
            j["prompts"] = {{"listChanged", prompts->list_changed}};
        }
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize Request/Response
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    Json capabilities = Json::object();
    Implementation client_info;

    static InitializeParams from_json(const Json& j) {
        InitializeParams params;
        if (j.is_object() == false) {
            return params;
        }
        if (j.contains("protocolVersion") && j["protocolVersion"].is_string()) {
            params.protocol_version = j["protocolVersion"].get<std::string>();
        }
        if (j.contains("capabilities")) {
            params.capabilities = j["capabilities"];
        }
        if (j.contains("clientInfo")) {
            params.client_info = Implementation::from_json(j["clientInfo"]);
        }
        return params;
    }
};

struct InitializeResult {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    ServerCapabilities capabilities;
    Implementation server_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"serverInfo", server_info.to_json()}
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools & Resources
// ═══════════════════════════════════════════════════════════════════════════

struct Tool {
    std::string name;
    std::string description;
    Json input_schema = Json::object();  // JSON Schema for tool arguments

    [[nodiscard]] Json to_json() const {
        return {
            {"name", name},
            {"description", description},
            {"inputSchema", input_schema}
        };
    }
};

struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}, {"name", name}};
        if (description) {
            j["description"] = *description;
        }
        if (mime_type) {
            j["mimeType"] = *mime_type;
        }
        return j;
    }
};

/// Named arguments of one tools/call (always a JSON object)
using ToolArgs = Json;

// ═══════════════════════════════════════════════════════════════════════════
// Content Types
// ═══════════════════════════════════════════════════════════════════════════

struct TextContent {
    std::string text;

    [[nodiscard]] Json to_json() const {
        return {{"type", "text"}, {"text", text}};
    }
};

struct ImageContent {
    std::string data;      // Base64 encoded
    std::string mime_type;

    [[nodiscard]] Json to_json() const {
        return {
            {"type", "image"},
            {"data", data},
            {"mimeType", mime_type}
        };
    }
};

struct EmbeddedResource {
    std::string uri;
    std::optional<std::string> text;
    std::optional<std::string> mime_type;

    [[nodiscard]] Json to_json() const {
        Json resource = {{"uri", uri}};
        if (text) {
            resource["text"] = *text;
        }
        if (mime_type) {
            resource["mimeType"] = *mime_type;
        }
        return {{"type", "resource"}, {"resource", resource}};
    }
};

using Content = std::variant<TextContent, ImageContent, EmbeddedResource>;

[[nodiscard]] inline Json content_to_json(const Content& content) {
    return std::visit([](const auto& item) { return item.to_json(); }, content);
}

// ═══════════════════════════════════════════════════════════════════════════
// Tool Result
// ═══════════════════════════════════════════════════════════════════════════

struct ToolResult {
    std::vector<Content> content;
    std::optional<bool> is_error;
    std::optional<Json> metadata;

    [[nodiscard]] static ToolResult text(std::string body) {
        ToolResult result;
        result.content.emplace_back(TextContent{std::move(body)});
        return result;
    }

    /// A result the tool itself flags as failed (still a successful call)
    [[nodiscard]] static ToolResult error(std::string message) {
        ToolResult result = text(std::move(message));
        result.is_error = true;
        return result;
    }

    [[nodiscard]] Json to_json() const {
        Json items = Json::array();
        for (const auto& item : content) {
            items.push_back(content_to_json(item));
        }
        Json j = {{"content", std::move(items)}};
        if (is_error) {
            j["isError"] = *is_error;
        }
        if (metadata) {
            j["metadata"] = *metadata;
        }
        return j;
    }
};

}  // namespace archmcp

#endif  // ARCHMCP_PROTOCOL_MCP_TYPES_HPP
