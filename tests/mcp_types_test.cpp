#include <catch2/catch_test_macros.hpp>

#include "archmcp/protocol/mcp_types.hpp"

using namespace archmcp;

TEST_CASE("InitializeParams reads client identity and version", "[mcp][types]") {
    auto params = InitializeParams::from_json({
        {"protocolVersion", "2024-11-05"},
        {"capabilities", {{"roots", {{"listChanged", true}}}}},
        {"clientInfo", {{"name", "inspector"}, {"version", "1.2"}}}
    });

    REQUIRE(params.protocol_version == "2024-11-05");
    REQUIRE(params.client_info.name == "inspector");
    REQUIRE(params.client_info.version == "1.2");
    REQUIRE(params.capabilities["roots"]["listChanged"] == true);
}

TEST_CASE("InitializeParams falls back to defaults", "[mcp][types]") {
    auto params = InitializeParams::from_json(Json::object());
    REQUIRE(params.protocol_version == MCP_PROTOCOL_VERSION);
    REQUIRE(params.client_info.name.empty());
}

TEST_CASE("InitializeResult advertises tools, resources and prompts", "[mcp][types]") {
    InitializeResult result;
    result.server_info = {"archmcp", "0.1.0"};
    auto j = result.to_json();

    REQUIRE(j["protocolVersion"] == MCP_PROTOCOL_VERSION);
    REQUIRE(j["serverInfo"]["name"] == "archmcp");
    REQUIRE(j["capabilities"].contains("tools"));
    REQUIRE(j["capabilities"].contains("resources"));
    REQUIRE(j["capabilities"].contains("prompts"));
}

TEST_CASE("Tool serializes its schema as inputSchema", "[mcp][types]") {
    Tool tool{"system_exec", "Run a command", {{"type", "object"}}};
    auto j = tool.to_json();

    REQUIRE(j["name"] == "system_exec");
    REQUIRE(j["inputSchema"]["type"] == "object");
    REQUIRE(j.contains("input_schema") == false);
}

TEST_CASE("Resource omits absent optional members", "[mcp][types]") {
    Resource bare{"hyprland://layout", "Window Layout", std::nullopt, std::nullopt};
    REQUIRE(bare.to_json().contains("description") == false);
    REQUIRE(bare.to_json().contains("mimeType") == false);

    Resource full{"system://info", "System Information", "Host facts", "application/json"};
    REQUIRE(full.to_json()["mimeType"] == "application/json");
    REQUIRE(full.to_json()["description"] == "Host facts");
}

TEST_CASE("ToolResult serializes content items, error flag and metadata", "[mcp][types]") {
    SECTION("text result") {
        auto j = ToolResult::text("hello").to_json();
        REQUIRE(j["content"].size() == 1);
        REQUIRE(j["content"][0]["type"] == "text");
        REQUIRE(j["content"][0]["text"] == "hello");
        REQUIRE(j.contains("isError") == false);
        REQUIRE(j.contains("metadata") == false);
    }
    SECTION("flagged error") {
        auto j = ToolResult::error("failed").to_json();
        REQUIRE(j["isError"] == true);
    }
    SECTION("mixed content with metadata") {
        ToolResult result;
        result.content.emplace_back(TextContent{"caption"});
        result.content.emplace_back(ImageContent{"aGVsbG8=", "image/png"});
        result.content.emplace_back(EmbeddedResource{"hyprland://config", "monitor=,preferred,auto,1", "text/plain"});
        result.metadata = Json{{"type", "window_info"}};

        auto j = result.to_json();
        REQUIRE(j["content"].size() == 3);
        REQUIRE(j["content"][1]["type"] == "image");
        REQUIRE(j["content"][1]["mimeType"] == "image/png");
        REQUIRE(j["content"][2]["type"] == "resource");
        REQUIRE(j["content"][2]["resource"]["uri"] == "hyprland://config");
        REQUIRE(j["metadata"]["type"] == "window_info");
    }
}
