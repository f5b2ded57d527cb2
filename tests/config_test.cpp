// ─────────────────────────────────────────────────────────────────────────────
// ServerConfig Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "archmcp/config/server_config.hpp"
#include "support/temp_dir.hpp"

#include <fstream>
#include <map>

using namespace archmcp;
using archmcp::test::TempDir;

namespace {

EnvLookup fake_env(std::map<std::string, std::string> values) {
    return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
        const auto it = values.find(std::string(name));
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

}  // namespace

TEST_CASE("ServerConfig defaults", "[config]") {
    ServerConfig config;

    REQUIRE(config.bind_address == "127.0.0.1");
    REQUIRE(config.port == 8080);
    REQUIRE(config.max_concurrent_operations == 10);
    REQUIRE(config.require_auth == true);
    REQUIRE(config.audit_log_path == "/var/log/archmcp/audit.log");
    REQUIRE(config.command.timeout == std::chrono::seconds(300));
    REQUIRE(config.provider_enabled("system"));
    REQUIRE(config.provider_enabled("hyprland"));
    REQUIRE(validate(config).has_value());
}

TEST_CASE("ServerConfig fluent setters", "[config]") {
    ServerConfig config;
    config.with_bind("0.0.0.0", 9000)
          .with_max_concurrent_operations(4)
          .with_audit_log("/tmp/audit.log")
          .with_providers({"system"});

    REQUIRE(config.bind_address == "0.0.0.0");
    REQUIRE(config.port == 9000);
    REQUIRE(config.max_concurrent_operations == 4);
    REQUIRE(config.audit_log_path == "/tmp/audit.log");
    REQUIRE(config.provider_enabled("system"));
    REQUIRE_FALSE(config.provider_enabled("hyprland"));
}

TEST_CASE("parse_bind_address", "[config]") {
    SECTION("host and port") {
        auto address = parse_bind_address("127.0.0.1:8080");
        REQUIRE(address.has_value());
        REQUIRE(address->host == "127.0.0.1");
        REQUIRE(address->port == 8080);
    }

    SECTION("bracketed IPv6") {
        auto address = parse_bind_address("[::1]:9090");
        REQUIRE(address.has_value());
        REQUIRE(address->host == "::1");
        REQUIRE(address->port == 9090);
    }

    SECTION("malformed") {
        for (const char* text : {"", "8080", ":8080", "localhost:", "localhost:http", "host:70000", "[::1]8080"}) {
            auto address = parse_bind_address(text);
            INFO(text);
            REQUIRE_FALSE(address.has_value());
            REQUIRE(address.error().code == ErrorCode::Configuration);
        }
    }
}

TEST_CASE("apply_json overlays present members only", "[config]") {
    ServerConfig config;
    const Json document = {
        {"server", {{"port", 9100}}},
        {"security", {{"max_concurrent_operations", 3}, {"audit_log", "/tmp/a.log"}}},
        {"command", {{"timeout_seconds", 30}, {"allowed_commands", Json::array({"echo", "ls"})}}},
        {"compositor", {{"enabled", false}, {"instance_signature", "abc"}}},
        {"logging", {{"level", "debug"}}},
        {"providers", Json::array({"system"})}
    };

    REQUIRE(apply_json(config, document).has_value());

    REQUIRE(config.bind_address == "127.0.0.1");
    REQUIRE(config.port == 9100);
    REQUIRE(config.max_concurrent_operations == 3);
    REQUIRE(config.audit_log_path == "/tmp/a.log");
    REQUIRE(config.require_auth == true);
    REQUIRE(config.command.timeout == std::chrono::seconds(30));
    REQUIRE(config.command.allowed_commands == std::vector<std::string>{"echo", "ls"});
    REQUIRE(config.compositor.enabled == false);
    REQUIRE(config.compositor.instance_signature == std::optional<std::string>("abc"));
    REQUIRE(config.logging.level == LogLevel::Debug);
    REQUIRE(config.providers == std::vector<std::string>{"system"});
}

TEST_CASE("apply_json rejects bad members without partial updates", "[config]") {
    ServerConfig config;
    const Json document = {
        {"server", {{"port", 9100}}},
        {"security", {{"require_auth", "yes"}}}
    };

    auto applied = apply_json(config, document);
    REQUIRE_FALSE(applied.has_value());
    REQUIRE(applied.error().code == ErrorCode::Configuration);
    REQUIRE(applied.error().message.find("require_auth") != std::string::npos);
    REQUIRE(config.port == 8080);

    REQUIRE_FALSE(apply_json(config, Json{{"server", {{"port", -1}}}}).has_value());
    REQUIRE_FALSE(apply_json(config, Json{{"server", {{"port", 70000}}}}).has_value());
    REQUIRE_FALSE(apply_json(config, Json{{"logging", "debug"}}).has_value());
    REQUIRE_FALSE(apply_json(config, Json::array()).has_value());
}

TEST_CASE("load_config_file", "[config]") {
    TempDir dir;

    SECTION("valid file") {
        const auto path = dir / "server.json";
        std::ofstream(path) << R"({"server": {"bind_address": "0.0.0.0", "port": 7000}})";

        auto config = load_config_file(path);
        REQUIRE(config.has_value());
        REQUIRE(config->bind_address == "0.0.0.0");
        REQUIRE(config->port == 7000);
    }

    SECTION("missing file") {
        auto config = load_config_file(dir / "absent.json");
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code == ErrorCode::Configuration);
    }

    SECTION("invalid JSON") {
        const auto path = dir / "broken.json";
        std::ofstream(path) << R"({"server": )";

        auto config = load_config_file(path);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code == ErrorCode::Configuration);
        REQUIRE(config.error().message.find("not valid JSON") != std::string::npos);
    }
}

TEST_CASE("apply_environment", "[config]") {
    ServerConfig config;

    SECTION("all variables") {
        auto env = fake_env({
            {"ARCHMCP_BIND_ADDRESS", "0.0.0.0:9999"},
            {"ARCHMCP_MAX_CONCURRENT_OPS", "2"},
            {"ARCHMCP_REQUIRE_AUTH", "false"},
            {"ARCHMCP_AUDIT_LOG", "/tmp/env-audit.log"},
            {"ARCHMCP_LOG_LEVEL", "WARNING"}
        });
        REQUIRE(apply_environment(config, env).has_value());

        REQUIRE(config.bind_address == "0.0.0.0");
        REQUIRE(config.port == 9999);
        REQUIRE(config.max_concurrent_operations == 2);
        REQUIRE(config.require_auth == false);
        REQUIRE(config.audit_log_path == "/tmp/env-audit.log");
        REQUIRE(config.logging.level == LogLevel::Warn);
    }

    SECTION("unset variables keep values") {
        config.port = 1234;
        REQUIRE(apply_environment(config, fake_env({})).has_value());
        REQUIRE(config.port == 1234);
    }

    SECTION("malformed value") {
        auto env = fake_env({
            {"ARCHMCP_MAX_CONCURRENT_OPS", "2"},
            {"ARCHMCP_REQUIRE_AUTH", "maybe"}
        });
        auto applied = apply_environment(config, env);
        REQUIRE_FALSE(applied.has_value());
        REQUIRE(applied.error().message.find("ARCHMCP_REQUIRE_AUTH") != std::string::npos);
        REQUIRE(config.max_concurrent_operations == 10);
    }
}

TEST_CASE("validate rejects unusable values", "[config]") {
    ServerConfig config;

    SECTION("zero concurrency") {
        config.max_concurrent_operations = 0;
    }
    SECTION("zero worker threads") {
        config.worker_threads = 0;
    }
    SECTION("empty bind address") {
        config.bind_address.clear();
    }
    SECTION("zero command timeout") {
        config.command.timeout = std::chrono::seconds(0);
    }
    SECTION("unknown provider") {
        config.providers = {"system", "docker"};
    }

    auto valid = validate(config);
    REQUIRE_FALSE(valid.has_value());
    REQUIRE(valid.error().code == ErrorCode::Configuration);
}

TEST_CASE("to_json output loads back", "[config]") {
    ServerConfig config;
    config.with_bind("::1", 4444).with_providers({"hyprland"});
    config.command.allowed_commands = {"uname"};

    ServerConfig reloaded;
    REQUIRE(apply_json(reloaded, to_json(config)).has_value());
    REQUIRE(reloaded.bind_address == "::1");
    REQUIRE(reloaded.port == 4444);
    REQUIRE(reloaded.providers == std::vector<std::string>{"hyprland"});
    REQUIRE(reloaded.command.allowed_commands == std::vector<std::string>{"uname"});
    REQUIRE(to_json(reloaded) == to_json(config));
}
