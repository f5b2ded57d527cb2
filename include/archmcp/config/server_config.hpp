#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Server Configuration
// ─────────────────────────────────────────────────────────────────────────────
//
// Layers, lowest precedence first:
//   1. the defaults below
//   2. a JSON file (load_config_file / apply_json)
//   3. ARCHMCP_* environment variables (apply_environment)
//   4. command-line options (applied by archmcp-server)
// validate() runs after the last layer.
//
// ─────────────────────────────────────────────────────────────────────────────

#include "archmcp/error.hpp"
#include "archmcp/json/json.hpp"
#include "archmcp/log/spdlog_logger.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archmcp {

struct CommandConfig {
    std::chrono::seconds timeout{300};

    /// Total capture budget; stdout and stderr get half each
    std::size_t max_output_bytes{10 * 1024 * 1024};

    /// Program names (or absolute paths) allowed to run; empty allows all
    std::vector<std::string> allowed_commands;
};

struct CompositorConfig {
    bool enabled{true};

    /// Override $XDG_RUNTIME_DIR / $HYPRLAND_INSTANCE_SIGNATURE
    std::optional<std::string> runtime_dir;
    std::optional<std::string> instance_signature;

    std::size_t max_response_bytes{64 * 1024};

    /// Parsed events kept for the hyprland://events resource
    std::size_t event_history{256};
};

struct ServerConfig {
    std::string bind_address{"127.0.0.1"};
    std::uint16_t port{8080};
    std::size_t worker_threads{1};

    std::size_t max_concurrent_operations{10};
    bool require_auth{true};
    std::filesystem::path audit_log_path{"/var/log/archmcp/audit.log"};

    /// Longest accepted request line; longer lines close the connection
    std::size_t max_line_bytes{1024 * 1024};

    CommandConfig command;
    CompositorConfig compositor;
    LoggingConfig logging;

    /// Providers to register, by name ("system", "hyprland")
    std::vector<std::string> providers{"system", "hyprland"};

    ServerConfig& with_bind(std::string address, std::uint16_t listen_port);
    ServerConfig& with_max_concurrent_operations(std::size_t limit);
    ServerConfig& with_audit_log(std::filesystem::path path);
    ServerConfig& with_providers(std::vector<std::string> names);

    [[nodiscard]] bool provider_enabled(std::string_view name) const;
};

struct BindAddress {
    std::string host;
    std::uint16_t port{0};
};

/// Parse "host:port" (IPv6 hosts in brackets: "[::1]:8080")
[[nodiscard]] Result<BindAddress> parse_bind_address(std::string_view text);

/// Overlay the members present in a JSON object onto config
[[nodiscard]] Result<void> apply_json(ServerConfig& config, const Json& document);

/// Defaults overlaid with the JSON file at path
[[nodiscard]] Result<ServerConfig> load_config_file(const std::filesystem::path& path);

/// Returns the variable's value, or nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// Lookup backed by std::getenv
[[nodiscard]] EnvLookup process_environment();

/// Overlay ARCHMCP_BIND_ADDRESS, ARCHMCP_MAX_CONCURRENT_OPS, ARCHMCP_REQUIRE_AUTH,
/// ARCHMCP_AUDIT_LOG and ARCHMCP_LOG_LEVEL
[[nodiscard]] Result<void> apply_environment(ServerConfig& config, const EnvLookup& env);

/// Reject values the server cannot run with
[[nodiscard]] Result<void> validate(const ServerConfig& config);

[[nodiscard]] Json to_json(const ServerConfig& config);

}  // namespace archmcp
