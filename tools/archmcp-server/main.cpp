// archmcp-server - serve MCP tools and resources over newline-delimited JSON-RPC
//
// Configuration layers, later ones win:
//   built-in defaults < --config FILE < ARCHMCP_* environment < command line

#include "archmcp/config/server_config.hpp"
#include "archmcp/json/fast_json.hpp"
#include "archmcp/log/spdlog_logger.hpp"
#include "archmcp/server/mcp_server.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

void print_error(const std::string& message) {
    std::cerr << "archmcp-server: " << message << "\n";
}

archmcp::Result<archmcp::ServerConfig> load_configuration(const cxxopts::ParseResult& result) {
    using namespace archmcp;

    ServerConfig config;
    if (result.count("config")) {
        auto loaded = load_config_file(result["config"].as<std::string>());
        if (!loaded) {
            return tl::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (auto env = apply_environment(config, process_environment()); !env) {
        return tl::unexpected(env.error());
    }

    if (result.count("bind")) {
        auto bind = parse_bind_address(result["bind"].as<std::string>());
        if (!bind) {
            return tl::unexpected(bind.error());
        }
        config.with_bind(bind->host, bind->port);
    }
    if (result.count("max-concurrent-ops")) {
        config.with_max_concurrent_operations(result["max-concurrent-ops"].as<std::size_t>());
    }
    if (result.count("audit-log")) {
        config.with_audit_log(result["audit-log"].as<std::string>());
    }
    if (result.count("threads")) {
        config.worker_threads = result["threads"].as<std::size_t>();
    }
    if (result.count("no-auth")) {
        config.require_auth = false;
    }
    if (result.count("providers")) {
        config.with_providers(result["providers"].as<std::vector<std::string>>());
    }
    if (result.count("log-level")) {
        auto level = parse_log_level(result["log-level"].as<std::string>());
        if (!level) {
            return tl::unexpected(level.error());
        }
        config.logging.level = *level;
    }
    if (result.count("log-file")) {
        config.logging.file = result["log-file"].as<std::string>();
    }

    if (auto valid = validate(config); !valid) {
        return tl::unexpected(valid.error());
    }
    return config;
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("archmcp-server", "MCP server for Arch Linux system and Hyprland control");

    options.add_options()
        ("c,config", "JSON configuration file", cxxopts::value<std::string>())
        ("b,bind", "Listen address as host:port", cxxopts::value<std::string>())
        ("max-concurrent-ops", "Maximum concurrent tool executions", cxxopts::value<std::size_t>())
        ("audit-log", "Audit ledger path", cxxopts::value<std::string>())
        ("t,threads", "Worker threads", cxxopts::value<std::size_t>())
        ("no-auth", "Do not require authorization checks")
        ("p,providers", "Providers to enable (system, hyprland)", cxxopts::value<std::vector<std::string>>())
        ("l,log-level", "trace, debug, info, warn, error, fatal or off", cxxopts::value<std::string>())
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("print-config", "Print the effective configuration and exit")
        ("h,help", "Print usage");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }

    if (result.count("help")) {
        std::cout << options.help() << "\n";
        std::cout << "Environment:\n"
                  << "  ARCHMCP_BIND_ADDRESS, ARCHMCP_MAX_CONCURRENT_OPS, ARCHMCP_REQUIRE_AUTH,\n"
                  << "  ARCHMCP_AUDIT_LOG, ARCHMCP_LOG_LEVEL\n";
        return 0;
    }

    auto config = load_configuration(result);
    if (!config) {
        print_error(config.error().describe());
        return 1;
    }

    if (result.count("print-config")) {
        std::cout << archmcp::to_json(*config).dump(2) << "\n";
        return 0;
    }

    auto logger = archmcp::make_server_logger(config->logging);
    if (!logger) {
        print_error(logger.error().describe());
        return 1;
    }
    archmcp::set_logger(std::move(*logger));

    archmcp::get_logger().logf(archmcp::LogLevel::Info, "{} {} starting (simdjson kernel: {})",
                               archmcp::ARCHMCP_SERVER_NAME, archmcp::ARCHMCP_VERSION,
                               archmcp::fast_json_implementation());

    auto server = archmcp::McpServer::Builder()
        .with_config(*config)
        .with_default_providers()
        .build();
    if (!server) {
        archmcp::get_logger().logf(archmcp::LogLevel::Fatal, "startup failed: {}", server.error().describe());
        print_error(server.error().describe());
        return 1;
    }

    (*server)->run();
    return 0;
}
