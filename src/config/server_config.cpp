#include "archmcp/config/server_config.hpp"

#include "archmcp/json/fast_json.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace archmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Fluent setters
// ─────────────────────────────────────────────────────────────────────────────

ServerConfig& ServerConfig::with_bind(std::string address, std::uint16_t listen_port) {
    bind_address = std::move(address);
    port = listen_port;
    return *this;
}

ServerConfig& ServerConfig::with_max_concurrent_operations(std::size_t limit) {
    max_concurrent_operations = limit;
    return *this;
}

ServerConfig& ServerConfig::with_audit_log(std::filesystem::path path) {
    audit_log_path = std::move(path);
    return *this;
}

ServerConfig& ServerConfig::with_providers(std::vector<std::string> names) {
    providers = std::move(names);
    return *this;
}

bool ServerConfig::provider_enabled(std::string_view name) const {
    return std::find(providers.begin(), providers.end(), name) != providers.end();
}

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Scalar parsing
// ─────────────────────────────────────────────────────────────────────────────

template <typename Unsigned>
Result<Unsigned> parse_unsigned(std::string_view text, std::string_view what) {
    Unsigned value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if ((text.empty() == true) || (ec != std::errc{}) || (ptr != last)) {
        return tl::unexpected(Error::configuration(
            std::string(what) + " must be a non-negative integer, got \"" + std::string(text) + "\""));
    }
    return value;
}

Result<bool> parse_bool(std::string_view text, std::string_view what) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if ((lowered == "true") || (lowered == "1") || (lowered == "yes") || (lowered == "on")) {
        return true;
    }
    if ((lowered == "false") || (lowered == "0") || (lowered == "no") || (lowered == "off")) {
        return false;
    }
    return tl::unexpected(Error::configuration(
        std::string(what) + " must be a boolean, got \"" + std::string(text) + "\""));
}

// ─────────────────────────────────────────────────────────────────────────────
// Typed JSON member access
// ─────────────────────────────────────────────────────────────────────────────

Result<void> read_string(const Json& section, const char* key, std::string& out) {
    const auto it = section.find(key);
    if (it == section.end()) {
        return {};
    }
    if (it->is_string() == false) {
        return tl::unexpected(Error::configuration(std::string(key) + " must be a string"));
    }
    out = it->get<std::string>();
    return {};
}

Result<void> read_optional_string(const Json& section, const char* key, std::optional<std::string>& out) {
    const auto it = section.find(key);
    if (it == section.end()) {
        return {};
    }
    if (it->is_null()) {
        out.reset();
        return {};
    }
    if (it->is_string() == false) {
        return tl::unexpected(Error::configuration(std::string(key) + " must be a string or null"));
    }
    out = it->get<std::string>();
    return {};
}

Result<void> read_bool(const Json& section, const char* key, bool& out) {
    const auto it = section.find(key);
    if (it == section.end()) {
        return {};
    }
    if (it->is_boolean() == false) {
        return tl::unexpected(Error::configuration(std::string(key) + " must be a boolean"));
    }
    out = it->get<bool>();
    return {};
}

template <typename Unsigned>
Result<void> read_unsigned(const Json& section, const char* key, Unsigned& out) {
    const auto it = section.find(key);
    if (it == section.end()) {
        return {};
    }
    // Integers may arrive signed (simdjson) or unsigned (nlohmann)
    const bool is_non_negative_integer =
        (it->is_number_unsigned() == true) ||
        ((it->is_number_integer() == true) && (it->get<std::int64_t>() >= 0));
    if ((is_non_negative_integer == false) ||
        (it->get<std::uint64_t>() > std::numeric_limits<Unsigned>::max())) {
        return tl::unexpected(Error::configuration(
            std::string(key) + " must be a non-negative integer in range"));
    }
    out = static_cast<Unsigned>(it->get<std::uint64_t>());
    return {};
}

Result<void> read_string_list(const Json& section, const char* key, std::vector<std::string>& out) {
    const auto it = section.find(key);
    if (it == section.end()) {
        return {};
    }
    if (it->is_array() == false) {
        return tl::unexpected(Error::configuration(std::string(key) + " must be an array of strings"));
    }
    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (item.is_string() == false) {
            return tl::unexpected(Error::configuration(std::string(key) + " must be an array of strings"));
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return {};
}

Result<const Json*> section_of(const Json& document, const char* key) {
    const auto it = document.find(key);
    if (it == document.end()) {
        return nullptr;
    }
    if (it->is_object() == false) {
        return tl::unexpected(Error::configuration(std::string("section \"") + key + "\" must be an object"));
    }
    return &*it;
}

#define ARCHMCP_CONFIG_TRY(expr)                             \
    do {                                                     \
        if (auto archmcp_status_ = (expr); !archmcp_status_) \
            return tl::unexpected(archmcp_status_.error());  \
    } while (false)

Result<void> apply_server_section(ServerConfig& config, const Json& section) {
    ARCHMCP_CONFIG_TRY(read_string(section, "bind_address", config.bind_address));
    ARCHMCP_CONFIG_TRY(read_unsigned(section, "port", config.port));
    ARCHMCP_CONFIG_TRY(read_unsigned(section, "worker_threads", config.worker_threads));
    ARCHMCP_CONFIG_TRY(read_unsigned(section, "max_line_bytes", config.max_line_bytes));
    return {};
}

Result<void> apply_security_section(ServerConfig& config, const Json& section) {
    ARCHMCP_CONFIG_TRY(read_bool(section, "require_auth", config.require_auth));
    ARCHMCP_CONFIG_TRY(read_unsigned(section, "max_concurrent_operations", config.max_concurrent_operations));
    std::string audit_log = config.audit_log_path.string();
    ARCHMCP_CONFIG_TRY(read_string(section, "audit_log", audit_log));
    config.audit_log_path = audit_log;
    return {};
}

Result<void> apply_command_section(CommandConfig& config, const Json& section) {
    std::uint64_t timeout_seconds = static_cast<std::uint64_t>(config.timeout.count());
    ARCHMCP_CONFIG_TRY(read_unsigned(section, "timeout_seconds", timeout_seconds));
    config.timeout = std::chrono::seconds(timeout_seconds);
    ARCHMCP_CONFIG_TRY(read_unsigned(section, "max_output_bytes", config.max_output_bytes));
    ARCHMCP_CONFIG_TRY(read_string_list(section, "allowed_commands", config.allowed_commands));
    return {};
}

Result<void> apply_compositor_section(CompositorConfig& config, const Json& section) {
    ARCHMCP_CONFIG_TRY(read_bool(section, "enabled", config.enabled));
    ARCHMCP_CONFIG_TRY(read_optional_string(section, "runtime_dir", config.runtime_dir));
    ARCHMCP_CONFIG_TRY(read_optional_string(section, "instance_signature", config.instance_signature));
    ARCHMCP_CONFIG_TRY(read_unsigned(section, "max_response_bytes", config.max_response_bytes));
    ARCHMCP_CONFIG_TRY(read_unsigned(section, "event_history", config.event_history));
    return {};
}

Result<void> apply_logging_section(LoggingConfig& config, const Json& section) {
    std::string level(to_string(config.level));
    ARCHMCP_CONFIG_TRY(read_string(section, "level", level));
    auto parsed = parse_log_level(level);
    if (!parsed) {
        return tl::unexpected(parsed.error());
    }
    config.level = *parsed;

    ARCHMCP_CONFIG_TRY(read_optional_string(section, "file", config.file));
    ARCHMCP_CONFIG_TRY(read_string(section, "pattern", config.pattern));
    ARCHMCP_CONFIG_TRY(read_bool(section, "async", config.async));
    return {};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────────────────────────────────────

Result<BindAddress> parse_bind_address(std::string_view text) {
    BindAddress address;
    std::string_view port_text;

    if ((text.empty() == false) && (text.front() == '[')) {
        const auto close = text.find(']');
        if ((close == std::string_view::npos) || (close + 1 >= text.size()) || (text[close + 1] != ':')) {
            return tl::unexpected(Error::configuration(
                "bind address must look like [host]:port, got \"" + std::string(text) + "\""));
        }
        address.host = std::string(text.substr(1, close - 1));
        port_text = text.substr(close + 2);
    } else {
        const auto colon = text.rfind(':');
        if ((colon == std::string_view::npos) || (colon == 0)) {
            return tl::unexpected(Error::configuration(
                "bind address must look like host:port, got \"" + std::string(text) + "\""));
        }
        address.host = std::string(text.substr(0, colon));
        port_text = text.substr(colon + 1);
    }

    auto port = parse_unsigned<std::uint16_t>(port_text, "bind port");
    if (!port) {
        return tl::unexpected(port.error());
    }
    address.port = *port;
    return address;
}

Result<void> apply_json(ServerConfig& config, const Json& document) {
    if (document.is_object() == false) {
        return tl::unexpected(Error::configuration("configuration document must be a JSON object"));
    }

    // Work on a copy so a bad member leaves config untouched
    ServerConfig updated = config;

    auto server = section_of(document, "server");
    if (!server) return tl::unexpected(server.error());
    if (*server != nullptr) ARCHMCP_CONFIG_TRY(apply_server_section(updated, **server));

    auto security = section_of(document, "security");
    if (!security) return tl::unexpected(security.error());
    if (*security != nullptr) ARCHMCP_CONFIG_TRY(apply_security_section(updated, **security));

    auto command = section_of(document, "command");
    if (!command) return tl::unexpected(command.error());
    if (*command != nullptr) ARCHMCP_CONFIG_TRY(apply_command_section(updated.command, **command));

    auto compositor = section_of(document, "compositor");
    if (!compositor) return tl::unexpected(compositor.error());
    if (*compositor != nullptr) ARCHMCP_CONFIG_TRY(apply_compositor_section(updated.compositor, **compositor));

    auto logging = section_of(document, "logging");
    if (!logging) return tl::unexpected(logging.error());
    if (*logging != nullptr) ARCHMCP_CONFIG_TRY(apply_logging_section(updated.logging, **logging));

    ARCHMCP_CONFIG_TRY(read_string_list(document, "providers", updated.providers));

    config = std::move(updated);
    return {};
}

Result<ServerConfig> load_config_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (in.is_open() == false) {
        return tl::unexpected(Error::configuration("cannot open config file " + path.string()));
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    auto document = fast_parse(contents.str());
    if (!document) {
        return tl::unexpected(Error::configuration(
            "config file " + path.string() + " is not valid JSON: " + document.error().message));
    }

    ServerConfig config;
    ARCHMCP_CONFIG_TRY(apply_json(config, *document));
    return config;
}

EnvLookup process_environment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const char* value = std::getenv(std::string(name).c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

Result<void> apply_environment(ServerConfig& config, const EnvLookup& env) {
    ServerConfig updated = config;

    if (auto bind = env("ARCHMCP_BIND_ADDRESS")) {
        auto address = parse_bind_address(*bind);
        if (!address) {
            return tl::unexpected(address.error());
        }
        updated.bind_address = address->host;
        updated.port = address->port;
    }

    if (auto limit = env("ARCHMCP_MAX_CONCURRENT_OPS")) {
        auto parsed = parse_unsigned<std::size_t>(*limit, "ARCHMCP_MAX_CONCURRENT_OPS");
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        updated.max_concurrent_operations = *parsed;
    }

    if (auto auth = env("ARCHMCP_REQUIRE_AUTH")) {
        auto parsed = parse_bool(*auth, "ARCHMCP_REQUIRE_AUTH");
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        updated.require_auth = *parsed;
    }

    if (auto audit = env("ARCHMCP_AUDIT_LOG")) {
        updated.audit_log_path = *audit;
    }

    if (auto level = env("ARCHMCP_LOG_LEVEL")) {
        auto parsed = parse_log_level(*level);
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        updated.logging.level = *parsed;
    }

    config = std::move(updated);
    return {};
}

Result<void> validate(const ServerConfig& config) {
    if (config.bind_address.empty()) {
        return tl::unexpected(Error::configuration("bind address must not be empty"));
    }
    if (config.max_concurrent_operations == 0) {
        return tl::unexpected(Error::configuration("max concurrent operations must be at least 1"));
    }
    if (config.worker_threads == 0) {
        return tl::unexpected(Error::configuration("worker threads must be at least 1"));
    }
    if (config.max_line_bytes == 0) {
        return tl::unexpected(Error::configuration("max line bytes must be at least 1"));
    }
    if (config.audit_log_path.empty()) {
        return tl::unexpected(Error::configuration("audit log path must not be empty"));
    }
    if (config.command.timeout.count() <= 0) {
        return tl::unexpected(Error::configuration("command timeout must be at least one second"));
    }
    if (config.command.max_output_bytes < 2) {
        return tl::unexpected(Error::configuration("command max output must be at least 2 bytes"));
    }
    if (config.compositor.max_response_bytes == 0) {
        return tl::unexpected(Error::configuration("compositor max response bytes must be at least 1"));
    }
    for (const auto& name : config.providers) {
        if ((name != "system") && (name != "hyprland")) {
            return tl::unexpected(Error::configuration("unknown provider \"" + name + "\""));
        }
    }
    return {};
}

Json to_json(const ServerConfig& config) {
    auto optional_string = [](const std::optional<std::string>& value) {
        return value.has_value() ? Json(*value) : Json(nullptr);
    };

    return {
        {"server", {
            {"bind_address", config.bind_address},
            {"port", config.port},
            {"worker_threads", config.worker_threads},
            {"max_line_bytes", config.max_line_bytes}
        }},
        {"security", {
            {"require_auth", config.require_auth},
            {"max_concurrent_operations", config.max_concurrent_operations},
            {"audit_log", config.audit_log_path.string()}
        }},
        {"command", {
            {"timeout_seconds", config.command.timeout.count()},
            {"max_output_bytes", config.command.max_output_bytes},
            {"allowed_commands", config.command.allowed_commands}
        }},
        {"compositor", {
            {"enabled", config.compositor.enabled},
            {"runtime_dir", optional_string(config.compositor.runtime_dir)},
            {"instance_signature", optional_string(config.compositor.instance_signature)},
            {"max_response_bytes", config.compositor.max_response_bytes},
            {"event_history", config.compositor.event_history}
        }},
        {"logging", {
            {"level", std::string(to_string(config.logging.level))},
            {"file", optional_string(config.logging.file)},
            {"pattern", config.logging.pattern},
            {"async", config.logging.async}
        }},
        {"providers", config.providers}
    };
}

}  // namespace archmcp
