#include "archmcp/providers/system_provider.hpp"

#include "archmcp/providers/tool_args.hpp"

#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace archmcp {

namespace {

constexpr const char* kInfoUri = "system://info";

}  // namespace

SystemProvider::SystemProvider(CommandConfig config)
    : executor_(std::move(config))
{}

std::vector<Tool> SystemProvider::tools() const {
    return {
        Tool{
            "system_exec",
            "Execute a system command with proper privilege handling",
            {
                {"type", "object"},
                {"properties", {
                    {"command", {{"type", "string"}, {"description", "Command to execute"}}},
                    {"args", {
                        {"type", "array"},
                        {"items", {{"type", "string"}}},
                        {"description", "Command arguments"}
                    }},
                    {"require_root", {
                        {"type", "boolean"},
                        {"description", "Whether the command requires root privileges"},
                        {"default", false}
                    }},
                    {"timeout", {
                        {"type", "integer"},
                        {"description", "Timeout in seconds"},
                        {"default", executor_.config().timeout.count()}
                    }}
                }},
                {"required", Json::array({"command"})}
            }
        }
    };
}

std::vector<Resource> SystemProvider::resources() const {
    return {
        Resource{kInfoUri, "System Information", "Current system information and status", "application/json"}
    };
}

asio::awaitable<Result<ToolResult>> SystemProvider::handle_tool_call(const std::string& tool_name, ToolArgs args) {
    if (tool_name == "system_exec") {
        co_return co_await exec(args);
    }
    co_return tl::unexpected(Error::not_found("Tool not found: " + tool_name));
}

asio::awaitable<Result<ToolResult>> SystemProvider::exec(const ToolArgs& args) {
    CommandRequest request;

    auto command = args::required_string(args, "command");
    if (!command) co_return tl::unexpected(command.error());
    request.program = std::move(*command);

    auto argv = args::optional_string_list(args, "args");
    if (!argv) co_return tl::unexpected(argv.error());
    request.args = std::move(*argv);

    auto require_root = args::optional_bool(args, "require_root", false);
    if (!require_root) co_return tl::unexpected(require_root.error());
    request.require_root = *require_root;

    auto timeout = args::optional_int(args, "timeout");
    if (!timeout) co_return tl::unexpected(timeout.error());
    if (timeout->has_value()) {
        if (**timeout <= 0) {
            co_return tl::unexpected(Error::invalid_params("'timeout' must be a positive number of seconds"));
        }
        request.timeout = std::chrono::seconds(**timeout);
    }

    const std::string program = request.program;
    auto outcome = co_await executor_.run(std::move(request));
    if (!outcome) {
        co_return tl::unexpected(outcome.error());
    }

    if (outcome->success() == false) {
        std::string status = outcome->exit_code
            ? "exit status " + std::to_string(*outcome->exit_code)
            : "signal " + std::to_string(outcome->term_signal.value_or(0));
        std::string message = program + " failed with " + status;
        if (outcome->stderr_text.empty() == false) {
            message += ": " + outcome->stderr_text;
        }
        co_return tl::unexpected(Error::system_command(std::move(message)));
    }

    ToolResult result = ToolResult::text(std::move(outcome->stdout_text));
    result.metadata = Json{
        {"exit_code", *outcome->exit_code},
        {"truncated", outcome->truncated},
        {"stderr", outcome->stderr_text},
        {"duration_ms", outcome->duration.count()}
    };
    co_return result;
}

asio::awaitable<Result<std::string>> SystemProvider::handle_resource_read(const std::string& uri) {
    if (uri != kInfoUri) {
        co_return tl::unexpected(Error::not_found("Resource not found: " + uri));
    }
    auto info = collect_system_info();
    if (!info) {
        co_return tl::unexpected(info.error());
    }
    co_return info->dump(2, ' ', false, Json::error_handler_t::replace);
}

Result<Json> collect_system_info() {
    struct utsname names{};
    if (::uname(&names) != 0) {
        return tl::unexpected(Error::io(std::string("uname failed: ") + std::strerror(errno)));
    }

    struct sysinfo stats{};
    if (::sysinfo(&stats) != 0) {
        return tl::unexpected(Error::io(std::string("sysinfo failed: ") + std::strerror(errno)));
    }

    return Json{
        {"hostname", names.nodename},
        {"kernel", std::string(names.sysname) + " " + names.release},
        {"machine", names.machine},
        {"uptime_seconds", static_cast<std::int64_t>(stats.uptime)},
        {"euid", static_cast<std::uint64_t>(::geteuid())}
    };
}

}  // namespace archmcp
