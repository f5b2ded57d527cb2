#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// CommandExecutor - run an external program under a deadline
// ─────────────────────────────────────────────────────────────────────────────
//
// Programs run from an argv vector (no shell), in their own process group,
// with stdout and stderr captured on separate pipes. Each stream keeps at
// most max_output_bytes / 2 bytes; the rest is drained and discarded and the
// result is flagged as truncated. When the deadline passes the whole process
// group is killed with SIGKILL and the call fails with a Timeout error.
//
// A non-zero exit status is NOT an error here: it is reported in
// CommandResult. Errors are reserved for commands that could not be run at
// all (rejected, failed to spawn, timed out).
//
// ─────────────────────────────────────────────────────────────────────────────

#include "archmcp/config/server_config.hpp"
#include "archmcp/error.hpp"

#include <asio/awaitable.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace archmcp {

struct CommandRequest {
    std::string program;
    std::vector<std::string> args;
    bool require_root{false};

    /// Overrides CommandConfig::timeout
    std::optional<std::chrono::seconds> timeout;
};

struct CommandResult {
    std::optional<int> exit_code;    ///< Set when the process exited normally
    std::optional<int> term_signal;  ///< Set when the process was killed by a signal
    std::string stdout_text;
    std::string stderr_text;
    bool truncated{false};
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool success() const noexcept {
        return exit_code.has_value() && (*exit_code == 0);
    }
};

class CommandExecutor {
public:
    explicit CommandExecutor(CommandConfig config);

    /// Allow-list, argument and privilege checks; PermissionDenied on failure
    [[nodiscard]] Result<void> check(const CommandRequest& request) const;

    [[nodiscard]] asio::awaitable<Result<CommandResult>> run(CommandRequest request) const;

    [[nodiscard]] const CommandConfig& config() const noexcept { return config_; }

private:
    CommandConfig config_;
};

}  // namespace archmcp
