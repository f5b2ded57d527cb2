#include "archmcp/system/command_executor.hpp"

#include "archmcp/log/logger.hpp"

#include <asio/experimental/awaitable_operators.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/read.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace archmcp {

namespace {

using namespace asio::experimental::awaitable_operators;

constexpr auto kReapInterval = std::chrono::milliseconds(10);

struct Capture {
    std::string text;
    bool truncated{false};
};

struct ChildExit {
    int status{0};
    bool reaped{false};
};

// Read until EOF, keeping at most limit bytes. Reading continues past the
// limit so a chatty child never blocks on a full pipe.
asio::awaitable<void> drain(asio::posix::stream_descriptor& pipe, Capture& capture, std::size_t limit) {
    std::array<char, 4096> buffer{};
    for (;;) {
        asio::error_code ec;
        const std::size_t n = co_await pipe.async_read_some(
            asio::buffer(buffer), asio::redirect_error(asio::use_awaitable, ec));

        if (n > 0) {
            const std::size_t room = (capture.text.size() < limit) ? (limit - capture.text.size()) : 0;
            const std::size_t kept = std::min(room, n);
            capture.text.append(buffer.data(), kept);
            if (kept < n) {
                capture.truncated = true;
            }
        }
        if (ec) {
            co_return;
        }
    }
}

asio::awaitable<void> reap(pid_t pid, ChildExit& exit) {
    asio::steady_timer poll(co_await asio::this_coro::executor);
    for (;;) {
        const pid_t waited = ::waitpid(pid, &exit.status, WNOHANG);
        if (waited == pid) {
            exit.reaped = true;
            co_return;
        }
        if ((waited == -1) && (errno != EINTR)) {
            co_return;
        }

        poll.expires_after(kReapInterval);
        asio::error_code ec;
        co_await poll.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            co_return;
        }
    }
}

asio::awaitable<void> collect(asio::posix::stream_descriptor& out,
                              asio::posix::stream_descriptor& err,
                              Capture& out_capture,
                              Capture& err_capture,
                              std::size_t limit,
                              pid_t pid,
                              ChildExit& exit) {
    co_await (drain(out, out_capture, limit) && drain(err, err_capture, limit));

    // Deadline passed: the caller kills and reaps the process group
    const auto state = co_await asio::this_coro::cancellation_state;
    if (state.cancelled() != asio::cancellation_type::none) {
        co_return;
    }
    co_await reap(pid, exit);
}

void reap_blocking(pid_t pid, ChildExit& exit) {
    for (;;) {
        const pid_t waited = ::waitpid(pid, &exit.status, 0);
        if (waited == pid) {
            exit.reaped = true;
            return;
        }
        if (errno != EINTR) {
            return;
        }
    }
}

void close_pair(int fds[2]) {
    if (fds[0] != -1) ::close(fds[0]);
    if (fds[1] != -1) ::close(fds[1]);
    fds[0] = -1;
    fds[1] = -1;
}

bool is_allowed(const std::string& program, const std::vector<std::string>& allowed) {
    if (allowed.empty()) {
        return true;
    }
    const std::string base = std::filesystem::path(program).filename().string();
    for (const auto& entry : allowed) {
        if ((entry == program) || ((entry.find('/') == std::string::npos) && (entry == base))) {
            return true;
        }
    }
    return false;
}

std::string describe_command(const CommandRequest& request) {
    std::string text = request.program;
    for (const auto& arg : request.args) {
        text += ' ';
        text += arg;
    }
    return text;
}

}  // namespace

CommandExecutor::CommandExecutor(CommandConfig config)
    : config_(std::move(config))
{}

Result<void> CommandExecutor::check(const CommandRequest& request) const {
    if (request.program.empty()) {
        return tl::unexpected(Error::invalid_params("command must not be empty"));
    }
    if (is_allowed(request.program, config_.allowed_commands) == false) {
        return tl::unexpected(Error::permission_denied(
            "command '" + request.program + "' is not allowed"));
    }
    for (const auto& arg : request.args) {
        if ((arg.find("..") != std::string::npos) || (arg.find('~') != std::string::npos)) {
            return tl::unexpected(Error::permission_denied(
                "path traversal in arguments is not allowed: '" + arg + "'"));
        }
    }
    if (request.require_root && (::geteuid() != 0)) {
        return tl::unexpected(Error::permission_denied(
            "command '" + request.program + "' requires root privileges"));
    }
    return {};
}

asio::awaitable<Result<CommandResult>> CommandExecutor::run(CommandRequest request) const {
    if (auto allowed = check(request); !allowed) {
        co_return tl::unexpected(allowed.error());
    }

    const auto timeout = request.timeout.value_or(config_.timeout);
    const std::size_t per_stream_limit = config_.max_output_bytes / 2;

    // argv is built before fork(): the child must not allocate
    std::vector<std::string> argv_storage;
    argv_storage.reserve(request.args.size() + 1);
    argv_storage.push_back(request.program);
    argv_storage.insert(argv_storage.end(), request.args.begin(), request.args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // reports execvp() failure; closed by a successful exec

    if ((::pipe2(out_pipe, O_CLOEXEC) == -1) ||
        (::pipe2(err_pipe, O_CLOEXEC) == -1) ||
        (::pipe2(exec_pipe, O_CLOEXEC) == -1)) {
        const int saved = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        co_return tl::unexpected(Error::system_command(
            "failed to create pipes: " + std::string(std::strerror(saved))));
    }

    get_logger().logf(LogLevel::Info, "executing command: {}", describe_command(request));
    const auto started = std::chrono::steady_clock::now();

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int saved = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        co_return tl::unexpected(Error::system_command(
            "failed to fork: " + std::string(std::strerror(saved))));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setpgid(0, 0);

        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull != -1) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        ::execvp(argv[0], argv.data());

        const int exec_errno = errno;
        ssize_t ignored = ::write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    // Parent. Also set the group here so kill(-pid) works before the child runs.
    ::setpgid(pid, pid);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    auto executor = co_await asio::this_coro::executor;
    asio::posix::stream_descriptor out_stream(executor, out_pipe[0]);
    asio::posix::stream_descriptor err_stream(executor, err_pipe[0]);
    asio::posix::stream_descriptor exec_stream(executor, exec_pipe[0]);

    {
        int exec_errno = 0;
        asio::error_code ec;
        const std::size_t n = co_await asio::async_read(
            exec_stream, asio::buffer(&exec_errno, sizeof(exec_errno)),
            asio::redirect_error(asio::use_awaitable, ec));
        if (n == sizeof(exec_errno)) {
            ChildExit ignored;
            reap_blocking(pid, ignored);
            co_return tl::unexpected(Error::system_command(
                "failed to execute '" + request.program + "': " + std::strerror(exec_errno)));
        }
    }

    Capture out_capture;
    Capture err_capture;
    ChildExit exit;

    asio::steady_timer deadline(executor);
    deadline.expires_after(timeout);

    const auto outcome = co_await (
        collect(out_stream, err_stream, out_capture, err_capture, per_stream_limit, pid, exit) ||
        deadline.async_wait(asio::use_awaitable)
    );

    if (outcome.index() == 1) {
        ::kill(-pid, SIGKILL);
        reap_blocking(pid, exit);
        get_logger().logf(LogLevel::Warn, "command timed out after {} s: {}",
                          timeout.count(), describe_command(request));
        co_return tl::unexpected(Error::timeout(
            "command '" + request.program + "' timed out after " + std::to_string(timeout.count()) + " s"));
    }

    if (exit.reaped == false) {
        co_return tl::unexpected(Error::system_command(
            "lost track of command '" + request.program + "' (exit status unavailable)"));
    }

    CommandResult result;
    result.stdout_text = std::move(out_capture.text);
    result.stderr_text = std::move(err_capture.text);
    result.truncated = out_capture.truncated || err_capture.truncated;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (WIFEXITED(exit.status)) {
        result.exit_code = WEXITSTATUS(exit.status);
    } else if (WIFSIGNALED(exit.status)) {
        result.term_signal = WTERMSIG(exit.status);
    }

    if (result.truncated) {
        get_logger().logf(LogLevel::Warn, "output of '{}' exceeded {} bytes per stream and was truncated",
                          request.program, per_stream_limit);
    }
    get_logger().logf(LogLevel::Debug, "command '{}' finished in {} ms (exit {})",
                      request.program, result.duration.count(),
                      result.exit_code.has_value() ? std::to_string(*result.exit_code) : "signal");
    co_return result;
}

}  // namespace archmcp
