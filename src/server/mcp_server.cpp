#include "archmcp/server/mcp_server.hpp"

#include "archmcp/log/logger.hpp"
#include "archmcp/providers/compositor_provider.hpp"
#include "archmcp/providers/system_provider.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/read_until.hpp>
#include <asio/redirect_error.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <csignal>
#include <exception>
#include <optional>
#include <thread>

namespace archmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Builder
// ─────────────────────────────────────────────────────────────────────────────

McpServer::Builder& McpServer::Builder::with_config(ServerConfig config) {
    config_ = std::move(config);
    return *this;
}

McpServer::Builder& McpServer::Builder::with_provider(std::unique_ptr<IProvider> provider) {
    // std::function needs a copyable callable
    auto holder = std::make_shared<std::unique_ptr<IProvider>>(std::move(provider));
    factories_.push_back([holder](asio::any_io_executor) { return std::move(*holder); });
    return *this;
}

McpServer::Builder& McpServer::Builder::with_provider(ProviderFactory factory) {
    factories_.push_back(std::move(factory));
    return *this;
}

McpServer::Builder& McpServer::Builder::with_default_providers() {
    default_providers_ = true;
    return *this;
}

McpServer::Builder& McpServer::Builder::with_security_manager(std::unique_ptr<SecurityManager> security) {
    security_ = std::move(security);
    return *this;
}

Result<std::unique_ptr<McpServer>> McpServer::Builder::build() {
    if (auto valid = validate(config_); !valid) {
        return tl::unexpected(valid.error());
    }

    std::unique_ptr<McpServer> server(new McpServer(config_));
    const ServerConfig& config = server->config_;
    const auto executor = server->executor();

    if (security_) {
        server->security_ = std::move(security_);
    } else {
        auto security = SecurityManager::create(executor, config.require_auth, config.audit_log_path);
        if (!security) {
            return tl::unexpected(security.error());
        }
        server->security_ = std::move(*security);
    }

    server->admission_ = std::make_unique<AdmissionController>(executor, config.max_concurrent_operations);

    // Built-in providers first, in the configured order, then explicit ones
    std::vector<ProviderFactory> factories;
    if (default_providers_) {
        for (const auto& name : config.providers) {
            if (name == "system") {
                factories.push_back([command = config.command](asio::any_io_executor) {
                    return std::make_unique<SystemProvider>(command);
                });
            } else if (name == "hyprland") {
                factories.push_back([compositor = config.compositor](asio::any_io_executor ex) {
                    return std::make_unique<CompositorProvider>(ex, compositor);
                });
            }
        }
    }
    for (auto& factory : factories_) {
        factories.push_back(std::move(factory));
    }
    factories_.clear();

    for (auto& factory : factories) {
        auto provider = factory(executor);
        if (provider == nullptr) {
            return tl::unexpected(Error::configuration("provider factory returned no provider"));
        }
        if (auto registered = server->registry_.register_provider(std::move(provider)); !registered) {
            return tl::unexpected(registered.error());
        }
    }

    server->dispatcher_ = std::make_unique<Dispatcher>(
        server->registry_, *server->admission_, *server->security_,
        Implementation{ARCHMCP_SERVER_NAME, ARCHMCP_VERSION});

    if (auto listening = server->listen(); !listening) {
        return tl::unexpected(listening.error());
    }
    return server;
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

McpServer::McpServer(ServerConfig config)
    : config_(std::move(config))
    , io_(static_cast<int>(config_.worker_threads))
    , strand_(asio::make_strand(io_))
    , acceptor_(strand_)
{}

McpServer::~McpServer() {
    asio::error_code ec;
    acceptor_.close(ec);
}

Result<void> McpServer::listen() {
    asio::error_code ec;
    const auto address = asio::ip::make_address(config_.bind_address, ec);
    if (ec) {
        return tl::unexpected(Error::configuration("invalid bind address '" + config_.bind_address + "': " + ec.message()));
    }
    const asio::ip::tcp::endpoint endpoint(address, config_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return tl::unexpected(Error::io(
            "cannot listen on " + config_.bind_address + ":" + std::to_string(config_.port) + ": " + ec.message()));
    }

    local_port_ = acceptor_.local_endpoint(ec).port();
    get_logger().logf(LogLevel::Info, "listening on {}:{}", config_.bind_address, local_port_);
    return {};
}

void McpServer::run(bool handle_signals) {
    asio::co_spawn(strand_, accept_loop(), asio::detached);

    std::optional<asio::signal_set> signals;
    if (handle_signals) {
        signals.emplace(io_, SIGINT, SIGTERM);
        signals->async_wait([this](const asio::error_code& ec, int signo) {
            if (!ec) {
                get_logger().logf(LogLevel::Info, "received signal {}, shutting down", signo);
                stop();
            }
        });
    }

    std::vector<std::thread> workers;
    for (std::size_t i = 1; i < config_.worker_threads; ++i) {
        workers.emplace_back([this] { io_.run(); });
    }
    io_.run();
    for (auto& worker : workers) {
        worker.join();
    }

    ARCHMCP_LOG_INFO("server stopped");
}

void McpServer::stop() {
    asio::post(strand_, [this] { shutdown_on_strand(); });
}

void McpServer::shutdown_on_strand() {
    if (stopping_.exchange(true)) {
        return;
    }

    asio::error_code ec;
    acceptor_.close(ec);

    std::size_t open = 0;
    {
        std::lock_guard lock(connections_mutex_);
        for (auto& [id, socket] : connections_) {
            asio::post(socket->get_executor(), [socket] {
                asio::error_code ignored;
                socket->shutdown(Socket::shutdown_receive, ignored);
            });
        }
        open = connections_.size();
    }
    get_logger().logf(LogLevel::Info, "stopped accepting connections ({} still open)", open);

    if (active_connections_.load(std::memory_order_seq_cst) == 0) {
        io_.stop();
    }
}

void McpServer::connection_closed(std::uint64_t connection_id) {
    {
        std::lock_guard lock(connections_mutex_);
        connections_.erase(connection_id);
    }
    get_logger().logf(LogLevel::Debug, "connection {} closed", connection_id);

    const auto remaining = active_connections_.fetch_sub(1, std::memory_order_seq_cst) - 1;
    if ((remaining == 0) && stopping_.load(std::memory_order_seq_cst)) {
        io_.stop();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Transport
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<void> McpServer::accept_loop() {
    for (;;) {
        asio::error_code ec;
        Socket socket = co_await acceptor_.async_accept(
            asio::make_strand(io_), asio::redirect_error(asio::use_awaitable, ec));

        if (stopping_.load(std::memory_order_acquire) || (ec == asio::error::operation_aborted)) {
            co_return;
        }
        if (ec) {
            get_logger().logf(LogLevel::Warn, "accept failed: {}", ec.message());
            asio::steady_timer backoff(strand_, std::chrono::milliseconds(100));
            co_await backoff.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            continue;
        }

        auto shared = std::make_shared<Socket>(std::move(socket));
        const std::uint64_t id = next_connection_id_++;
        {
            std::lock_guard lock(connections_mutex_);
            connections_.emplace(id, shared);
        }
        active_connections_.fetch_add(1, std::memory_order_acq_rel);

        const auto peer = shared->remote_endpoint(ec);
        get_logger().logf(LogLevel::Debug, "accepted connection {} from {}:{}",
                          id, peer.address().to_string(), peer.port());

        asio::co_spawn(shared->get_executor(), serve_connection(shared, id),
            [this, id](std::exception_ptr error) {
                if (error) {
                    try {
                        std::rethrow_exception(error);
                    } catch (const std::exception& e) {
                        get_logger().logf(LogLevel::Error, "connection {} failed: {}", id, e.what());
                    }
                }
                connection_closed(id);
            });
    }
}

asio::awaitable<void> McpServer::serve_connection(std::shared_ptr<Socket> socket, std::uint64_t connection_id) {
    std::string buffer;

    for (;;) {
        asio::error_code ec;
        const std::size_t n = co_await asio::async_read_until(
            *socket,
            asio::dynamic_buffer(buffer, config_.max_line_bytes),
            '\n',
            asio::redirect_error(asio::use_awaitable, ec));

        if (ec == asio::error::not_found) {
            // No newline within max_line_bytes: the stream cannot be resynchronized
            get_logger().logf(LogLevel::Warn, "connection {}: message exceeds {} bytes, closing",
                              connection_id, config_.max_line_bytes);
            std::string reply = serialize_response(JsonRpcResponse::failure(
                JsonRpcId::null(),
                JsonRpcError::invalid_request("message exceeds " + std::to_string(config_.max_line_bytes) + " bytes")));
            reply.push_back('\n');
            co_await asio::async_write(*socket, asio::buffer(reply), asio::redirect_error(asio::use_awaitable, ec));
            break;
        }
        if (ec == asio::error::eof) {
            // Peer half-closed: an unterminated last request still gets its answer
            if (buffer.find_first_not_of(" \t\r\n") != std::string::npos) {
                auto response = co_await dispatcher_->handle_message(buffer);
                buffer.clear();
                if (response.has_value()) {
                    response->push_back('\n');
                    co_await asio::async_write(*socket, asio::buffer(*response), asio::redirect_error(asio::use_awaitable, ec));
                }
            }
            break;
        }
        if (ec) {
            get_logger().logf(LogLevel::Debug, "connection {} read error: {}", connection_id, ec.message());
            break;
        }

        const std::string line = buffer.substr(0, n);
        buffer.erase(0, n);

        auto response = co_await dispatcher_->handle_message(line);
        if (response.has_value() == false) {
            continue;
        }

        response->push_back('\n');
        co_await asio::async_write(*socket, asio::buffer(*response), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            get_logger().logf(LogLevel::Debug, "connection {} write error: {}", connection_id, ec.message());
            break;
        }
    }

    asio::error_code ignored;
    socket->close(ignored);
}

}  // namespace archmcp
