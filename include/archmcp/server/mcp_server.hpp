#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// McpServer - newline-delimited JSON-RPC over TCP
// ═══════════════════════════════════════════════════════════════════════════
//
// One coroutine per accepted connection, each on its own strand. Requests on
// a connection are answered strictly in order: the next line is not read
// until the previous response has been written.
//
//   auto server = McpServer::Builder()
//       .with_config(config)
//       .with_default_providers()
//       .build();
//   if (!server) { /* Configuration or Io error */ }
//   (*server)->run();   // returns after SIGINT / SIGTERM or stop()
//
// Shutdown closes the listener and stops reading from open connections. A
// request already being handled still gets its response; in-flight tool
// calls are not cancelled. run() returns once the last connection is gone.
//
// ═══════════════════════════════════════════════════════════════════════════

#include "archmcp/config/server_config.hpp"
#include "archmcp/security/security_manager.hpp"
#include "archmcp/server/admission_controller.hpp"
#include "archmcp/server/capability_registry.hpp"
#include "archmcp/server/dispatcher.hpp"

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace archmcp {

inline constexpr const char* ARCHMCP_SERVER_NAME = "archmcp";
inline constexpr const char* ARCHMCP_VERSION = "0.1.0";

class McpServer {
public:
    /// Builds a provider on the server's executor
    using ProviderFactory = std::function<std::unique_ptr<IProvider>(asio::any_io_executor)>;

    class Builder {
    public:
        Builder& with_config(ServerConfig config);

        /// Register a ready-made provider
        Builder& with_provider(std::unique_ptr<IProvider> provider);

        /// Register a provider that needs the server's executor
        Builder& with_provider(ProviderFactory factory);

        /// Register the built-in providers listed in ServerConfig::providers
        Builder& with_default_providers();

        /// Use this security manager instead of opening the configured audit log
        Builder& with_security_manager(std::unique_ptr<SecurityManager> security);

        /// Validate the config, register every provider and bind the listener.
        /// Any failure aborts the build.
        [[nodiscard]] Result<std::unique_ptr<McpServer>> build();

    private:
        ServerConfig config_;
        std::vector<ProviderFactory> factories_;
        bool default_providers_{false};
        std::unique_ptr<SecurityManager> security_;
    };

    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Serve on worker_threads threads (the caller's included) until shutdown
    void run(bool handle_signals = true);

    /// Request shutdown; safe from any thread
    void stop();

    /// Bound port; differs from the configured one when that was 0
    [[nodiscard]] std::uint16_t local_port() const noexcept { return local_port_; }

    [[nodiscard]] std::size_t active_connections() const noexcept {
        return active_connections_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }
    [[nodiscard]] CapabilityRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] AdmissionController& admission() noexcept { return *admission_; }
    [[nodiscard]] SecurityManager& security() noexcept { return *security_; }
    [[nodiscard]] Dispatcher& dispatcher() noexcept { return *dispatcher_; }
    [[nodiscard]] asio::any_io_executor executor() noexcept { return io_.get_executor(); }

private:
    using Socket = asio::ip::tcp::socket;

    explicit McpServer(ServerConfig config);

    [[nodiscard]] Result<void> listen();

    asio::awaitable<void> accept_loop();
    asio::awaitable<void> serve_connection(std::shared_ptr<Socket> socket, std::uint64_t connection_id);

    void shutdown_on_strand();
    void connection_closed(std::uint64_t connection_id);

    ServerConfig config_;
    asio::io_context io_;
    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::tcp::acceptor acceptor_;
    std::uint16_t local_port_{0};

    CapabilityRegistry registry_;
    std::unique_ptr<SecurityManager> security_;
    std::unique_ptr<AdmissionController> admission_;
    std::unique_ptr<Dispatcher> dispatcher_;

    std::mutex connections_mutex_;
    std::unordered_map<std::uint64_t, std::shared_ptr<Socket>> connections_;
    std::uint64_t next_connection_id_{1};
    std::atomic<std::size_t> active_connections_{0};
    std::atomic<bool> stopping_{false};
};

}  // namespace archmcp
