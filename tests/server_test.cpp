// ─────────────────────────────────────────────────────────────────────────────
// McpServer Tests (real TCP on 127.0.0.1)
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "archmcp/server/mcp_server.hpp"
#include "support/fake_provider.hpp"
#include "support/temp_dir.hpp"

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <thread>

using namespace archmcp;
using archmcp::test::FakeProvider;
using archmcp::test::TempDir;
using archmcp::test::read_lines;

namespace {

ServerConfig test_config(const TempDir& dir) {
    ServerConfig config;
    config.with_bind("127.0.0.1", 0)
          .with_audit_log(dir / "audit.log")
          .with_max_concurrent_operations(4);
    return config;
}

/// Runs the server on a background thread for the lifetime of the object
class ServerThread {
public:
    explicit ServerThread(McpServer& server)
        : server_(server)
        , thread_([this] { server_.run(false); })
    {}

    ~ServerThread() { stop(); }

    void stop() {
        if (thread_.joinable()) {
            server_.stop();
            thread_.join();
        }
    }

private:
    McpServer& server_;
    std::thread thread_;
};

/// Blocking newline-delimited client
class LineClient {
public:
    explicit LineClient(std::uint16_t port) : socket_(io_) {
        socket_.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    }

    void send_raw(const std::string& bytes) {
        asio::write(socket_, asio::buffer(bytes));
    }

    void send(const std::string& line) { send_raw(line + "\n"); }

    /// Half-close: the server sees end of stream, replies can still arrive
    void finish_sending() {
        socket_.shutdown(asio::ip::tcp::socket::shutdown_send);
    }

    /// nullopt once the server has closed the connection
    std::optional<std::string> read_line() {
        asio::error_code ec;
        const std::size_t n = asio::read_until(socket_, asio::dynamic_buffer(buffer_), '\n', ec);
        if (ec) {
            return std::nullopt;
        }
        std::string line = buffer_.substr(0, n - 1);
        buffer_.erase(0, n);
        return line;
    }

    Json request(const std::string& line) {
        send(line);
        auto reply = read_line();
        REQUIRE(reply.has_value());
        return Json::parse(*reply);
    }

private:
    asio::io_context io_;
    asio::ip::tcp::socket socket_;
    std::string buffer_;
};

std::unique_ptr<McpServer> build_server(ServerConfig config) {
    auto server = McpServer::Builder()
        .with_config(std::move(config))
        .with_provider(std::make_unique<FakeProvider>(
            "fake", std::vector<std::string>{"ping", "pong"}, std::vector<std::string>{"fake://status"}))
        .build();
    REQUIRE(server.has_value());
    return std::move(*server);
}

}  // namespace

TEST_CASE("McpServer build rejects bad configuration", "[server]") {
    TempDir dir;

    SECTION("invalid limits") {
        auto config = test_config(dir);
        config.max_concurrent_operations = 0;
        auto server = McpServer::Builder().with_config(config).build();
        REQUIRE_FALSE(server.has_value());
        REQUIRE(server.error().code == ErrorCode::Configuration);
    }

    SECTION("unparseable bind address") {
        auto config = test_config(dir);
        config.bind_address = "not-an-address";
        auto server = McpServer::Builder().with_config(config).build();
        REQUIRE_FALSE(server.has_value());
        REQUIRE(server.error().code == ErrorCode::Configuration);
    }

    SECTION("colliding providers") {
        auto server = McpServer::Builder()
            .with_config(test_config(dir))
            .with_provider(std::make_unique<FakeProvider>("one", std::vector<std::string>{"same"}))
            .with_provider(std::make_unique<FakeProvider>("two", std::vector<std::string>{"same"}))
            .build();
        REQUIRE_FALSE(server.has_value());
        REQUIRE(server.error().code == ErrorCode::Configuration);
    }

    SECTION("port already in use") {
        auto first = build_server(test_config(dir));
        auto config = test_config(dir);
        config.port = first->local_port();
        auto second = McpServer::Builder().with_config(config).build();
        REQUIRE_FALSE(second.has_value());
        REQUIRE(second.error().code == ErrorCode::Io);
    }
}

TEST_CASE("McpServer binds an ephemeral port", "[server]") {
    TempDir dir;
    auto server = build_server(test_config(dir));

    REQUIRE(server->local_port() != 0);
    REQUIRE(server->registry().has_tool("ping"));
    REQUIRE(server->admission().capacity() == 4);
    REQUIRE(std::filesystem::exists(dir / "audit.log"));
}

TEST_CASE("McpServer registers the configured built-in providers", "[server]") {
    TempDir dir;
    auto config = test_config(dir);
    config.with_providers({"system"});

    auto server = McpServer::Builder()
        .with_config(config)
        .with_default_providers()
        .with_provider(std::make_unique<FakeProvider>("fake", std::vector<std::string>{"ping"}))
        .build();
    REQUIRE(server.has_value());

    const auto tools = (*server)->registry().list_tools();
    REQUIRE(tools.size() == 2);
    REQUIRE(tools[0].name == "system_exec");
    REQUIRE(tools[1].name == "ping");
    REQUIRE_FALSE((*server)->registry().has_tool("hyprland_workspaces"));
}

TEST_CASE("McpServer serves a full session over TCP", "[server]") {
    TempDir dir;
    auto server = build_server(test_config(dir));
    ServerThread running(*server);
    LineClient client(server->local_port());

    const Json init = client.request(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","clientInfo":{"name":"t","version":"1"}}})");
    REQUIRE(init["id"] == 1);
    REQUIRE(init["result"]["serverInfo"]["name"] == "archmcp");
    REQUIRE(init["result"]["serverInfo"]["version"] == ARCHMCP_VERSION);

    // Notifications produce no line; the next reply belongs to id 2
    client.send(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

    const Json tools = client.request(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    REQUIRE(tools["id"] == 2);
    REQUIRE(tools["result"].size() == 2);

    const Json call = client.request(
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"ping","arguments":{"n":1}}})");
    REQUIRE(call["id"] == 3);
    REQUIRE(call["result"]["content"][0]["text"] == "fake:ping");

    const Json read = client.request(
        R"({"jsonrpc":"2.0","id":4,"method":"resources/read","params":{"uri":"fake://status"}})");
    REQUIRE(read["result"]["content"] == "contents of fake://status");

    running.stop();

    const auto audit = read_lines(dir / "audit.log");
    REQUIRE(audit.size() == 1);
    REQUIRE(Json::parse(audit[0])["name"] == "ping");
}

TEST_CASE("McpServer keeps a connection usable after a malformed line", "[server]") {
    TempDir dir;
    auto server = build_server(test_config(dir));
    ServerThread running(*server);
    LineClient client(server->local_port());

    const Json parse_error = client.request("{this is not json");
    REQUIRE(parse_error["id"].is_null());
    REQUIRE(parse_error["error"]["code"] == -32700);

    const Json missing = client.request(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"nope"}})");
    REQUIRE(missing["id"] == 7);
    REQUIRE(missing["error"]["code"] == -32603);

    const Json ok = client.request(R"({"jsonrpc":"2.0","id":8,"method":"tools/list"})");
    REQUIRE(ok["id"] == 8);
    REQUIRE(ok.contains("result"));
}

TEST_CASE("McpServer answers pipelined requests in order", "[server]") {
    TempDir dir;
    auto server = build_server(test_config(dir));
    ServerThread running(*server);
    LineClient client(server->local_port());

    client.send_raw(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\n"
        "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"pong"}})" "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"bogus"})" "\n");

    for (int expected = 1; expected <= 3; ++expected) {
        auto line = client.read_line();
        REQUIRE(line.has_value());
        REQUIRE(Json::parse(*line)["id"] == expected);
    }
}

TEST_CASE("McpServer answers an unterminated last request after the peer half-closes", "[server]") {
    TempDir dir;
    auto server = build_server(test_config(dir));
    ServerThread running(*server);

    SECTION("single request without a newline") {
        LineClient client(server->local_port());
        client.send_raw(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
        client.finish_sending();

        auto reply = client.read_line();
        REQUIRE(reply.has_value());
        const Json response = Json::parse(*reply);
        REQUIRE(response["id"] == 1);
        REQUIRE(response["result"].size() == 2);

        REQUIRE_FALSE(client.read_line().has_value());
    }

    SECTION("terminated requests followed by an unterminated one") {
        LineClient client(server->local_port());
        client.send_raw(
            R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\n"
            R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"ping"}})");
        client.finish_sending();

        for (int expected = 1; expected <= 2; ++expected) {
            auto line = client.read_line();
            REQUIRE(line.has_value());
            REQUIRE(Json::parse(*line)["id"] == expected);
        }
        REQUIRE_FALSE(client.read_line().has_value());
    }

    SECTION("trailing whitespace is not a request") {
        LineClient client(server->local_port());
        client.send_raw(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\n  \r");
        client.finish_sending();

        REQUIRE(client.read_line().has_value());
        REQUIRE_FALSE(client.read_line().has_value());
    }
}

TEST_CASE("McpServer closes connections that send oversized lines", "[server]") {
    TempDir dir;
    auto config = test_config(dir);
    config.max_line_bytes = 128;
    auto server = build_server(config);
    ServerThread running(*server);
    LineClient client(server->local_port());

    // Exactly the limit without a newline: the server consumes every byte
    client.send_raw(std::string(128, 'x'));

    auto reply = client.read_line();
    REQUIRE(reply.has_value());
    const Json error = Json::parse(*reply);
    REQUIRE(error["error"]["code"] == -32600);
    REQUIRE(error["id"].is_null());

    REQUIRE_FALSE(client.read_line().has_value());

    // Other clients are unaffected
    LineClient other(server->local_port());
    REQUIRE(other.request(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})")["id"] == 1);
}

TEST_CASE("McpServer serves several connections at once", "[server]") {
    TempDir dir;
    auto server = build_server(test_config(dir));
    ServerThread running(*server);

    LineClient first(server->local_port());
    LineClient second(server->local_port());

    REQUIRE(second.request(R"({"jsonrpc":"2.0","id":"b","method":"tools/list"})")["id"] == "b");
    REQUIRE(first.request(R"({"jsonrpc":"2.0","id":"a","method":"tools/list"})")["id"] == "a");
}

TEST_CASE("McpServer stop ends idle connections and returns from run", "[server]") {
    TempDir dir;
    auto server = build_server(test_config(dir));
    ServerThread running(*server);
    LineClient client(server->local_port());

    REQUIRE(client.request(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})")["id"] == 1);

    running.stop();

    REQUIRE(server->active_connections() == 0);
    REQUIRE_FALSE(client.read_line().has_value());
}

TEST_CASE("McpServer stop returns from run with several worker threads", "[server]") {
    TempDir dir;
    auto config = test_config(dir);
    config.worker_threads = 4;

    for (int round = 0; round < 5; ++round) {
        auto server = build_server(config);
        ServerThread running(*server);
        {
            LineClient client(server->local_port());
            REQUIRE(client.request(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})")["id"] == 1);
        }
        LineClient idle(server->local_port());
        REQUIRE(idle.request(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})")["id"] == 2);

        running.stop();
        REQUIRE(server->active_connections() == 0);
    }
}
