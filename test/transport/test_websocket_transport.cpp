#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/core/unique_fd.hpp>
#include <mcp_fleet/process/process_manager.hpp>
#include <mcp_fleet/transport/transport_bridge.hpp>
#include <mcp_fleet/transport/websocket_transport.hpp>

#include "../mocks/fixtures.hpp"
#include "../mocks/local_ws_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace mcp_fleet;
using namespace mcp_fleet::testing;
using nlohmann::json;

namespace {

RequestEnvelope Envelope(const std::string& method, json params = json::object(),
                         Millis timeout = Millis(5000)) {
    return RequestEnvelope::Make(method, std::move(params), timeout, RequestOrigin::Api);
}

json Response(const json& request, json result) {
    return {{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", std::move(result)}};
}

// Answers initialize and echo; "hang" is never answered.
void McpHandler(const json& message, const LocalWsServer::Reply& reply) {
    if (!message.contains("id")) return;
    const auto method = message.value("method", std::string());
    if (method == "initialize") {
        reply(Response(message, {{"protocolVersion", "2024-11-05"},
                                 {"capabilities", {{"tools", json::object()}}},
                                 {"serverInfo", {{"name", "ws-fixture"}}}}));
    } else if (method == "echo") {
        reply(Response(message, message["params"]));
    } else if (method == "fail") {
        reply({{"jsonrpc", "2.0"},
               {"id", message["id"]},
               {"error", {{"code", -32602}, {"message", "bad params"}}}});
    }
}

Result<std::unique_ptr<WebSocketTransport>, Error> Connect(
    uint16_t port, WebSocketTransport::CloseCallback on_close = nullptr,
    Millis timeout = Millis(3000)) {
    return WebSocketTransport::Connect("ws-tool", "127.0.0.1", port, "/mcp", timeout,
                                       std::move(on_close));
}

// A loopback socket that completes the TCP handshake but never speaks
// WebSocket: the kernel backlog accepts, nobody reads.
struct SilentListener {
    SilentListener() : fd(::socket(AF_INET, SOCK_STREAM, 0)) {
        REQUIRE(fd.Valid());
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(::bind(fd.Get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(::listen(fd.Get(), 4) == 0);
        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(fd.Get(), reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        port = ntohs(addr.sin_port);
    }

    UniqueFd fd;
    uint16_t port = 0;
};

// Port that was free a moment ago; nothing listens on it.
uint16_t ClosedPort() {
    SilentListener listener;
    return listener.port;
}

} // anonymous namespace

TEST_CASE("WebSocketTransport: connect and initialize", "[transport][websocket]") {
    LocalWsServer server(McpHandler);
    auto connected = Connect(server.Port());
    REQUIRE(connected.IsOk());
    auto transport = std::move(connected).Value();

    CHECK(transport->IsOpen());
    CHECK(transport->Uri() == "ws://127.0.0.1:" + std::to_string(server.Port()) + "/mcp");
    CHECK(WaitUntil([&] { return server.ConnectionCount() == 1; }));

    auto envelope = Envelope("initialize");
    auto init = transport->Send(envelope);
    REQUIRE(init.IsOk());
    CHECK(envelope.id == 1);
    CHECK(init.Value()["serverInfo"]["name"] == "ws-fixture");

    auto next = Envelope("echo", {{"n", 2}});
    auto echoed = transport->Send(next);
    REQUIRE(echoed.IsOk());
    CHECK(next.id == 2);
    CHECK(echoed.Value()["n"] == 2);

    SECTION("tool errors are unwrapped as ToolError") {
        auto failing = Envelope("fail");
        auto failed = transport->Send(failing);
        REQUIRE(failed.IsErr());
        CHECK(failed.Error().kind == ErrorKind::ToolError);
        CHECK(failed.Error().rpc_code == -32602);
        CHECK(transport->IsOpen());
    }

    SECTION("notifications are sent without waiting") {
        CHECK(transport->Notify("notifications/initialized", json::object()).IsOk());
    }

    SECTION("close fails later sends as crashes") {
        transport->Close();
        CHECK_FALSE(transport->IsOpen());
        auto late = Envelope("echo");
        auto refused = transport->Send(late);
        REQUIRE(refused.IsErr());
        CHECK(refused.Error().kind == ErrorKind::ProcessCrash);
    }
}

TEST_CASE("WebSocketTransport: interleaved responses reach their callers",
          "[transport][websocket]") {
    // Holds requests until two have arrived, then answers the later one
    // first.
    std::mutex mutex;
    std::vector<std::pair<json, LocalWsServer::Reply>> held;
    LocalWsServer server([&](const json& message, const LocalWsServer::Reply& reply) {
        if (message.value("method", std::string()) != "echo") {
            McpHandler(message, reply);
            return;
        }
        std::lock_guard<std::mutex> lock(mutex);
        held.emplace_back(message, reply);
        if (held.size() == 2) {
            for (auto it = held.rbegin(); it != held.rend(); ++it) {
                it->second(Response(it->first, it->first["params"]));
            }
            held.clear();
        }
    });

    auto connected = Connect(server.Port());
    REQUIRE(connected.IsOk());
    auto transport = std::move(connected).Value();

    std::optional<Result<json, Error>> first;
    std::optional<Result<json, Error>> second;
    std::thread a([&] {
        auto envelope = Envelope("echo", {{"caller", "a"}});
        first = transport->Send(envelope);
    });
    std::thread b([&] {
        auto envelope = Envelope("echo", {{"caller", "b"}});
        second = transport->Send(envelope);
    });
    a.join();
    b.join();

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->IsOk());
    REQUIRE(second->IsOk());
    CHECK(first->Value()["caller"] == "a");
    CHECK(second->Value()["caller"] == "b");
}

TEST_CASE("WebSocketTransport: connect failures", "[transport][websocket]") {
    SECTION("a peer that never completes the handshake times out") {
        SilentListener listener;
        const auto started = SteadyClock::now();
        auto connected = Connect(listener.port, nullptr, Millis(300));
        REQUIRE(connected.IsErr());
        CHECK(connected.Error().kind == ErrorKind::ProcessTimeout);
        CHECK(ToMillis(SteadyClock::now() - started) < Millis(3000));
    }

    SECTION("a refused connection is a crash") {
        auto connected = Connect(ClosedPort(), nullptr, Millis(3000));
        REQUIRE(connected.IsErr());
        CHECK(connected.Error().kind == ErrorKind::ProcessCrash);
    }
}

TEST_CASE("WebSocketTransport: a peer close fails pending calls", "[transport][websocket]") {
    std::atomic<bool> hung{false};
    LocalWsServer server([&](const json& message, const LocalWsServer::Reply& reply) {
        if (message.value("method", std::string()) == "hang") {
            hung = true;
            return;
        }
        McpHandler(message, reply);
    });

    std::atomic<int> closes{0};
    auto connected = Connect(server.Port(), [&] { ++closes; });
    REQUIRE(connected.IsOk());
    auto transport = std::move(connected).Value();

    std::optional<Result<json, Error>> pending;
    std::thread caller([&] {
        auto envelope = Envelope("hang", json::object(), Millis(5000));
        pending = transport->Send(envelope);
    });

    REQUIRE(WaitUntil([&] { return hung.load(); }));
    server.CloseAll();
    caller.join();

    REQUIRE(pending.has_value());
    REQUIRE(pending->IsErr());
    CHECK(pending->Error().kind == ErrorKind::ProcessCrash);
    CHECK(WaitUntil([&] { return closes.load() == 1; }));
    CHECK_FALSE(transport->IsOpen());
}

TEST_CASE("TransportBridge: WebSocket connections", "[transport][websocket][bridge]") {
    LocalWsServer server(McpHandler);
    auto connected = Connect(server.Port());
    REQUIRE(connected.IsOk());

    TransportBridge bridge(std::move(connected).Value());
    CHECK(bridge.Type() == ConnectionType::WebSocket);
    CHECK(bridge.IsOpen());

    auto envelope = Envelope("echo", {{"via", "bridge"}});
    auto echoed = bridge.Send(envelope);
    REQUIRE(echoed.IsOk());
    CHECK(echoed.Value()["via"] == "bridge");

    bridge.Close();
    CHECK_FALSE(bridge.IsOpen());
}

TEST_CASE("ProcessManager: WebSocket tools without a process", "[transport][websocket][process]") {
    LocalWsServer server(McpHandler);

    ToolDefinition def;
    def.name = "remote";
    def.connection_type = ConnectionType::WebSocket;
    def.host = "127.0.0.1";
    def.port = server.Port();
    def.startup_timeout = Millis(3000);
    def.auto_restart = false;

    ToolRegistry registry;
    REQUIRE(registry.Register(def).IsOk());
    ProcessManager manager(registry, FastProcessSettings());

    auto started = manager.Start("remote");
    REQUIRE(started.IsOk());
    auto instance = started.Value();
    CHECK(instance->State() == InstanceState::Running);
    CHECK(instance->ServerInfo()["name"] == "ws-fixture");
    CHECK(instance->Capabilities().contains("tools"));

    auto envelope = Envelope("echo", {{"x", 1}});
    auto echoed = instance->Send(envelope);
    REQUIRE(echoed.IsOk());
    CHECK(echoed.Value()["x"] == 1);

    SECTION("losing the connection takes the tool out of RUNNING") {
        server.CloseAll();
        CHECK(WaitUntil([&] { return manager.State("remote") != InstanceState::Running; }));
    }

    manager.Shutdown();
}
