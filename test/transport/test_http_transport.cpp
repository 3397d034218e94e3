#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/transport/http_transport.hpp>
#include <mcp_fleet/transport/transport_bridge.hpp>

#include "../mocks/local_server.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace mcp_fleet;
using namespace mcp_fleet::testing;
using nlohmann::json;

namespace {

RequestEnvelope Envelope(const std::string& method, json params = json::object(),
                         Millis timeout = Millis(5000)) {
    return RequestEnvelope::Make(method, std::move(params), timeout, RequestOrigin::Api);
}

// JSON-RPC echo on /rpc.
void MountRpcEcho(httplib::Server& svr) {
    svr.Post("/rpc", [](const httplib::Request& req, httplib::Response& res) {
        auto request = json::parse(req.body);
        json reply = {{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", request["params"]}};
        res.set_content(reply.dump(), "application/json");
    });
}

} // anonymous namespace

TEST_CASE("HttpTransport: JSON-RPC responses are unwrapped", "[transport][http]") {
    httplib::Server svr;
    MountRpcEcho(svr);
    LocalServer server(svr);

    HttpTransport transport("remote", "127.0.0.1", static_cast<uint16_t>(server.Port()), "/rpc");
    auto envelope = Envelope("echo", {{"q", "weather"}});
    auto result = transport.Send(envelope);
    REQUIRE(result.IsOk());
    CHECK(result.Value()["q"] == "weather");
    CHECK(envelope.id == 1);
    CHECK(transport.BaseUrl() == "http://127.0.0.1:" + std::to_string(server.Port()));
}

TEST_CASE("HttpTransport: non JSON-RPC bodies pass through", "[transport][http]") {
    httplib::Server svr;
    svr.Post("/plain-json", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"temperature":21})", "application/json");
    });
    svr.Post("/text", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("sunny", "text/plain");
    });
    LocalServer server(svr);
    const auto port = static_cast<uint16_t>(server.Port());

    HttpTransport json_tool("remote", "127.0.0.1", port, "/plain-json");
    auto envelope = Envelope("forecast");
    auto parsed = json_tool.Send(envelope);
    REQUIRE(parsed.IsOk());
    CHECK(parsed.Value()["temperature"] == 21);

    HttpTransport text_tool("remote", "127.0.0.1", port, "/text");
    auto text_envelope = Envelope("forecast");
    auto text = text_tool.Send(text_envelope);
    REQUIRE(text.IsOk());
    CHECK(text.Value() == "sunny");
}

TEST_CASE("HttpTransport: JSON-RPC errors and mismatched ids", "[transport][http]") {
    httplib::Server svr;
    svr.Post("/error", [](const httplib::Request& req, httplib::Response& res) {
        auto request = json::parse(req.body);
        json reply = {{"jsonrpc", "2.0"},
                      {"id", request["id"]},
                      {"error", {{"code", -32001}, {"message", "quota exceeded"}}}};
        res.set_content(reply.dump(), "application/json");
    });
    svr.Post("/wrong-id", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"jsonrpc":"2.0","id":4242,"result":1})", "application/json");
    });
    LocalServer server(svr);
    const auto port = static_cast<uint16_t>(server.Port());

    HttpTransport failing("remote", "127.0.0.1", port, "/error");
    auto envelope = Envelope("search");
    auto failed = failing.Send(envelope);
    REQUIRE(failed.IsErr());
    CHECK(failed.Error().kind == ErrorKind::ToolError);
    CHECK(failed.Error().rpc_code == -32001);

    HttpTransport mismatched("remote", "127.0.0.1", port, "/wrong-id");
    auto other = Envelope("search");
    auto rejected = mismatched.Send(other);
    REQUIRE(rejected.IsErr());
    CHECK(rejected.Error().kind == ErrorKind::Protocol);
}

TEST_CASE("HttpTransport: HTTP status codes map to error kinds", "[transport][http]") {
    httplib::Server svr;
    svr.Post("/busy", [](const httplib::Request&, httplib::Response& res) {
        res.status = 503;
        res.set_content(R"({"detail":"warming up"})", "application/json");
    });
    LocalServer server(svr);
    const auto port = static_cast<uint16_t>(server.Port());

    HttpTransport busy("remote", "127.0.0.1", port, "/busy");
    auto envelope = Envelope("search");
    auto result = busy.Send(envelope);
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::ToolUnavailable);
    CHECK(result.Error().message.find("warming up") != std::string::npos);

    HttpTransport missing("remote", "127.0.0.1", port, "/nowhere");
    auto other = Envelope("search");
    auto not_found = missing.Send(other);
    REQUIRE(not_found.IsErr());
    CHECK(not_found.Error().kind == ErrorKind::ToolError);
}

TEST_CASE("HttpTransport: slow endpoints hit the deadline", "[transport][http]") {
    httplib::Server svr;
    svr.Post("/slow", [](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        res.set_content("late", "text/plain");
    });
    LocalServer server(svr);

    HttpTransport slow("remote", "127.0.0.1", static_cast<uint16_t>(server.Port()), "/slow");
    auto envelope = Envelope("search", json::object(), Millis(100));
    auto result = slow.Send(envelope);
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::RequestTimeout);
}

TEST_CASE("HttpTransport: refused connections look like a crash", "[transport][http]") {
    int port = 0;
    {
        httplib::Server svr;
        LocalServer server(svr);
        port = server.Port();
    }
    HttpTransport gone("remote", "127.0.0.1", static_cast<uint16_t>(port), "/rpc");
    auto envelope = Envelope("search", json::object(), Millis(2000));
    auto result = gone.Send(envelope);
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::ProcessCrash);
    CHECK(gone.CheckHealth(Millis(500)).IsErr());
}

TEST_CASE("HttpTransport: health endpoint", "[transport][http]") {
    httplib::Server svr;
    std::atomic<bool> healthy{true};
    svr.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
        res.status = healthy ? 200 : 503;
        res.set_content(healthy ? "ok" : "down", "text/plain");
    });
    LocalServer server(svr);

    HttpTransport transport("remote", "127.0.0.1", static_cast<uint16_t>(server.Port()), "/rpc");
    CHECK(transport.CheckHealth(Millis(1000)).IsOk());
    healthy = false;
    auto down = transport.CheckHealth(Millis(1000));
    REQUIRE(down.IsErr());
    CHECK(down.Error().kind == ErrorKind::ToolUnavailable);
}

TEST_CASE("HttpTransport: closed transport rejects calls", "[transport][http]") {
    HttpTransport transport("remote", "127.0.0.1", 1, "/rpc");
    CHECK(transport.IsOpen());
    transport.Close();
    CHECK_FALSE(transport.IsOpen());
    auto envelope = Envelope("search");
    CHECK(transport.Send(envelope).Error().kind == ErrorKind::ProcessCrash);
}

TEST_CASE("TransportBridge: reports the HTTP connection type", "[transport][bridge]") {
    httplib::Server svr;
    MountRpcEcho(svr);
    LocalServer server(svr);

    TransportBridge bridge(std::make_unique<HttpTransport>(
        "remote", "127.0.0.1", static_cast<uint16_t>(server.Port()), "/rpc"));
    CHECK(bridge.Type() == ConnectionType::Http);
    auto envelope = Envelope("echo", {{"n", 1}});
    auto result = bridge.Send(envelope);
    REQUIRE(result.IsOk());
    CHECK(result.Value()["n"] == 1);
}
