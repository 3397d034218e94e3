#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/mcp/mcp_server.hpp>

#include <sstream>

using namespace mcp_fleet;

namespace {

HandlerRegistry MakeTestHandlers() {
    HandlerRegistry handlers;
    handlers.Register("echo", "Echo the input",
        {{"type", "object"},
         {"properties", {{"message", {{"type", "string"}}}}},
         {"required", nlohmann::json::array({"message"})}},
        [](const nlohmann::json& args) -> HandlerResult {
            return {false, nlohmann::json::array({
                {{"type", "text"}, {"text", args.value("message", "")}}
            })};
        });
    handlers.Register("fail", "Always fails", nlohmann::json::object(),
        [](const nlohmann::json&) -> HandlerResult {
            return {true, nlohmann::json::array({{{"type", "text"}, {"text", "nope"}}})};
        });
    return handlers;
}

nlohmann::json Request(int id, const std::string& method,
                       nlohmann::json params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

} // anonymous namespace

// ===========================================================================
// HandleMessage
// ===========================================================================

TEST_CASE("McpServer: initialize returns capabilities", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestHandlers(), in, out);
    CHECK_FALSE(server.Initialized());

    auto response = server.HandleMessage(Request(1, "initialize",
        {{"protocolVersion", "2024-11-05"}, {"clientInfo", {{"name", "inspector"}}}}));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["serverInfo"]["name"] == "mcp-fleet");
    CHECK(r["result"]["capabilities"].contains("tools"));
    CHECK(server.Initialized());
}

TEST_CASE("McpServer: ping answers with an empty object", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestHandlers(), in, out);

    auto response = server.HandleMessage(Request(9, "ping"));
    REQUIRE(response.has_value());
    CHECK((*response)["result"] == nlohmann::json::object());
}

TEST_CASE("McpServer: tools/list returns registered handlers", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestHandlers(), in, out);

    auto response = server.HandleMessage(Request(2, "tools/list"));
    REQUIRE(response.has_value());

    auto& tools = (*response)["result"]["tools"];
    REQUIRE(tools.size() == 2);
    CHECK(tools[0]["name"] == "echo");
    CHECK(tools[0]["description"] == "Echo the input");
    CHECK(tools[0]["inputSchema"]["type"] == "object");
}

TEST_CASE("McpServer: tools/call executes the handler", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestHandlers(), in, out);

    auto response = server.HandleMessage(Request(3, "tools/call",
        {{"name", "echo"}, {"arguments", {{"message", "hello world"}}}}));
    REQUIRE(response.has_value());

    auto& result = (*response)["result"];
    REQUIRE(result["content"].size() == 1);
    CHECK(result["content"][0]["type"] == "text");
    CHECK(result["content"][0]["text"] == "hello world");
    CHECK_FALSE(result.contains("isError"));
}

TEST_CASE("McpServer: handler failures set isError", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestHandlers(), in, out);

    auto response = server.HandleMessage(Request(4, "tools/call", {{"name", "fail"}}));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["isError"] == true);
}

TEST_CASE("McpServer: malformed requests", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestHandlers(), in, out);

    SECTION("unknown tool") {
        auto response = server.HandleMessage(Request(5, "tools/call", {{"name", "nonexistent"}}));
        REQUIRE(response.has_value());
        CHECK((*response)["error"]["code"] == -32602);
    }

    SECTION("missing tool name") {
        auto response = server.HandleMessage(Request(6, "tools/call"));
        REQUIRE(response.has_value());
        CHECK((*response)["error"]["code"] == -32602);
    }

    SECTION("unknown method") {
        auto response = server.HandleMessage(Request(7, "resources/list"));
        REQUIRE(response.has_value());
        CHECK((*response)["error"]["code"] == -32601);
    }

    SECTION("wrong jsonrpc version") {
        auto response = server.HandleMessage({{"jsonrpc", "1.0"}, {"id", 8}, {"method", "ping"}});
        REQUIRE(response.has_value());
        CHECK((*response)["error"]["code"] == -32600);
    }

    SECTION("missing method") {
        auto response = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 10}});
        REQUIRE(response.has_value());
        CHECK((*response)["error"]["code"] == -32600);
    }
}

TEST_CASE("McpServer: notifications get no response", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestHandlers(), in, out);

    auto response = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    CHECK_FALSE(response.has_value());
}

// ===========================================================================
// Run (stdio loop)
// ===========================================================================

TEST_CASE("McpServer: Run answers each line in order", "[mcp][server]") {
    std::string input;
    input += Request(1, "initialize", {{"protocolVersion", "2024-11-05"}}).dump() + "\n";
    input += nlohmann::json({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).dump() + "\n";
    input += "\r\n";
    input += Request(2, "tools/list").dump() + "\r\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestHandlers(), in, out);
    server.Run();

    std::istringstream output(out.str());
    std::string line;

    REQUIRE(std::getline(output, line));
    auto first = nlohmann::json::parse(line);
    CHECK(first["id"] == 1);
    CHECK(first["result"]["protocolVersion"] == "2024-11-05");

    REQUIRE(std::getline(output, line));
    auto second = nlohmann::json::parse(line);
    CHECK(second["id"] == 2);
    CHECK(second["result"]["tools"].size() == 2);

    CHECK_FALSE(std::getline(output, line));
}

TEST_CASE("McpServer: Run reports parse errors and keeps going", "[mcp][server]") {
    std::istringstream in("not json\n" + Request(1, "ping").dump() + "\n");
    std::ostringstream out;
    McpServer server(MakeTestHandlers(), in, out);
    server.Run();

    std::istringstream output(out.str());
    std::string line;
    REQUIRE(std::getline(output, line));
    auto error = nlohmann::json::parse(line);
    CHECK(error["error"]["code"] == -32700);
    CHECK(error["id"].is_null());

    REQUIRE(std::getline(output, line));
    CHECK(nlohmann::json::parse(line)["id"] == 1);
}

TEST_CASE("McpServer: Run answers batches with one array", "[mcp][server]") {
    auto batch = nlohmann::json::array({
        Request(1, "ping"),
        {{"jsonrpc", "2.0"}, {"method", "notifications/progress"}},
        Request(2, "tools/list"),
    });
    std::istringstream in(batch.dump() + "\n");
    std::ostringstream out;
    McpServer server(MakeTestHandlers(), in, out);
    server.Run();

    auto responses = nlohmann::json::parse(out.str());
    REQUIRE(responses.is_array());
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[1]["id"] == 2);
}

TEST_CASE("McpServer: Run survives members of the wrong type", "[mcp][server]") {
    std::string input;
    input += nlohmann::json({{"jsonrpc", "2.0"}, {"method", 5}}).dump() + "\n";
    input += Request(1, "initialize", {{"clientInfo", {{"name", 42}}}}).dump() + "\n";
    input += Request(2, "ping").dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestHandlers(), in, out);
    REQUIRE_NOTHROW(server.Run());

    std::istringstream output(out.str());
    std::string line;

    REQUIRE(std::getline(output, line));
    auto rejected = nlohmann::json::parse(line);
    CHECK(rejected["id"] == 1);
    CHECK(rejected["error"]["code"] == -32600);

    REQUIRE(std::getline(output, line));
    auto pong = nlohmann::json::parse(line);
    CHECK(pong["id"] == 2);
    CHECK(pong["result"].is_object());

    CHECK_FALSE(std::getline(output, line));
}
