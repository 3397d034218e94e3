#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/transport/jsonrpc.hpp>

using namespace mcp_fleet;
using nlohmann::json;

TEST_CASE("jsonrpc: request and notification shapes", "[transport][jsonrpc]") {
    auto request = jsonrpc::MakeRequest(7, "tools/call", nullptr);
    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 7);
    CHECK(request["method"] == "tools/call");
    CHECK(request["params"] == json::object());

    auto note = jsonrpc::MakeNotification("notifications/initialized", nullptr);
    CHECK_FALSE(note.contains("id"));
    CHECK_FALSE(note.contains("params"));

    auto with_params = jsonrpc::MakeNotification("progress", {{"pct", 50}});
    CHECK(with_params["params"]["pct"] == 50);
}

TEST_CASE("jsonrpc: classify inbound messages", "[transport][jsonrpc]") {
    CHECK(jsonrpc::Classify(jsonrpc::MakeResult(1, "ok")) == jsonrpc::MessageKind::Response);
    CHECK(jsonrpc::Classify(jsonrpc::MakeError(1, -1, "x")) == jsonrpc::MessageKind::Response);
    CHECK(jsonrpc::Classify(jsonrpc::MakeRequest(1, "ping", nullptr)) ==
          jsonrpc::MessageKind::Request);
    CHECK(jsonrpc::Classify({{"jsonrpc", "2.0"}, {"method", "log"}}) ==
          jsonrpc::MessageKind::Notification);
    CHECK(jsonrpc::Classify({{"jsonrpc", "2.0"}, {"id", nullptr}, {"method", "log"}}) ==
          jsonrpc::MessageKind::Notification);

    CHECK(jsonrpc::Classify(json::array()) == jsonrpc::MessageKind::Invalid);
    CHECK(jsonrpc::Classify({{"id", 1}}) == jsonrpc::MessageKind::Invalid);
    CHECK(jsonrpc::Classify("text") == jsonrpc::MessageKind::Invalid);
}

TEST_CASE("jsonrpc: ParseLine rejects non-JSON output", "[transport][jsonrpc]") {
    auto ok = jsonrpc::ParseLine(R"({"id":1,"result":true})", "calc");
    REQUIRE(ok.IsOk());
    CHECK(ok.Value()["result"] == true);

    auto bad = jsonrpc::ParseLine("Loading model weights...", "calc");
    REQUIRE(bad.IsErr());
    CHECK(bad.Error().kind == ErrorKind::Protocol);
    CHECK(bad.Error().tool == "calc");
    CHECK(bad.Error().message.find("Loading model weights") != std::string::npos);
}

TEST_CASE("jsonrpc: ResponseId accepts integers and numeric strings", "[transport][jsonrpc]") {
    int64_t id = 0;
    CHECK(jsonrpc::ResponseId({{"id", 42}}, id));
    CHECK(id == 42);
    CHECK(jsonrpc::ResponseId({{"id", "17"}}, id));
    CHECK(id == 17);

    CHECK_FALSE(jsonrpc::ResponseId({{"id", "17a"}}, id));
    CHECK_FALSE(jsonrpc::ResponseId({{"id", ""}}, id));
    CHECK_FALSE(jsonrpc::ResponseId({{"id", 1.5}}, id));
    CHECK_FALSE(jsonrpc::ResponseId({{"result", 1}}, id));
}

TEST_CASE("jsonrpc: UnwrapResponse", "[transport][jsonrpc]") {
    auto ok = jsonrpc::UnwrapResponse(jsonrpc::MakeResult(1, {{"sum", 3}}), "add", "calc");
    REQUIRE(ok.IsOk());
    CHECK(ok.Value()["sum"] == 3);

    auto null_result = jsonrpc::UnwrapResponse(jsonrpc::MakeResult(1, nullptr), "add", "calc");
    REQUIRE(null_result.IsOk());
    CHECK(null_result.Value().is_null());

    auto failed = jsonrpc::UnwrapResponse(jsonrpc::MakeError(1, -32000, "overflow"), "add", "calc");
    REQUIRE(failed.IsErr());
    CHECK(failed.Error().kind == ErrorKind::ToolError);
    CHECK(failed.Error().rpc_code == -32000);
    CHECK(failed.Error().operation == "add");

    auto empty = jsonrpc::UnwrapResponse({{"jsonrpc", "2.0"}, {"id", 1}}, "add", "calc");
    REQUIRE(empty.IsErr());
    CHECK(empty.Error().kind == ErrorKind::Protocol);
}

TEST_CASE("jsonrpc: initialize parameters", "[transport][jsonrpc]") {
    auto params = jsonrpc::InitializeParams();
    CHECK(params["protocolVersion"] == jsonrpc::kProtocolVersion);
    CHECK(params["clientInfo"]["name"] == "mcp-fleet");
    CHECK(params["capabilities"].is_object());
}
