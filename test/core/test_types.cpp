#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/core/types.hpp>

#include <chrono>
#include <set>
#include <string>

using namespace mcp_fleet;

// ===========================================================================
// ToolName
// ===========================================================================

TEST_CASE("ToolName: accepts identifiers", "[types][ToolName]") {
    for (const char* name : {"calc", "file-reader", "web_search.v2", "A1"}) {
        auto r = ToolName::Create(name);
        REQUIRE(r.IsOk());
        CHECK(r.Value().Value() == name);
    }
    CHECK(ToolName::Create(std::string(64, 'a')).IsOk());
}

TEST_CASE("ToolName: rejects malformed names", "[types][ToolName]") {
    CHECK(ToolName::Create("").IsErr());
    CHECK(ToolName::Create(std::string(65, 'a')).IsErr());
    CHECK(ToolName::Create("has space").IsErr());
    CHECK(ToolName::Create("slash/name").IsErr());
    CHECK(ToolName::Create(".hidden").IsErr());
    CHECK(ToolName::Create("-flag").IsErr());
}

// ===========================================================================
// ConnectionType
// ===========================================================================

TEST_CASE("ParseConnectionType: names and aliases", "[types]") {
    CHECK(ParseConnectionType("stdio").Value() == ConnectionType::Stdio);
    CHECK(ParseConnectionType("HTTP").Value() == ConnectionType::Http);
    CHECK(ParseConnectionType("server").Value() == ConnectionType::Http);
    CHECK(ParseConnectionType("ws").Value() == ConnectionType::WebSocket);
    CHECK(ParseConnectionType("websocket").Value() == ConnectionType::WebSocket);
    CHECK(ParseConnectionType("grpc").IsErr());
    CHECK(std::string(ConnectionTypeName(ConnectionType::WebSocket)) == "websocket");
}

// ===========================================================================
// Helpers
// ===========================================================================

TEST_CASE("SplitCommandLine: quoting rules", "[types]") {
    auto plain = SplitCommandLine("python3  server.py --port 8080");
    REQUIRE(plain.IsOk());
    CHECK(plain.Value() == std::vector<std::string>{"python3", "server.py", "--port", "8080"});

    auto quoted = SplitCommandLine(R"(node "my server.js" 'it''s' a\ b)");
    REQUIRE(quoted.IsOk());
    CHECK(quoted.Value() == std::vector<std::string>{"node", "my server.js", "its", "a b"});

    auto empty_arg = SplitCommandLine(R"(tool "")");
    REQUIRE(empty_arg.IsOk());
    CHECK(empty_arg.Value() == std::vector<std::string>{"tool", ""});

    CHECK(SplitCommandLine("bad 'quote").IsErr());
    CHECK(SplitCommandLine("   ").Value().empty());
}

TEST_CASE("NewId: prefixed and unique", "[types]") {
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        auto id = NewId("sess_");
        CHECK(id.size() == 5 + 16);
        CHECK(id.rfind("sess_", 0) == 0);
        ids.insert(id);
    }
    CHECK(ids.size() == 200);
}

TEST_CASE("FormatIso8601: UTC with milliseconds", "[types]") {
    const auto at = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(1714564800250LL));
    CHECK(FormatIso8601(at) == "2024-05-01T12:00:00.250Z");
}

TEST_CASE("ToLower: ASCII only", "[types]") {
    CHECK(ToLower("WebSocket") == "websocket");
}
