#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/registry/tool_registry.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_fleet;

namespace {

ToolDefinition Def(const std::string& name, const std::string& command = "/bin/cat") {
    ToolDefinition def;
    def.name = name;
    def.command = command;
    return def;
}

} // anonymous namespace

TEST_CASE("ToolRegistry: register and look up", "[registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(Def("beta")).IsOk());
    REQUIRE(registry.Register(Def("alpha")).IsOk());

    CHECK(registry.Size() == 2);
    CHECK(registry.Contains("alpha"));
    CHECK_FALSE(registry.Contains("gamma"));
    CHECK(registry.Get("gamma") == nullptr);
    REQUIRE(registry.Get("beta") != nullptr);
    CHECK(registry.Get("beta")->command == "/bin/cat");

    auto list = registry.List();
    REQUIRE(list.size() == 2);
    CHECK(list[0]->name == "alpha");
    CHECK(list[1]->name == "beta");
}

TEST_CASE("ToolRegistry: rejects duplicates and invalid definitions", "[registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(Def("calc")).IsOk());

    auto dup = registry.Register(Def("calc"));
    REQUIRE(dup.IsErr());
    CHECK(dup.Error().kind == ErrorKind::Config);

    CHECK(registry.Register(Def("bad name")).IsErr());
    CHECK(registry.Register(Def("nocommand", "")).IsErr());
    CHECK(registry.Size() == 1);
}

TEST_CASE("ToolRegistry: replace keeps old snapshots alive", "[registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(Def("calc", "/bin/old")).IsOk());
    auto before = registry.Get("calc");

    REQUIRE(registry.Replace(Def("calc", "/bin/new")).IsOk());
    CHECK(before->command == "/bin/old");
    CHECK(registry.Get("calc")->command == "/bin/new");

    CHECK(registry.Replace(Def("missing")).IsErr());
}

TEST_CASE("ToolRegistry: upsert reports whether it replaced", "[registry]") {
    ToolRegistry registry;
    auto first = registry.Upsert(Def("calc"));
    REQUIRE(first.IsOk());
    CHECK_FALSE(first.Value());

    auto second = registry.Upsert(Def("calc", "/bin/other"));
    REQUIRE(second.IsOk());
    CHECK(second.Value());
    CHECK(registry.Get("calc")->command == "/bin/other");
}

TEST_CASE("ToolRegistry: unregister", "[registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(Def("calc")).IsOk());
    REQUIRE(registry.Unregister("calc").IsOk());
    CHECK_FALSE(registry.Contains("calc"));

    auto again = registry.Unregister("calc");
    REQUIRE(again.IsErr());
    CHECK(again.Error().kind == ErrorKind::Config);
}

TEST_CASE("ToolRegistry: concurrent readers and writers", "[registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(Def("shared")).IsOk());

    std::atomic<bool> stop{false};
    std::atomic<int> misses{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop) {
                if (!registry.Get("shared")) ++misses;
                (void)registry.List();
            }
        });
    }
    for (int i = 0; i < 200; ++i) {
        REQUIRE(registry.Replace(Def("shared", "/bin/v" + std::to_string(i))).IsOk());
        REQUIRE(registry.Register(Def("tmp" + std::to_string(i))).IsOk());
        REQUIRE(registry.Unregister("tmp" + std::to_string(i)).IsOk());
    }
    stop = true;
    for (auto& t : readers) t.join();

    CHECK(misses == 0);
    CHECK(registry.Get("shared")->command == "/bin/v199");
}

TEST_CASE("ToolDefinition: concurrency limit", "[registry]") {
    auto def = Def("calc");
    CHECK(def.ConcurrencyLimit(4) == 1);
    def.concurrency_safe = true;
    CHECK(def.ConcurrencyLimit(4) == 4);
    def.max_concurrency = 2;
    CHECK(def.ConcurrencyLimit(4) == 2);
}

TEST_CASE("ToolDefinition: ToJson", "[registry]") {
    auto def = Def("calc");
    def.args = {"--fast"};
    auto j = def.ToJson();
    CHECK(j["name"] == "calc");
    CHECK(j["connection_type"] == "stdio");
    CHECK(j["source"] == "config");
    CHECK_FALSE(j.contains("host"));

    def.connection_type = ConnectionType::Http;
    def.host = "localhost";
    def.port = 8000;
    CHECK(def.ToJson()["port"] == 8000);
}
