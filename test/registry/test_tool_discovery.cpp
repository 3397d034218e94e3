#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/core/types.hpp>
#include <mcp_fleet/registry/tool_discovery.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

using namespace mcp_fleet;
namespace fs = std::filesystem;

namespace {

// Temporary directory removed at scope exit.
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / NewId("mcp_fleet_discovery_");
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    [[nodiscard]] const fs::path& Path() const { return path_; }

    fs::path Write(const std::string& relative, const std::string& content) const {
        auto file = path_ / relative;
        fs::create_directories(file.parent_path());
        std::ofstream out(file);
        out << content;
        return file;
    }

private:
    fs::path path_;
};

bool Has(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // anonymous namespace

TEST_CASE("LooksLikeMcpTool: heuristics", "[registry][discovery]") {
    TempDir dir;
    CHECK(LooksLikeMcpTool(dir.Write("weather_server.py", "print('hi')\n")));
    CHECK(LooksLikeMcpTool(dir.Write("plain.py", "# speaks tools/list over stdio\n")));
    CHECK_FALSE(LooksLikeMcpTool(dir.Write("notes.py", "print('unrelated')\n")));
    CHECK_FALSE(LooksLikeMcpTool(dir.Write("mcp_readme.md", "# mcp\n")));

    auto script = dir.Write("runner", "#!/bin/sh\n");
    fs::permissions(script, fs::perms::owner_exec, fs::perm_options::add);
    CHECK(LooksLikeMcpTool(script));
}

TEST_CASE("HashFile: SHA-256 hex digest", "[registry][discovery]") {
    TempDir dir;
    auto file = dir.Write("abc.txt", "abc");
    auto hash = HashFile(file);
    REQUIRE(hash.IsOk());
    CHECK(hash.Value() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    CHECK(HashFile(dir.Path() / "missing").IsErr());
}

TEST_CASE("ExtractDescription: leading comments", "[registry][discovery]") {
    CHECK(ExtractDescription("#!/usr/bin/env python3\n# Weather lookups for agents\n") ==
          "Weather lookups for agents");
    CHECK(ExtractDescription("// Search the local file index\nconst x = 1;\n") ==
          "Search the local file index");
    CHECK(ExtractDescription("\"\"\"Translate text between languages.\"\"\"\n") ==
          "Translate text between languages.");
    CHECK(ExtractDescription("# short\nimport os\n").empty());
    CHECK(ExtractDescription("# " + std::string(300, 'x') + "\n").size() == 200);
}

TEST_CASE("DefinitionFromFile: launcher by extension", "[registry][discovery]") {
    TempDir dir;
    auto py = DefinitionFromFile(dir.Write("calc server.py", "# Calculator over MCP stdio\n"));
    REQUIRE(py.IsOk());
    CHECK(py.Value().name == "calc_server");
    CHECK(py.Value().command == "python3");
    CHECK(py.Value().source == ToolSource::Discovered);
    CHECK(py.Value().description == "Calculator over MCP stdio");
    CHECK(py.Value().content_hash.size() == 64);

    auto jar = DefinitionFromFile(dir.Write("mcp-tool.jar", "PK"));
    REQUIRE(jar.IsOk());
    CHECK(jar.Value().command == "java");
    CHECK(jar.Value().args.front() == "-jar");
    CHECK(jar.Value().description == "Discovered MCP tool: mcp-tool");
}

TEST_CASE("ToolDiscovery: add, update, remove", "[registry][discovery]") {
    TempDir dir;
    ToolRegistry registry;
    ToolDiscovery discovery(registry);

    dir.Write("alpha_mcp.py", "# first version of alpha\n");
    dir.Write("nested/beta_server.js", "// beta server for tests\n");

    auto first = discovery.Discover({dir.Path().string()}, true);
    CHECK(Has(first.added, "alpha_mcp"));
    CHECK(Has(first.added, "beta_server"));
    CHECK(first.errors.empty());
    CHECK(registry.Size() == 2);

    SECTION("unchanged files are a no-op") {
        auto again = discovery.Discover({dir.Path().string()}, true);
        CHECK(again.Empty());
    }
    SECTION("changed content is an update") {
        dir.Write("alpha_mcp.py", "# second version of alpha\n");
        auto again = discovery.Discover({dir.Path().string()}, true);
        CHECK(again.updated == std::vector<std::string>{"alpha_mcp"});
        CHECK(registry.Get("alpha_mcp")->description == "second version of alpha");
    }
    SECTION("deleted files are removed") {
        fs::remove(dir.Path() / "nested" / "beta_server.js");
        auto again = discovery.Discover({dir.Path().string()}, true);
        CHECK(again.removed == std::vector<std::string>{"beta_server"});
        CHECK_FALSE(registry.Contains("beta_server"));
    }
}

TEST_CASE("ToolDiscovery: non-recursive scan", "[registry][discovery]") {
    TempDir dir;
    ToolRegistry registry;
    ToolDiscovery discovery(registry);
    dir.Write("top_mcp.py", "x");
    dir.Write("deep/inner_mcp.py", "x");

    auto result = discovery.Discover({dir.Path().string()}, false);
    CHECK(result.added == std::vector<std::string>{"top_mcp"});
}

TEST_CASE("ToolDiscovery: configured tools are never replaced", "[registry][discovery]") {
    TempDir dir;
    ToolRegistry registry;
    ToolDefinition configured;
    configured.name = "shared_mcp";
    configured.command = "/bin/cat";
    REQUIRE(registry.Register(configured).IsOk());

    ToolDiscovery discovery(registry);
    dir.Write("shared_mcp.py", "x");
    auto result = discovery.Discover({dir.Path().string()}, true);

    CHECK(result.added.empty());
    REQUIRE(result.errors.size() == 1);
    CHECK(registry.Get("shared_mcp")->source == ToolSource::Config);
}

TEST_CASE("ToolDiscovery: duplicate names and missing paths", "[registry][discovery]") {
    TempDir dir;
    ToolRegistry registry;
    ToolDiscovery discovery(registry);
    dir.Write("a/dup_mcp.py", "x");
    dir.Write("b/dup_mcp.py", "y");

    auto result = discovery.Discover({dir.Path().string(), (dir.Path() / "absent").string()},
                                     true);
    CHECK(result.added == std::vector<std::string>{"dup_mcp"});
    CHECK(result.errors.size() == 1);

    auto json = result.ToJson();
    CHECK(json["new"].size() == 1);
    CHECK(json["errors"][0].contains("path"));
}
