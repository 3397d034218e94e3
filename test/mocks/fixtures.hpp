#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/types.hpp>
#include <mcp_fleet/registry/tool_definition.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace mcp_fleet {
namespace testing {

// Tests run from the build directory; testdata lives next to this header.
inline std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto mocks_dir = this_file.substr(0, this_file.rfind('/'));  // .../test/mocks
    auto test_root = mocks_dir.substr(0, mocks_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

// Built alongside the tests; see test/fixtures/echo_server.cpp.
inline std::string EchoServerPath() {
    return MCP_FLEET_ECHO_SERVER_PATH;
}

inline ToolDefinition EchoTool(const std::string& name,
                               std::vector<std::string> args = {}) {
    ToolDefinition def;
    def.name = name;
    def.command = EchoServerPath();
    def.args = std::move(args);
    def.startup_timeout = std::chrono::seconds(5);
    def.max_restart_attempts = 3;
    return def;
}

// Settings tuned so lifecycle tests finish in well under a second.
inline ProcessSettings FastProcessSettings() {
    ProcessSettings s;
    s.max_processes = 4;
    s.startup_timeout = std::chrono::seconds(5);
    s.shutdown_grace = std::chrono::milliseconds(500);
    s.restart_delay = std::chrono::milliseconds(20);
    s.restart_delay_max = std::chrono::milliseconds(100);
    s.max_restart_attempts = 3;
    return s;
}

// Unique path under /tmp; nothing is created.
inline std::string TempPath(const std::string& stem) {
    return "/tmp/mcp_fleet_" + NewId(stem + "_");
}

// Poll `condition` until it holds or `timeout` passes.
inline bool WaitUntil(const std::function<bool()>& condition,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

} // namespace testing
} // namespace mcp_fleet
