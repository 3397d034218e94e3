#pragma once

#include <mcp_fleet/mcp/handler_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over stdin/stdout.
//
// Newline-delimited JSON-RPC 2.0 with the methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call
//   - notifications/* (no response)
// stdout carries protocol messages only; diagnostics go to the logger.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(HandlerRegistry handlers,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Serve until EOF on the input stream.
    void Run();

    // Process one JSON-RPC message; nullopt for notifications. A message
    // whose members have the wrong types is answered with Invalid Request.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] bool Initialized() const noexcept { return initialized_; }

private:
    std::optional<nlohmann::json> Dispatch(const nlohmann::json& message);
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    void Write(const nlohmann::json& message);

    HandlerRegistry handlers_;
    std::istream& in_;
    std::ostream& out_;
    bool initialized_ = false;
    std::string client_name_;
};

} // namespace mcp_fleet
