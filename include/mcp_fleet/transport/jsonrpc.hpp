#pragma once

#include <mcp_fleet/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_fleet {
namespace jsonrpc {

constexpr const char* kProtocolVersion = "2024-11-05";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

nlohmann::json MakeRequest(int64_t id, const std::string& method,
                           const nlohmann::json& params);
nlohmann::json MakeNotification(const std::string& method,
                                const nlohmann::json& params);
nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message);

// What an inbound message is, judged by its members.
enum class MessageKind {
    Response,      // id + result/error
    Request,       // id + method
    Notification,  // method, no id
    Invalid,
};

MessageKind Classify(const nlohmann::json& message);

/// Parse one wire line. Non-JSON text is a Protocol error.
Result<nlohmann::json, Error> ParseLine(std::string_view line,
                                        const std::string& tool);

/// Response id as an integer, if it has one.
bool ResponseId(const nlohmann::json& message, int64_t& out);

/// Unwrap a response envelope: result on success, Error::FromRpcError otherwise.
Result<nlohmann::json, Error> UnwrapResponse(const nlohmann::json& response,
                                             const std::string& operation,
                                             const std::string& tool);

/// The MCP initialize request parameters sent by the fleet.
nlohmann::json InitializeParams();

} // namespace jsonrpc
} // namespace mcp_fleet
