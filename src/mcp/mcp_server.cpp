#include <mcp_fleet/mcp/mcp_server.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/version.hpp>
#include <mcp_fleet/transport/jsonrpc.hpp>

#include <optional>
#include <string>

namespace mcp_fleet {

McpServer::McpServer(HandlerRegistry handlers,
                     std::istream& in,
                     std::ostream& out)
    : handlers_(std::move(handlers)), in_(in), out_(out) {}

void McpServer::Write(const nlohmann::json& message) {
    out_ << message.dump() << "\n";
    out_.flush();
}

void McpServer::Run() {
    LogInfo("mcp", "Serving " + std::to_string(handlers_.Schemas().size()) +
                       " tools on stdio");
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception&) {
            Write(jsonrpc::MakeError(nullptr, jsonrpc::kParseError, "Parse error"));
            continue;
        }

        if (message.is_array()) {
            auto responses = nlohmann::json::array();
            for (const auto& item : message) {
                if (auto response = HandleMessage(item)) {
                    responses.push_back(std::move(*response));
                }
            }
            if (!responses.empty()) Write(responses);
            continue;
        }

        if (auto response = HandleMessage(message)) {
            Write(*response);
        }
    }
    LogInfo("mcp", "Input closed; server loop finished");
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    try {
        return Dispatch(message);
    } catch (const nlohmann::json::exception& e) {
        LogWarn("mcp", std::string("Malformed message: ") + e.what());
        if (message.is_object() && message.contains("id")) {
            return jsonrpc::MakeError(message["id"], jsonrpc::kInvalidRequest,
                                      "Invalid request: " + std::string(e.what()));
        }
        return std::nullopt;
    }
}

std::optional<nlohmann::json> McpServer::Dispatch(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("jsonrpc") ||
        message["jsonrpc"] != "2.0") {
        if (message.is_object() && message.contains("id")) {
            return jsonrpc::MakeError(message["id"], jsonrpc::kInvalidRequest,
                                      "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Notifications have no "id".
    if (!message.contains("id")) {
        const auto it = message.find("method");
        LogDebug("mcp", "Notification: " + (it != message.end() && it->is_string()
                                                 ? it->get<std::string>()
                                                 : std::string("?")));
        return std::nullopt;
    }

    const auto& id = message["id"];
    if (!message.contains("method") || !message["method"].is_string()) {
        return jsonrpc::MakeError(id, jsonrpc::kInvalidRequest, "Missing method");
    }
    const auto method = message["method"].get<std::string>();
    auto params = message.value("params", nlohmann::json::object());

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return jsonrpc::MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    }
    return jsonrpc::MakeError(id, jsonrpc::kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    initialized_ = true;
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        client_name_ = params["clientInfo"].value("name", std::string{});
        LogInfo("mcp", "Client connected: " + (client_name_.empty() ? "unknown" : client_name_));
    }

    nlohmann::json result;
    result["protocolVersion"] = jsonrpc::kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", "mcp-fleet"},
        {"version", kVersion}
    };
    return jsonrpc::MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& schema : handlers_.Schemas()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }
    return jsonrpc::MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return jsonrpc::MakeError(id, jsonrpc::kInvalidParams, "Missing 'name' parameter");
    }

    const auto name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());
    if (!handlers_.Has(name)) {
        return jsonrpc::MakeError(id, jsonrpc::kInvalidParams, "Unknown tool: " + name);
    }

    auto result = handlers_.Execute(name, arguments);

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.is_error) {
        response_result["isError"] = true;
    }
    return jsonrpc::MakeResult(id, response_result);
}

} // namespace mcp_fleet
