#include <mcp_fleet/transport/jsonrpc.hpp>

#include <mcp_fleet/core/version.hpp>

namespace mcp_fleet {

namespace jsonrpc {

nlohmann::json MakeRequest(int64_t id, const std::string& method,
                           const nlohmann::json& params) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params},
    };
}

nlohmann::json MakeNotification(const std::string& method,
                                const nlohmann::json& params) {
    nlohmann::json j = {
        {"jsonrpc", "2.0"},
        {"method", method},
    };
    if (!params.is_null()) {
        j["params"] = params;
    }
    return j;
}

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result},
    };
}

nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}},
    };
}

MessageKind Classify(const nlohmann::json& message) {
    if (!message.is_object()) {
        return MessageKind::Invalid;
    }
    const bool has_id = message.contains("id") && !message["id"].is_null();
    const bool has_method = message.contains("method") && message["method"].is_string();
    if (has_method) {
        return has_id ? MessageKind::Request : MessageKind::Notification;
    }
    if (has_id && (message.contains("result") || message.contains("error"))) {
        return MessageKind::Response;
    }
    return MessageKind::Invalid;
}

Result<nlohmann::json, Error> ParseLine(std::string_view line, const std::string& tool) {
    auto parsed = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (parsed.is_discarded()) {
        constexpr std::size_t kMaxEcho = 120;
        std::string excerpt(line.substr(0, kMaxEcho));
        return Result<nlohmann::json, Error>::Err(Error::Make(
            ErrorKind::Protocol, "ParseLine",
            "Tool output is not JSON: " + excerpt, tool));
    }
    return Result<nlohmann::json, Error>::Ok(std::move(parsed));
}

bool ResponseId(const nlohmann::json& message, int64_t& out) {
    if (!message.is_object() || !message.contains("id")) {
        return false;
    }
    const auto& id = message["id"];
    if (id.is_number_integer()) {
        out = id.get<int64_t>();
        return true;
    }
    // Some servers echo numeric ids back as strings.
    if (id.is_string()) {
        const auto& text = id.get_ref<const std::string&>();
        if (text.empty()) return false;
        std::size_t consumed = 0;
        try {
            out = std::stoll(text, &consumed);
        } catch (const std::exception&) {
            return false;
        }
        return consumed == text.size();
    }
    return false;
}

Result<nlohmann::json, Error> UnwrapResponse(const nlohmann::json& response,
                                             const std::string& operation,
                                             const std::string& tool) {
    if (response.contains("error") && !response["error"].is_null()) {
        return Result<nlohmann::json, Error>::Err(
            Error::FromRpcError(operation, tool, response["error"]));
    }
    if (!response.contains("result")) {
        return Result<nlohmann::json, Error>::Err(Error::Make(
            ErrorKind::Protocol, operation, "Response has neither result nor error", tool));
    }
    return Result<nlohmann::json, Error>::Ok(response["result"]);
}

nlohmann::json InitializeParams() {
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "mcp-fleet"}, {"version", kVersion}}},
    };
}

} // namespace jsonrpc
} // namespace mcp_fleet
