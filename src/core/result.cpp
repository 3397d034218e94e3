#include <mcp_fleet/core/result.hpp>

#include <sstream>

namespace mcp_fleet {

namespace {

// JSON-RPC 2.0 reserved codes.
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;

constexpr size_t kMaxBodyInMessage = 200;

// Pull a human-readable message out of an HTTP error body. Tools behind
// HTTP usually answer with either a JSON-RPC error envelope, a
// {"detail": "..."} object, or plain text.
std::string ExtractBodyMessage(const std::string& body) {
    if (body.empty()) return "";

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        if (parsed.contains("error") && parsed["error"].is_object()) {
            return parsed["error"].value("message", "");
        }
        if (parsed.contains("detail") && parsed["detail"].is_string()) {
            return parsed["detail"].get<std::string>();
        }
        if (parsed.contains("message") && parsed["message"].is_string()) {
            return parsed["message"].get<std::string>();
        }
    }

    if (body.size() > kMaxBodyInMessage) {
        return body.substr(0, kMaxBodyInMessage) + "...";
    }
    return body;
}

} // anonymous namespace

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Config:          return "config_error";
        case ErrorKind::ProcessStart:    return "process_start_error";
        case ErrorKind::ProcessTimeout:  return "process_timeout_error";
        case ErrorKind::ProcessCrash:    return "process_crash_error";
        case ErrorKind::Protocol:        return "protocol_error";
        case ErrorKind::ToolUnavailable: return "tool_unavailable_error";
        case ErrorKind::SessionExpired:  return "session_expired_error";
        case ErrorKind::RequestTimeout:  return "request_timeout_error";
        case ErrorKind::ToolError:       return "tool_error";
        case ErrorKind::Internal:        return "internal_error";
    }
    return "internal_error";
}

std::string Error::KindName() const {
    return ErrorKindName(kind);
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!tool.empty()) {
        oss << " [" << tool << "]";
    }
    if (rpc_code.has_value()) {
        oss << " (code " << *rpc_code << ")";
    }
    oss << ": " << message;
    return oss.str();
}

nlohmann::json Error::ToJson() const {
    nlohmann::json j = {
        {"kind", KindName()},
        {"message", message},
        {"operation", operation},
    };
    if (!tool.empty()) {
        j["tool"] = tool;
    }
    if (rpc_code.has_value()) {
        j["rpc_code"] = *rpc_code;
    }
    return j;
}

Error Error::FromRpcError(const std::string& operation,
                          const std::string& tool,
                          const nlohmann::json& error_object) {
    std::optional<int> code;
    std::string message = "JSON-RPC error";

    if (error_object.is_object()) {
        if (error_object.contains("code") && error_object["code"].is_number_integer()) {
            code = error_object["code"].get<int>();
        }
        if (error_object.contains("message") && error_object["message"].is_string()) {
            message = error_object["message"].get<std::string>();
        }
    } else if (error_object.is_string()) {
        message = error_object.get<std::string>();
    }

    auto kind = ErrorKind::ToolError;
    if (code == kParseError || code == kInvalidRequest) {
        kind = ErrorKind::Protocol;
    }

    return Error{operation, tool, message, code, kind};
}

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& tool,
                            int status_code,
                            const std::string& response_body) {
    auto detail = ExtractBodyMessage(response_body);

    ErrorKind kind;
    std::string message;

    switch (status_code) {
        case 408:
        case 504:
            kind = ErrorKind::RequestTimeout;
            message = "Tool endpoint timed out";
            break;
        case 502:
        case 503:
            kind = ErrorKind::ToolUnavailable;
            message = "Tool endpoint unavailable";
            break;
        case 404:
            kind = ErrorKind::ToolError;
            message = "Tool endpoint not found";
            break;
        default:
            kind = ErrorKind::ToolError;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }
    if (!detail.empty()) {
        message += ": " + detail;
    }

    return Error{operation, tool, message, std::nullopt, kind};
}

} // namespace mcp_fleet
