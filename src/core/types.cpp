#include <mcp_fleet/core/types.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace mcp_fleet {

namespace {

constexpr size_t kMaxToolNameLength = 64;

bool IsToolNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
           c == '_' || c == '-' || c == '.';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ToolName
// ---------------------------------------------------------------------------
Result<ToolName, std::string> ToolName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<ToolName, std::string>::Err("Tool name must not be empty");
    }
    if (name.size() > kMaxToolNameLength) {
        return Result<ToolName, std::string>::Err(
            "Tool name must be at most 64 characters, got " +
            std::to_string(name.size()));
    }
    if (!std::all_of(name.begin(), name.end(), IsToolNameChar)) {
        return Result<ToolName, std::string>::Err(
            "Tool name must contain only letters, digits, '_', '-' and '.'");
    }
    if (name[0] == '.' || name[0] == '-') {
        return Result<ToolName, std::string>::Err(
            "Tool name must not start with '.' or '-'");
    }
    return Result<ToolName, std::string>::Ok(ToolName(std::string(name)));
}

// ---------------------------------------------------------------------------
// ConnectionType
// ---------------------------------------------------------------------------
Result<ConnectionType, std::string> ParseConnectionType(std::string_view text) {
    auto lower = ToLower(text);
    if (lower == "stdio") {
        return Result<ConnectionType, std::string>::Ok(ConnectionType::Stdio);
    }
    if (lower == "http" || lower == "server") {
        return Result<ConnectionType, std::string>::Ok(ConnectionType::Http);
    }
    if (lower == "websocket" || lower == "ws") {
        return Result<ConnectionType, std::string>::Ok(ConnectionType::WebSocket);
    }
    return Result<ConnectionType, std::string>::Err(
        "Unknown connection type '" + std::string(text) +
        "' (expected stdio, http or websocket)");
}

const char* ConnectionTypeName(ConnectionType type) {
    switch (type) {
        case ConnectionType::Stdio:     return "stdio";
        case ConnectionType::Http:      return "http";
        case ConnectionType::WebSocket: return "websocket";
    }
    return "stdio";
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
std::string NewId(std::string_view prefix) {
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::ostringstream oss;
    oss << prefix << std::hex << std::setfill('0') << std::setw(16) << rng();
    return oss.str();
}

Result<std::vector<std::string>, std::string> SplitCommandLine(std::string_view command) {
    std::vector<std::string> out;
    std::string current;
    bool in_token = false;
    char quote = 0;

    for (size_t i = 0; i < command.size(); ++i) {
        char c = command[i];
        if (quote == '\'') {
            if (c == '\'') {
                quote = 0;
            } else {
                current += c;
            }
            continue;
        }
        if (c == '\\' && i + 1 < command.size()) {
            current += command[++i];
            in_token = true;
            continue;
        }
        if (quote == '"') {
            if (c == '"') {
                quote = 0;
            } else {
                current += c;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            in_token = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (in_token) {
                out.push_back(std::move(current));
                current.clear();
                in_token = false;
            }
            continue;
        }
        current += c;
        in_token = true;
    }

    if (quote != 0) {
        return Result<std::vector<std::string>, std::string>::Err(
            "Unterminated quote in command: " + std::string(command));
    }
    if (in_token) {
        out.push_back(std::move(current));
    }
    return Result<std::vector<std::string>, std::string>::Ok(std::move(out));
}

std::string ToLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string FormatIso8601(std::chrono::system_clock::time_point at) {
    const auto seconds = std::chrono::system_clock::to_time_t(at);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        at.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

} // namespace mcp_fleet
