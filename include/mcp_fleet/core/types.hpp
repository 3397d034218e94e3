#pragma once

#include <mcp_fleet/core/result.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// ToolName: validated tool identifier.
//
// Rules:
//   - 1..64 characters
//   - ASCII letters, digits, '_', '-', '.'
//   - Must not start with '.' or '-'
// ---------------------------------------------------------------------------
class ToolName {
public:
    static Result<ToolName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ToolName& other) const { return value_ == other.value_; }
    bool operator!=(const ToolName& other) const { return value_ != other.value_; }

private:
    explicit ToolName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// ConnectionType: wire transport a tool instance speaks.
// ---------------------------------------------------------------------------
enum class ConnectionType {
    Stdio,
    Http,
    WebSocket,
};

Result<ConnectionType, std::string> ParseConnectionType(std::string_view text);
const char* ConnectionTypeName(ConnectionType type);

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Random identifier: prefix + 16 lowercase hex characters.
std::string NewId(std::string_view prefix);

/// Split a command string into argv tokens. Supports single and double
/// quotes and backslash escapes outside single quotes. Returns an error
/// on an unterminated quote.
Result<std::vector<std::string>, std::string> SplitCommandLine(std::string_view command);

/// UTC timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.250Z.
std::string FormatIso8601(std::chrono::system_clock::time_point at);

/// Lowercase copy of an ASCII string.
std::string ToLower(std::string_view text);

} // namespace mcp_fleet
