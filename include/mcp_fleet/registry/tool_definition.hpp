#pragma once

#include <mcp_fleet/core/clock.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/core/types.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// Where a definition came from. Discovery only ever removes what it added.
enum class ToolSource {
    Config,
    Discovered,
    Api,
};

const char* ToolSourceName(ToolSource source);

// ---------------------------------------------------------------------------
// ToolDefinition: everything needed to launch and talk to one tool.
//
// Immutable once registered: updates replace the whole definition, and
// in-flight work keeps the shared_ptr snapshot it started with.
// ---------------------------------------------------------------------------
struct ToolDefinition {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string working_directory;

    ConnectionType connection_type = ConnectionType::Stdio;
    std::string host;
    uint16_t port = 0;
    std::string endpoint_path = "/mcp";

    Millis startup_timeout{30000};
    bool auto_restart = true;
    int max_restart_attempts = 3;
    bool auto_start = false;

    bool concurrency_safe = false;
    int max_concurrency = 0;  // 0 = fleet default when concurrency_safe

    std::string description;
    ToolSource source = ToolSource::Config;
    std::string source_path;
    std::string content_hash;

    [[nodiscard]] bool NeedsProcess() const noexcept { return !command.empty(); }

    /// In-flight calls allowed against one instance of this tool.
    [[nodiscard]] int ConcurrencyLimit(int fleet_default) const noexcept {
        if (!concurrency_safe) return 1;
        int limit = max_concurrency > 0 ? max_concurrency : fleet_default;
        return limit > 0 ? limit : 1;
    }

    [[nodiscard]] nlohmann::json ToJson() const;
};

/// Reject definitions that can never run: bad name, missing command for a
/// stdio tool, missing endpoint for a network tool, nonsensical limits.
Result<void, Error> ValidateToolDefinition(const ToolDefinition& def);

} // namespace mcp_fleet
