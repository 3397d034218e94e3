#pragma once

#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/registry/tool_definition.hpp>
#include <mcp_fleet/registry/tool_registry.hpp>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// Outcome of one discovery pass. Names are tool names; errors are
// (path, message) pairs for candidates that could not be processed.
struct DiscoveryResult {
    std::vector<std::string> added;
    std::vector<std::string> updated;
    std::vector<std::string> removed;
    std::vector<std::pair<std::string, std::string>> errors;

    [[nodiscard]] bool Empty() const noexcept {
        return added.empty() && updated.empty() && removed.empty();
    }
    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// Candidate heuristics (exposed for tests)
// ---------------------------------------------------------------------------

/// Extension gate, then filename keyword, executable bit, or content marker.
bool LooksLikeMcpTool(const std::filesystem::path& file);

/// Lowercase hex SHA-256 of the file contents.
Result<std::string, Error> HashFile(const std::filesystem::path& file);

/// First leading comment line longer than 10 characters, capped at 200.
std::string ExtractDescription(const std::string& head);

/// Build a stdio definition for a candidate file: launcher from the
/// extension, name from the file stem, source = Discovered.
Result<ToolDefinition, Error> DefinitionFromFile(const std::filesystem::path& file);

// ---------------------------------------------------------------------------
// ToolDiscovery: scans paths for tool files and reconciles the registry.
//
// New candidates are registered, candidates whose hash or command changed
// replace the previous discovered definition, and discovered tools that
// disappeared from a scanned root are unregistered. Definitions that came
// from configuration or the API are never touched.
// ---------------------------------------------------------------------------
class ToolDiscovery {
public:
    explicit ToolDiscovery(ToolRegistry& registry);

    [[nodiscard]] DiscoveryResult Discover(const std::vector<std::string>& paths,
                                           bool recursive);

    /// ./data/tools, ./tools, ~/.mcp/tools, /opt/mcp/tools
    [[nodiscard]] static std::vector<std::string> DefaultPaths();

private:
    void Scan(const std::filesystem::path& root, bool recursive,
              std::vector<std::filesystem::path>& out, DiscoveryResult& result) const;

    ToolRegistry& registry_;
};

} // namespace mcp_fleet
