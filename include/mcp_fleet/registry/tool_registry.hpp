#pragma once

#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/registry/tool_definition.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcp_fleet {

using ToolDefinitionPtr = std::shared_ptr<const ToolDefinition>;

// ---------------------------------------------------------------------------
// ToolRegistry: validated tool definitions keyed by name.
//
// The map itself is guarded by a reader/writer lock that is only taken
// exclusively when a name is added or removed. Each entry carries its own
// mutex for the definition swap, so replacing one tool never blocks lookups
// of another. Callers receive a shared_ptr snapshot: a request dispatched
// against the old definition keeps it alive after a replace.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    /// Add a new definition. Invalid or duplicate definitions are rejected
    /// with a Config error.
    Result<void, Error> Register(ToolDefinition def);

    /// Replace an existing definition wholesale.
    Result<void, Error> Replace(ToolDefinition def);

    /// Register or replace. Returns true when an existing entry was replaced.
    Result<bool, Error> Upsert(ToolDefinition def);

    /// Remove a definition. Unknown names are a Config error.
    Result<void, Error> Unregister(const std::string& name);

    /// Snapshot of one definition, or nullptr.
    [[nodiscard]] ToolDefinitionPtr Get(const std::string& name) const;

    /// Snapshots of every definition, ordered by name.
    [[nodiscard]] std::vector<ToolDefinitionPtr> List() const;

    [[nodiscard]] bool Contains(const std::string& name) const;
    [[nodiscard]] std::size_t Size() const;

private:
    struct Entry {
        mutable std::mutex mutex;
        ToolDefinitionPtr definition;
    };

    std::shared_ptr<Entry> FindEntry(const std::string& name) const;

    mutable std::shared_mutex map_mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace mcp_fleet
