#include <mcp_fleet/registry/tool_registry.hpp>

#include <mcp_fleet/core/log.hpp>

namespace mcp_fleet {

namespace {

Error MakeRegistryError(const std::string& operation, const std::string& tool,
                        const std::string& message) {
    return Error::Make(ErrorKind::Config, operation, message, tool);
}

} // anonymous namespace

std::shared_ptr<ToolRegistry::Entry> ToolRegistry::FindEntry(
    const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

Result<void, Error> ToolRegistry::Register(ToolDefinition def) {
    auto valid = ValidateToolDefinition(def);
    if (valid.IsErr()) {
        return valid;
    }

    auto entry = std::make_shared<Entry>();
    const auto name = def.name;
    entry->definition = std::make_shared<const ToolDefinition>(std::move(def));

    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        if (!entries_.emplace(name, std::move(entry)).second) {
            return Result<void, Error>::Err(MakeRegistryError(
                "Register", name, "Tool already registered"));
        }
    }
    LogInfo("registry", "Registered tool '" + name + "'");
    return Result<void, Error>::Ok();
}

Result<void, Error> ToolRegistry::Replace(ToolDefinition def) {
    auto valid = ValidateToolDefinition(def);
    if (valid.IsErr()) {
        return valid;
    }

    auto entry = FindEntry(def.name);
    if (!entry) {
        return Result<void, Error>::Err(MakeRegistryError(
            "Replace", def.name, "Tool not registered"));
    }

    const auto name = def.name;
    auto replacement = std::make_shared<const ToolDefinition>(std::move(def));
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->definition = std::move(replacement);
    }
    LogInfo("registry", "Replaced definition of tool '" + name + "'");
    return Result<void, Error>::Ok();
}

Result<bool, Error> ToolRegistry::Upsert(ToolDefinition def) {
    if (Contains(def.name)) {
        auto replaced = Replace(std::move(def));
        if (replaced.IsErr()) {
            return Result<bool, Error>::Err(replaced.Error());
        }
        return Result<bool, Error>::Ok(true);
    }
    auto registered = Register(std::move(def));
    if (registered.IsErr()) {
        return Result<bool, Error>::Err(registered.Error());
    }
    return Result<bool, Error>::Ok(false);
}

Result<void, Error> ToolRegistry::Unregister(const std::string& name) {
    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        if (entries_.erase(name) == 0) {
            return Result<void, Error>::Err(MakeRegistryError(
                "Unregister", name, "Tool not registered"));
        }
    }
    LogInfo("registry", "Unregistered tool '" + name + "'");
    return Result<void, Error>::Ok();
}

ToolDefinitionPtr ToolRegistry::Get(const std::string& name) const {
    auto entry = FindEntry(name);
    if (!entry) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->definition;
}

std::vector<ToolDefinitionPtr> ToolRegistry::List() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        entries.reserve(entries_.size());
        for (const auto& [name, entry] : entries_) {
            entries.push_back(entry);
        }
    }

    std::vector<ToolDefinitionPtr> out;
    out.reserve(entries.size());
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        out.push_back(entry->definition);
    }
    return out;
}

bool ToolRegistry::Contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return entries_.count(name) > 0;
}

std::size_t ToolRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return entries_.size();
}

} // namespace mcp_fleet
