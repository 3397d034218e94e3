#include <mcp_fleet/registry/tool_definition.hpp>

namespace mcp_fleet {

namespace {

Error MakeDefinitionError(const std::string& tool, const std::string& message) {
    return Error::Make(ErrorKind::Config, "ValidateToolDefinition", message, tool);
}

} // anonymous namespace

const char* ToolSourceName(ToolSource source) {
    switch (source) {
        case ToolSource::Config:     return "config";
        case ToolSource::Discovered: return "discovered";
        case ToolSource::Api:        return "api";
    }
    return "config";
}

nlohmann::json ToolDefinition::ToJson() const {
    nlohmann::json j = {
        {"name", name},
        {"command", command},
        {"args", args},
        {"env", env},
        {"working_directory", working_directory},
        {"connection_type", ConnectionTypeName(connection_type)},
        {"startup_timeout", static_cast<double>(startup_timeout.count()) / 1000.0},
        {"auto_restart", auto_restart},
        {"max_restart_attempts", max_restart_attempts},
        {"auto_start", auto_start},
        {"concurrency_safe", concurrency_safe},
        {"source", ToolSourceName(source)},
    };
    if (connection_type != ConnectionType::Stdio) {
        j["host"] = host;
        j["port"] = port;
        j["endpoint_path"] = endpoint_path;
    }
    if (max_concurrency > 0) j["max_concurrency"] = max_concurrency;
    if (!description.empty()) j["description"] = description;
    if (!source_path.empty()) j["source_path"] = source_path;
    if (!content_hash.empty()) j["content_hash"] = content_hash;
    return j;
}

Result<void, Error> ValidateToolDefinition(const ToolDefinition& def) {
    auto name = ToolName::Create(def.name);
    if (name.IsErr()) {
        return Result<void, Error>::Err(MakeDefinitionError(def.name, name.Error()));
    }

    switch (def.connection_type) {
        case ConnectionType::Stdio:
            if (def.command.empty()) {
                return Result<void, Error>::Err(MakeDefinitionError(
                    def.name, "stdio tool requires a command"));
            }
            break;
        case ConnectionType::Http:
        case ConnectionType::WebSocket:
            if (def.host.empty() || def.port == 0) {
                return Result<void, Error>::Err(MakeDefinitionError(
                    def.name, std::string(ConnectionTypeName(def.connection_type)) +
                                  " tool requires host and port"));
            }
            if (def.endpoint_path.empty() || def.endpoint_path[0] != '/') {
                return Result<void, Error>::Err(MakeDefinitionError(
                    def.name, "endpoint_path must start with '/'"));
            }
            break;
    }

    if (def.startup_timeout.count() <= 0) {
        return Result<void, Error>::Err(MakeDefinitionError(
            def.name, "startup_timeout must be positive"));
    }
    if (def.max_restart_attempts < 0) {
        return Result<void, Error>::Err(MakeDefinitionError(
            def.name, "max_restart_attempts must not be negative"));
    }
    if (def.max_concurrency < 0) {
        return Result<void, Error>::Err(MakeDefinitionError(
            def.name, "max_concurrency must not be negative"));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_fleet
