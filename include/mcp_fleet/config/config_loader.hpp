#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/registry/tool_definition.hpp>

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace YAML {
class Node;
}

namespace mcp_fleet {

// Parse a YAML config file into a FleetConfig. Missing sections keep defaults.
Result<FleetConfig, Error> LoadFromYaml(std::string_view file_path);

// Same as LoadFromYaml but from an in-memory document.
Result<FleetConfig, Error> LoadFromYamlString(std::string_view text);

// Parse one tool record as delivered by the persistence collaborator.
// "command" may be a list ([exe, args...]) or a string that is split
// shell-style when "args" is absent. "timeout" is accepted as an alias of
// "startup_timeout".
Result<ToolDefinition, Error> ToolDefinitionFromJson(const nlohmann::json& j);
Result<ToolDefinition, Error> ToolDefinitionFromYaml(const YAML::Node& node);

// Recognise the subcommand in argv[1]. Anything else means "serve".
struct SubcommandParse {
    Subcommand command;
    bool found_subcommand;
};
SubcommandParse ParseSubcommand(int argc, const char* const* argv);

// Parse the command line (argv[0] = program name, subcommand optional).
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Apply CLI flags on top of a loaded configuration.
FleetConfig MergeCliOverrides(FleetConfig base, const CliOptions& cli);

// Check thresholds, timeout ordering and tool uniqueness.
Result<void, Error> ValidateConfig(const FleetConfig& config);

} // namespace mcp_fleet
