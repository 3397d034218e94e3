#pragma once

#include <mcp_fleet/api/fleet_service.hpp>
#include <mcp_fleet/mcp/handler_registry.hpp>

namespace mcp_fleet {

// Register the fleet operations (list_available_tools, call_tool,
// start_tool, ...) as MCP tools. Handlers hold `fleet` by reference.
void RegisterFleetHandlers(HandlerRegistry& handlers, FleetService& fleet);

} // namespace mcp_fleet
