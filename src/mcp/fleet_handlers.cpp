#include <mcp_fleet/mcp/fleet_handlers.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

namespace {

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

HandlerResult FromResponse(const nlohmann::json& response) {
    return HandlerResult{
        !response.value("success", false),
        nlohmann::json::array({{{"type", "text"}, {"text", response.dump()}}})};
}

HandlerResult MakeParamError(const std::string& msg) {
    const auto error = Error::Make(ErrorKind::Config, "Arguments", msg);
    return FromResponse({{"success", false}, {"error", error.ToJson()}});
}

std::optional<std::string> RequireString(const nlohmann::json& args,
                                         const std::string& key,
                                         HandlerResult& out_error) {
    if (!args.contains(key) || !args[key].is_string() ||
        args[key].get<std::string>().empty()) {
        out_error = MakeParamError("Missing required parameter: " + key);
        return std::nullopt;
    }
    return args[key].get<std::string>();
}

std::optional<std::string> OptString(const nlohmann::json& args, const std::string& key) {
    if (args.contains(key) && args[key].is_string() && !args[key].get<std::string>().empty()) {
        return args[key].get<std::string>();
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

nlohmann::json ToolNameSchema() {
    return MakeSchema({{"name", StringProp("Tool name")}}, {"name"});
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------

HandlerResult HandleCallTool(FleetService& fleet, const nlohmann::json& args) {
    HandlerResult err;
    auto name = RequireString(args, "name", err);
    if (!name) return err;
    auto method = RequireString(args, "method", err);
    if (!method) return err;

    auto params = args.value("params", nlohmann::json::object());
    if (!params.is_object() && !params.is_array()) {
        return MakeParamError("'params' must be an object or array");
    }

    std::optional<Millis> timeout;
    if (args.contains("timeout") && args["timeout"].is_number()) {
        const auto seconds = args["timeout"].get<double>();
        if (seconds <= 0) return MakeParamError("'timeout' must be positive");
        timeout = SecondsToMillis(seconds);
    }

    return FromResponse(fleet.CallTool(*name, *method, params, OptString(args, "session_id"),
                                       timeout, RequestOrigin::Mcp));
}

HandlerResult HandleDiscover(FleetService& fleet, const nlohmann::json& args) {
    std::vector<std::string> paths;
    if (args.contains("paths")) {
        if (!args["paths"].is_array()) return MakeParamError("'paths' must be a list");
        for (const auto& p : args["paths"]) {
            if (!p.is_string()) return MakeParamError("'paths' entries must be strings");
            paths.push_back(p.get<std::string>());
        }
    }
    bool recursive = true;
    if (args.contains("recursive") && args["recursive"].is_boolean()) {
        recursive = args["recursive"].get<bool>();
    }
    return FromResponse(fleet.DiscoverTools(paths, recursive));
}

} // anonymous namespace

void RegisterFleetHandlers(HandlerRegistry& handlers, FleetService& fleet) {
    handlers.Register(
        "list_available_tools",
        "List registered tools with their connection type, state and capabilities.",
        MakeSchema(nlohmann::json::object(), nlohmann::json::array()),
        [&fleet](const nlohmann::json&) { return FromResponse(fleet.ListAvailableTools()); });

    handlers.Register(
        "call_tool",
        "Call a method on a tool. Starts the tool if needed; pass session_id to "
        "reuse a session.",
        MakeSchema({{"name", StringProp("Tool name")},
                    {"method", StringProp("JSON-RPC method, e.g. tools/call")},
                    {"params", {{"type", "object"}, {"description", "Method parameters"}}},
                    {"session_id", StringProp("Session to run the call in")},
                    {"timeout", {{"type", "number"}, {"description", "Timeout in seconds"}}}},
                   nlohmann::json::array({"name", "method"})),
        [&fleet](const nlohmann::json& args) { return HandleCallTool(fleet, args); });

    handlers.Register(
        "start_tool", "Start a tool (a FAILED tool is reset first).", ToolNameSchema(),
        [&fleet](const nlohmann::json& args) {
            HandlerResult err;
            auto name = RequireString(args, "name", err);
            if (!name) return err;
            return FromResponse(fleet.StartTool(*name));
        });

    handlers.Register(
        "stop_tool", "Stop a tool. Stopping a stopped tool succeeds.", ToolNameSchema(),
        [&fleet](const nlohmann::json& args) {
            HandlerResult err;
            auto name = RequireString(args, "name", err);
            if (!name) return err;
            return FromResponse(fleet.StopTool(*name));
        });

    handlers.Register(
        "restart_tool", "Stop and start a tool.", ToolNameSchema(),
        [&fleet](const nlohmann::json& args) {
            HandlerResult err;
            auto name = RequireString(args, "name", err);
            if (!name) return err;
            return FromResponse(fleet.RestartTool(*name));
        });

    handlers.Register(
        "get_tool_status",
        "State, uptime, pid, restart count, last error and recent output of a tool.",
        ToolNameSchema(),
        [&fleet](const nlohmann::json& args) {
            HandlerResult err;
            auto name = RequireString(args, "name", err);
            if (!name) return err;
            return FromResponse(fleet.GetToolStatus(*name));
        });

    handlers.Register(
        "discover_tools",
        "Scan directories for tool files and reconcile the registry.",
        MakeSchema({{"paths", {{"type", "array"},
                               {"items", {{"type", "string"}}},
                               {"description", "Directories to scan (default paths if empty)"}}},
                    {"recursive", {{"type", "boolean"}, {"description", "Scan subdirectories"}}}},
                   nlohmann::json::array()),
        [&fleet](const nlohmann::json& args) { return HandleDiscover(fleet, args); });

    handlers.Register(
        "get_metrics", "Fleet and per-tool request, error, latency and restart statistics.",
        MakeSchema(nlohmann::json::object(), nlohmann::json::array()),
        [&fleet](const nlohmann::json&) { return FromResponse(fleet.GetMetrics()); });

    handlers.Register(
        "create_session", "Create (or take from the pool) a session bound to a tool.",
        MakeSchema({{"tool", StringProp("Tool name")}}, {"tool"}),
        [&fleet](const nlohmann::json& args) {
            HandlerResult err;
            auto tool = RequireString(args, "tool", err);
            if (!tool) return err;
            return FromResponse(fleet.CreateSession(*tool));
        });

    handlers.Register(
        "terminate_session", "Terminate a session.",
        MakeSchema({{"session_id", StringProp("Session id")}}, {"session_id"}),
        [&fleet](const nlohmann::json& args) {
            HandlerResult err;
            auto id = RequireString(args, "session_id", err);
            if (!id) return err;
            return FromResponse(fleet.TerminateSession(*id));
        });

    handlers.Register(
        "list_sessions", "List sessions with their state and idle time.",
        MakeSchema(nlohmann::json::object(), nlohmann::json::array()),
        [&fleet](const nlohmann::json&) { return FromResponse(fleet.ListSessions()); });
}

} // namespace mcp_fleet
