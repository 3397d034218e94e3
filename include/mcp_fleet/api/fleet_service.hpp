#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/clock.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/health/health_monitor.hpp>
#include <mcp_fleet/process/process_manager.hpp>
#include <mcp_fleet/registry/tool_discovery.hpp>
#include <mcp_fleet/registry/tool_registry.hpp>
#include <mcp_fleet/router/request_router.hpp>
#include <mcp_fleet/session/session_manager.hpp>

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// FleetService: the operations offered to the API layer.
//
// Owns and wires every component. Each operation returns a structured
// JSON value, {"success": true, ...} or {"success": false, "error": {...}};
// failures never escape as exceptions.
// ---------------------------------------------------------------------------
class FleetService {
public:
    explicit FleetService(FleetConfig config, IClock& clock = DefaultClock());
    ~FleetService();

    FleetService(const FleetService&) = delete;
    FleetService& operator=(const FleetService&) = delete;

    /// Register the configured tools and start those marked auto_start.
    Result<void, Error> Initialize();

    /// Session sweeper, health checks and periodic discovery.
    void StartBackground();

    /// Stop background work and every tool instance.
    void Shutdown();

    nlohmann::json StartTool(const std::string& name);
    nlohmann::json StopTool(const std::string& name);
    nlohmann::json RestartTool(const std::string& name);
    nlohmann::json CallTool(const std::string& name, const std::string& method,
                            const nlohmann::json& params,
                            const std::optional<std::string>& session_id = std::nullopt,
                            std::optional<Millis> timeout = std::nullopt,
                            RequestOrigin origin = RequestOrigin::Api);
    nlohmann::json GetToolStatus(const std::string& name);
    nlohmann::json ListAvailableTools();
    nlohmann::json DiscoverTools(const std::vector<std::string>& paths, bool recursive = true);
    nlohmann::json GetMetrics();

    nlohmann::json CreateSession(const std::string& tool);
    nlohmann::json TerminateSession(const std::string& id);
    nlohmann::json ListSessions();

    [[nodiscard]] const FleetConfig& Config() const noexcept { return config_; }
    ToolRegistry& Registry() noexcept { return registry_; }
    ProcessManager& Processes() noexcept { return processes_; }
    SessionManager& Sessions() noexcept { return sessions_; }
    RequestRouter& Router() noexcept { return router_; }
    HealthMonitor& Health() noexcept { return health_; }

private:
    void RunPeriodicDiscovery();
    std::vector<std::string> DiscoveryPaths(const std::vector<std::string>& requested) const;

    const FleetConfig config_;
    ToolRegistry registry_;
    ProcessManager processes_;
    SessionManager sessions_;
    RequestRouter router_;
    HealthMonitor health_;

    std::mutex discovery_mutex_;
    ToolDiscovery discovery_;

    std::mutex background_mutex_;
    std::condition_variable background_cv_;
    bool background_stop_ = false;
    std::thread discovery_thread_;
};

} // namespace mcp_fleet
