#include <mcp_fleet/api/fleet_service.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/types.hpp>

namespace mcp_fleet {

namespace {

nlohmann::json Failure(const Error& error) {
    return {{"success", false}, {"error", error.ToJson()}};
}

double Seconds(Millis ms) {
    return static_cast<double>(ms.count()) / 1000.0;
}

nlohmann::json StatusResponse(const InstanceStatus& status) {
    auto j = status.ToJson();
    j["success"] = true;
    j["tool"] = status.name;
    return j;
}

} // anonymous namespace

FleetService::FleetService(FleetConfig config, IClock& clock)
    : config_(std::move(config)),
      processes_(registry_, config_.process),
      sessions_(registry_, processes_, config_.session, clock),
      router_(registry_, processes_, sessions_, config_.router),
      health_(registry_, processes_, config_.health, clock),
      discovery_(registry_) {
    processes_.SetStateListener([this](const std::string& tool, InstanceState, InstanceState to) {
        if (to != InstanceState::Running && to != InstanceState::Starting) {
            sessions_.UnbindTool(tool);
        }
    });
    router_.SetCallObserver([this](const std::string& tool, Millis latency, const Error* error) {
        health_.RecordRequest(tool, latency, error == nullptr);
    });
    health_.SetGateProvider([this](const std::string& tool) { return sessions_.GateFor(tool); });
}

FleetService::~FleetService() {
    Shutdown();
    processes_.SetStateListener(nullptr);
}

Result<void, Error> FleetService::Initialize() {
    for (const auto& def : config_.tools) {
        auto registered = registry_.Register(def);
        if (registered.IsErr()) {
            return registered;
        }
    }
    LogInfo("api", "Registered " + std::to_string(config_.tools.size()) + " configured tool(s)");

    if (!config_.discovery.paths.empty()) {
        DiscoverTools(config_.discovery.paths, config_.discovery.recursive);
    }

    for (const auto& def : registry_.List()) {
        if (!def->auto_start) continue;
        auto started = processes_.Start(def->name);
        if (started.IsErr()) {
            LogWarn("api", "auto_start of '" + def->name + "' failed: " +
                               started.Error().message);
        }
    }
    return Result<void, Error>::Ok();
}

void FleetService::StartBackground() {
    sessions_.StartSweeper();
    health_.Start();

    std::lock_guard<std::mutex> lock(background_mutex_);
    if (config_.discovery.interval.count() > 0 && !discovery_thread_.joinable()) {
        background_stop_ = false;
        discovery_thread_ = std::thread([this] { RunPeriodicDiscovery(); });
    }
}

void FleetService::Shutdown() {
    std::thread discovery;
    {
        std::lock_guard<std::mutex> lock(background_mutex_);
        background_stop_ = true;
        discovery.swap(discovery_thread_);
    }
    background_cv_.notify_all();
    if (discovery.joinable()) {
        discovery.join();
    }
    health_.Stop();
    sessions_.StopSweeper();
    processes_.Shutdown();
}

void FleetService::RunPeriodicDiscovery() {
    std::unique_lock<std::mutex> lock(background_mutex_);
    while (!background_cv_.wait_for(lock, config_.discovery.interval,
                                    [this] { return background_stop_; })) {
        lock.unlock();
        auto result = DiscoverTools({}, config_.discovery.recursive);
        if (!result.value("success", false)) {
            LogWarn("discovery", "Periodic discovery failed: " + result.dump());
        }
        lock.lock();
    }
}

// ---------------------------------------------------------------------------
// Lifecycle operations
// ---------------------------------------------------------------------------
nlohmann::json FleetService::StartTool(const std::string& name) {
    if (processes_.State(name) == InstanceState::Failed) {
        auto reset = processes_.Reset(name);
        if (reset.IsErr()) return Failure(reset.Error());
    }
    auto started = processes_.Start(name);
    if (started.IsErr()) {
        return Failure(started.Error());
    }
    auto status = processes_.Status(name);
    if (status.IsErr()) return Failure(status.Error());
    return StatusResponse(status.Value());
}

nlohmann::json FleetService::StopTool(const std::string& name) {
    auto stopped = processes_.Stop(name, true);
    if (stopped.IsErr()) {
        return Failure(stopped.Error());
    }
    return {{"success", true}, {"tool", name}, {"state", InstanceStateName(processes_.State(name))}};
}

nlohmann::json FleetService::RestartTool(const std::string& name) {
    auto restarted = processes_.Restart(name);
    if (restarted.IsErr()) {
        return Failure(restarted.Error());
    }
    auto status = processes_.Status(name);
    if (status.IsErr()) return Failure(status.Error());
    return StatusResponse(status.Value());
}

nlohmann::json FleetService::CallTool(const std::string& name, const std::string& method,
                                      const nlohmann::json& params,
                                      const std::optional<std::string>& session_id,
                                      std::optional<Millis> timeout, RequestOrigin origin) {
    const auto started = SteadyClock::now();
    auto called = router_.Call(name, method, params, session_id, timeout, origin);
    if (called.IsErr()) {
        auto out = Failure(called.Error());
        out["execution_time"] = Seconds(ToMillis(SteadyClock::now() - started));
        return out;
    }
    const auto& outcome = called.Value();
    return {
        {"success", true},
        {"result", outcome.result},
        {"execution_time", Seconds(outcome.execution_time)},
        {"session_id", outcome.session_id},
        {"attempts", outcome.attempts},
    };
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
nlohmann::json FleetService::GetToolStatus(const std::string& name) {
    auto status = processes_.Status(name);
    if (status.IsErr()) {
        return Failure(status.Error());
    }
    return StatusResponse(status.Value());
}

nlohmann::json FleetService::ListAvailableTools() {
    auto tools = nlohmann::json::array();
    for (const auto& def : registry_.List()) {
        auto entry = nlohmann::json{
            {"name", def->name},
            {"description", def->description},
            {"connection_type", ConnectionTypeName(def->connection_type)},
            {"source", ToolSourceName(def->source)},
            {"capabilities", nlohmann::json::object()},
            {"status", InstanceStateName(InstanceState::Stopped)},
        };
        auto status = processes_.Status(def->name);
        if (status.IsOk()) {
            entry["capabilities"] = status.Value().capabilities;
            entry["status"] = InstanceStateName(status.Value().state);
        }
        tools.push_back(std::move(entry));
    }
    return {{"success", true}, {"tools", tools}};
}

nlohmann::json FleetService::GetMetrics() {
    auto metrics = health_.Metrics();
    metrics["success"] = true;
    metrics["active_sessions"] = sessions_.Count();
    return metrics;
}

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------
std::vector<std::string> FleetService::DiscoveryPaths(
    const std::vector<std::string>& requested) const {
    if (!requested.empty()) return requested;
    if (!config_.discovery.paths.empty()) return config_.discovery.paths;
    return ToolDiscovery::DefaultPaths();
}

nlohmann::json FleetService::DiscoverTools(const std::vector<std::string>& paths,
                                           bool recursive) {
    DiscoveryResult result;
    {
        std::lock_guard<std::mutex> lock(discovery_mutex_);
        result = discovery_.Discover(DiscoveryPaths(paths), recursive);
    }

    for (const auto& name : result.removed) {
        auto stopped = processes_.Stop(name, true);
        if (stopped.IsErr()) {
            LogWarn("discovery", stopped.Error().ToString());
        }
    }
    for (const auto& name : result.updated) {
        if (processes_.State(name) != InstanceState::Running) continue;
        LogInfo("discovery", "'" + name + "' changed on disk; restarting");
        auto restarted = processes_.Restart(name);
        if (restarted.IsErr()) {
            LogWarn("discovery", restarted.Error().ToString());
        }
    }

    auto out = result.ToJson();
    out["success"] = true;
    return out;
}

// ---------------------------------------------------------------------------
// Sessions
// ---------------------------------------------------------------------------
nlohmann::json FleetService::CreateSession(const std::string& tool) {
    auto created = sessions_.CreateSession(tool);
    if (created.IsErr()) {
        return Failure(created.Error());
    }
    const auto& session = created.Value();
    return {{"success", true},
            {"session_id", session->Id()},
            {"session", session->Info(session->LastActivity()).ToJson()}};
}

nlohmann::json FleetService::TerminateSession(const std::string& id) {
    auto terminated = sessions_.Terminate(id);
    if (terminated.IsErr()) {
        return Failure(terminated.Error());
    }
    return {{"success", true}, {"session_id", id}};
}

nlohmann::json FleetService::ListSessions() {
    auto sessions = nlohmann::json::array();
    for (const auto& info : sessions_.ListSessions()) {
        sessions.push_back(info.ToJson());
    }
    return {{"success", true}, {"sessions", sessions}};
}

} // namespace mcp_fleet
