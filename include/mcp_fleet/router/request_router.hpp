#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/process/process_manager.hpp>
#include <mcp_fleet/registry/tool_registry.hpp>
#include <mcp_fleet/session/session_manager.hpp>
#include <mcp_fleet/transport/request_envelope.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

struct CallResult {
    nlohmann::json result;
    Millis execution_time{0};
    std::string session_id;
    int attempts = 1;
};

// ---------------------------------------------------------------------------
// RequestRouter: the single entry point for tool calls.
//
// Resolves the session, makes sure a RUNNING instance is bound (starting
// it when auto_start is on, recovering it when it is in ERROR), waits for
// the tool's concurrency gate and sends the call. Crashes and timeouts
// are retried up to retry_count times against a restarted instance;
// every other error is returned as is.
// ---------------------------------------------------------------------------
class RequestRouter {
public:
    /// Sees the final outcome of every call: `error` is null on success.
    using CallObserver =
        std::function<void(const std::string& tool, Millis latency, const Error* error)>;

    RequestRouter(ToolRegistry& registry, ProcessManager& processes, SessionManager& sessions,
                  RouterSettings settings);

    Result<CallResult, Error> Call(const std::string& tool, const std::string& method,
                                   nlohmann::json params,
                                   const std::optional<std::string>& session_id = std::nullopt,
                                   std::optional<Millis> timeout = std::nullopt,
                                   RequestOrigin origin = RequestOrigin::Api);

    void SetCallObserver(CallObserver observer);

    [[nodiscard]] const RouterSettings& Settings() const noexcept { return settings_; }

private:
    Result<CallResult, Error> Dispatch(const std::string& tool, const std::string& method,
                                       const nlohmann::json& params, const SessionPtr& session,
                                       TimePoint deadline, RequestOrigin origin);
    Result<InstancePtr, Error> ResolveInstance(const std::string& tool, const SessionPtr& session,
                                               TimePoint deadline);
    void Observe(const std::string& tool, Millis latency, const Error* error);

    ToolRegistry& registry_;
    ProcessManager& processes_;
    SessionManager& sessions_;
    const RouterSettings settings_;

    std::mutex observer_mutex_;
    CallObserver observer_;
};

} // namespace mcp_fleet
