#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/clock.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/process/process_manager.hpp>
#include <mcp_fleet/registry/tool_registry.hpp>
#include <mcp_fleet/session/concurrency_gate.hpp>
#include <mcp_fleet/session/session.hpp>

#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// SessionManager: binds callers to tools and runs the session lifecycle.
//
//   ACTIVE --idle_timeout--> IDLE --hibernation_timeout--> HIBERNATING
//   IDLE / HIBERNATING --call or wake-up--> ACTIVE
//   any --terminate or max_session_lifetime--> TERMINATED (removed)
//
// Idle time is measured from the last activity, so hibernation happens
// hibernation_timeout after the last call. Sweep() reads time from the
// injected IClock; the background sweeper only decides when to call it.
// Sessions without an explicit id are pooled per tool after each call.
// ---------------------------------------------------------------------------
class SessionManager {
public:
    using TransitionListener = std::function<void(const SessionTransition&)>;

    SessionManager(ToolRegistry& registry, ProcessManager& processes,
                   SessionSettings settings, IClock& clock = DefaultClock());
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// A pooled session for the tool if one is free, else a new ACTIVE
    /// one. Waits up to acquire_timeout for room under
    /// max_concurrent_sessions, then fails with ToolUnavailable.
    Result<SessionPtr, Error> CreateSession(const std::string& tool);

    /// SessionExpired for unknown, terminated or expired ids.
    Result<SessionPtr, Error> GetSession(const std::string& id) const;

    Result<void, Error> Terminate(const std::string& id);

    [[nodiscard]] std::vector<SessionInfo> ListSessions() const;
    [[nodiscard]] std::size_t Count() const;

    // -- call lifecycle, driven by the router --

    /// Resolve `session_id` (or take a pooled/new session), wake it up if
    /// needed and count the call as pending.
    Result<SessionPtr, Error> BeginCall(const std::string& tool,
                                        const std::optional<std::string>& session_id);

    /// Record the instance the session is now talking to.
    void Bind(const SessionPtr& session, InstancePtr instance);

    /// Finish a call. `release_to_pool` returns an implicit session to the
    /// tool's pool (or terminates it if the pool is full).
    void EndCall(const SessionPtr& session, bool release_to_pool);

    /// IDLE or HIBERNATING -> ACTIVE.
    Result<void, Error> WakeUp(const std::string& id);

    /// Gate shared by every session of `tool`.
    GatePtr GateFor(const std::string& tool);

    /// Drop every binding to `tool`'s current instance.
    void UnbindTool(const std::string& tool);

    // -- lifecycle sweep --

    std::vector<SessionTransition> Sweep();
    void StartSweeper();
    void StopSweeper();

    void SetTransitionListener(TransitionListener listener);

    [[nodiscard]] const SessionSettings& Settings() const noexcept { return settings_; }

private:
    // Requires table_mutex_.
    bool EvictPooledLocked(std::vector<SessionTransition>& events);
    int PooledCountLocked(const std::string& tool) const;

    static void Activate(Session& session, TimePoint now, std::vector<SessionTransition>& events);
    static void MarkTerminated(Session& session, TimePoint now,
                               std::vector<SessionTransition>& events);
    void Emit(const std::vector<SessionTransition>& events);

    ToolRegistry& registry_;
    ProcessManager& processes_;
    const SessionSettings settings_;
    IClock& clock_;

    mutable std::mutex table_mutex_;
    std::condition_variable capacity_cv_;
    std::map<std::string, SessionPtr> sessions_;

    std::mutex gates_mutex_;
    std::map<std::string, GatePtr> gates_;

    std::mutex listener_mutex_;
    TransitionListener listener_;

    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool sweeper_stop_ = false;
    std::thread sweeper_;
};

} // namespace mcp_fleet
