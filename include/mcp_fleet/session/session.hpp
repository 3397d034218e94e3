#pragma once

#include <mcp_fleet/core/clock.hpp>
#include <mcp_fleet/process/tool_instance.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

enum class SessionState {
    Active,
    Idle,
    Hibernating,
    Terminated,
};

const char* SessionStateName(SessionState state);

// One lifecycle step, as emitted by the sweep (and by wake-up/terminate).
struct SessionTransition {
    std::string id;
    std::string tool;
    SessionState from = SessionState::Active;
    SessionState to = SessionState::Active;
    TimePoint at{};

    [[nodiscard]] nlohmann::json ToJson() const;
};

// Reporting snapshot of a session.
struct SessionInfo {
    std::string id;
    std::string tool;
    SessionState state = SessionState::Active;
    std::chrono::system_clock::time_point created;
    std::chrono::system_clock::time_point last_activity;
    Millis idle{0};
    int pending = 0;
    bool pooled = false;
    std::optional<pid_t> instance_pid;

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// Session: a caller's binding to one tool.
//
// All fields are guarded by the session's own mutex; SessionManager is the
// only writer. The bound instance is dropped as soon as it stops being
// RUNNING, so a caller never sees a dead binding.
// ---------------------------------------------------------------------------
class Session {
public:
    Session(std::string id, std::string tool, TimePoint now);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const std::string& Id() const noexcept { return id_; }
    [[nodiscard]] const std::string& Tool() const noexcept { return tool_; }

    [[nodiscard]] SessionState State() const;
    [[nodiscard]] int Pending() const;
    [[nodiscard]] bool Pooled() const;
    [[nodiscard]] TimePoint CreatedAt() const noexcept { return created_; }
    [[nodiscard]] TimePoint LastActivity() const;

    /// Bound instance if it is still RUNNING, else null.
    [[nodiscard]] InstancePtr Instance() const;

    [[nodiscard]] SessionInfo Info(TimePoint now) const;

private:
    friend class SessionManager;

    const std::string id_;
    const std::string tool_;
    const TimePoint created_;
    const std::chrono::system_clock::time_point created_wall_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Active;
    TimePoint last_activity_;
    std::chrono::system_clock::time_point last_activity_wall_;
    int pending_ = 0;
    bool pooled_ = false;
    mutable InstancePtr instance_;
};

using SessionPtr = std::shared_ptr<Session>;

} // namespace mcp_fleet
