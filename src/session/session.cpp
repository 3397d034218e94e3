#include <mcp_fleet/session/session.hpp>

#include <mcp_fleet/core/types.hpp>

namespace mcp_fleet {

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Active:      return "ACTIVE";
        case SessionState::Idle:        return "IDLE";
        case SessionState::Hibernating: return "HIBERNATING";
        case SessionState::Terminated:  return "TERMINATED";
    }
    return "ACTIVE";
}

nlohmann::json SessionTransition::ToJson() const {
    return {
        {"id", id},
        {"tool", tool},
        {"from", SessionStateName(from)},
        {"to", SessionStateName(to)},
    };
}

nlohmann::json SessionInfo::ToJson() const {
    nlohmann::json j = {
        {"id", id},
        {"tool", tool},
        {"state", SessionStateName(state)},
        {"created", FormatIso8601(created)},
        {"last_activity", FormatIso8601(last_activity)},
        {"idle_seconds", static_cast<double>(idle.count()) / 1000.0},
        {"pending", pending},
        {"pooled", pooled},
    };
    if (instance_pid) {
        j["instance_pid"] = *instance_pid;
    }
    return j;
}

Session::Session(std::string id, std::string tool, TimePoint now)
    : id_(std::move(id)),
      tool_(std::move(tool)),
      created_(now),
      created_wall_(std::chrono::system_clock::now()),
      last_activity_(now),
      last_activity_wall_(created_wall_) {}

SessionState Session::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int Session::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

bool Session::Pooled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pooled_;
}

TimePoint Session::LastActivity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

InstancePtr Session::Instance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (instance_ && instance_->State() != InstanceState::Running) {
        instance_.reset();
    }
    return instance_;
}

SessionInfo Session::Info(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionInfo info;
    info.id = id_;
    info.tool = tool_;
    info.state = state_;
    info.created = created_wall_;
    info.last_activity = last_activity_wall_;
    info.idle = pending_ > 0 ? Millis(0) : ToMillis(now - last_activity_);
    if (info.idle.count() < 0) info.idle = Millis(0);
    info.pending = pending_;
    info.pooled = pooled_;
    if (instance_ && instance_->State() == InstanceState::Running && instance_->Pid() > 0) {
        info.instance_pid = instance_->Pid();
    }
    return info;
}

} // namespace mcp_fleet
