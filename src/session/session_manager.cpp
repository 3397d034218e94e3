#include <mcp_fleet/session/session_manager.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/types.hpp>

#include <set>

namespace mcp_fleet {

namespace {

Error Expired(const std::string& id, const std::string& why) {
    return Error::Make(ErrorKind::SessionExpired, "Session", "Session '" + id + "' " + why);
}

void LogTransition(const SessionTransition& t) {
    LogInfo("session", "Session " + t.id + " (" + t.tool + ") " + SessionStateName(t.from) +
                           " -> " + SessionStateName(t.to));
}

} // anonymous namespace

SessionManager::SessionManager(ToolRegistry& registry, ProcessManager& processes,
                               SessionSettings settings, IClock& clock)
    : registry_(registry), processes_(processes), settings_(std::move(settings)), clock_(clock) {}

SessionManager::~SessionManager() {
    StopSweeper();
}

// ---------------------------------------------------------------------------
// State helpers (caller holds the session's mutex)
// ---------------------------------------------------------------------------
void SessionManager::Activate(Session& session, TimePoint now,
                              std::vector<SessionTransition>& events) {
    if (session.state_ != SessionState::Active) {
        events.push_back({session.id_, session.tool_, session.state_, SessionState::Active, now});
        session.state_ = SessionState::Active;
    }
    session.last_activity_ = now;
    session.last_activity_wall_ = std::chrono::system_clock::now();
}

void SessionManager::MarkTerminated(Session& session, TimePoint now,
                                    std::vector<SessionTransition>& events) {
    if (session.state_ == SessionState::Terminated) return;
    events.push_back({session.id_, session.tool_, session.state_, SessionState::Terminated, now});
    session.state_ = SessionState::Terminated;
    session.pooled_ = false;
    session.instance_.reset();
}

void SessionManager::Emit(const std::vector<SessionTransition>& events) {
    if (events.empty()) return;
    TransitionListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    for (const auto& event : events) {
        LogTransition(event);
        if (listener) listener(event);
    }
}

void SessionManager::SetTransitionListener(TransitionListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

// ---------------------------------------------------------------------------
// Table
// ---------------------------------------------------------------------------
int SessionManager::PooledCountLocked(const std::string& tool) const {
    int count = 0;
    for (const auto& [id, session] : sessions_) {
        if (session->tool_ != tool) continue;
        std::lock_guard<std::mutex> lock(session->mutex_);
        if (session->pooled_) ++count;
    }
    return count;
}

bool SessionManager::EvictPooledLocked(std::vector<SessionTransition>& events) {
    SessionPtr oldest;
    TimePoint oldest_activity = TimePoint::max();
    for (const auto& [id, session] : sessions_) {
        std::lock_guard<std::mutex> lock(session->mutex_);
        if (session->pooled_ && session->pending_ == 0 &&
            session->last_activity_ < oldest_activity) {
            oldest = session;
            oldest_activity = session->last_activity_;
        }
    }
    if (!oldest) return false;
    {
        std::lock_guard<std::mutex> lock(oldest->mutex_);
        MarkTerminated(*oldest, clock_.Now(), events);
    }
    sessions_.erase(oldest->id_);
    return true;
}

Result<SessionPtr, Error> SessionManager::CreateSession(const std::string& tool) {
    if (!registry_.Contains(tool)) {
        return Result<SessionPtr, Error>::Err(
            Error::Make(ErrorKind::ToolUnavailable, "CreateSession", "Unknown tool", tool));
    }

    std::vector<SessionTransition> events;
    SessionPtr result;
    {
        std::unique_lock<std::mutex> lock(table_mutex_);
        const auto now = clock_.Now();

        for (const auto& [id, session] : sessions_) {
            if (session->tool_ != tool) continue;
            std::lock_guard<std::mutex> session_lock(session->mutex_);
            if (session->pooled_ && session->pending_ == 0 &&
                session->state_ != SessionState::Terminated) {
                session->pooled_ = false;
                Activate(*session, now, events);
                result = session;
                break;
            }
        }

        if (!result) {
            const auto deadline = SteadyClock::now() + settings_.acquire_timeout;
            while (static_cast<int>(sessions_.size()) >= settings_.max_concurrent_sessions) {
                if (EvictPooledLocked(events)) continue;
                if (capacity_cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
                    static_cast<int>(sessions_.size()) >= settings_.max_concurrent_sessions) {
                    lock.unlock();
                    Emit(events);
                    return Result<SessionPtr, Error>::Err(Error::Make(
                        ErrorKind::ToolUnavailable, "CreateSession",
                        "Session limit reached (" +
                            std::to_string(settings_.max_concurrent_sessions) + ")",
                        tool));
                }
            }
            result = std::make_shared<Session>(NewId("sess-"), tool, clock_.Now());
            sessions_.emplace(result->Id(), result);
            LogDebug("session", "Created session " + result->Id() + " for '" + tool + "'");
        }
    }
    Emit(events);
    return Result<SessionPtr, Error>::Ok(std::move(result));
}

Result<SessionPtr, Error> SessionManager::GetSession(const std::string& id) const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Result<SessionPtr, Error>::Err(Expired(id, "is unknown or has expired"));
    }
    return Result<SessionPtr, Error>::Ok(it->second);
}

Result<void, Error> SessionManager::Terminate(const std::string& id) {
    std::vector<SessionTransition> events;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return Result<void, Error>::Err(Expired(id, "is unknown or has expired"));
        }
        {
            std::lock_guard<std::mutex> session_lock(it->second->mutex_);
            MarkTerminated(*it->second, clock_.Now(), events);
        }
        sessions_.erase(it);
    }
    capacity_cv_.notify_all();
    Emit(events);
    return Result<void, Error>::Ok();
}

std::vector<SessionInfo> SessionManager::ListSessions() const {
    std::vector<SessionPtr> sessions;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        for (const auto& [id, session] : sessions_) sessions.push_back(session);
    }
    const auto now = clock_.Now();
    std::vector<SessionInfo> out;
    out.reserve(sessions.size());
    for (const auto& session : sessions) {
        out.push_back(session->Info(now));
    }
    return out;
}

std::size_t SessionManager::Count() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return sessions_.size();
}

// ---------------------------------------------------------------------------
// Call lifecycle
// ---------------------------------------------------------------------------
Result<SessionPtr, Error> SessionManager::BeginCall(
    const std::string& tool, const std::optional<std::string>& session_id) {
    SessionPtr session;
    if (session_id) {
        auto found = GetSession(*session_id);
        if (found.IsErr()) {
            return found;
        }
        session = std::move(found).Value();
        if (session->Tool() != tool) {
            return Result<SessionPtr, Error>::Err(Error::Make(
                ErrorKind::Config, "BeginCall",
                "Session '" + session->Id() + "' is bound to tool '" + session->Tool() + "'",
                tool));
        }
    } else {
        auto created = CreateSession(tool);
        if (created.IsErr()) {
            return created;
        }
        session = std::move(created).Value();
    }

    const auto now = clock_.Now();
    std::vector<SessionTransition> events;
    bool expired = false;
    {
        std::lock_guard<std::mutex> lock(session->mutex_);
        if (session->state_ == SessionState::Terminated) {
            expired = true;
        } else if (now - session->created_ >= settings_.max_session_lifetime) {
            MarkTerminated(*session, now, events);
            expired = true;
        } else {
            Activate(*session, now, events);
            session->pooled_ = false;
            ++session->pending_;
        }
    }
    if (expired) {
        {
            std::lock_guard<std::mutex> lock(table_mutex_);
            sessions_.erase(session->Id());
        }
        capacity_cv_.notify_all();
        Emit(events);
        return Result<SessionPtr, Error>::Err(Expired(session->Id(), "has expired"));
    }
    Emit(events);
    return Result<SessionPtr, Error>::Ok(std::move(session));
}

void SessionManager::Bind(const SessionPtr& session, InstancePtr instance) {
    std::lock_guard<std::mutex> lock(session->mutex_);
    if (session->state_ == SessionState::Terminated) return;
    session->instance_ = std::move(instance);
}

void SessionManager::EndCall(const SessionPtr& session, bool release_to_pool) {
    const auto now = clock_.Now();
    {
        std::lock_guard<std::mutex> lock(session->mutex_);
        if (session->pending_ > 0) --session->pending_;
        session->last_activity_ = now;
        session->last_activity_wall_ = std::chrono::system_clock::now();
        if (!release_to_pool || session->state_ == SessionState::Terminated) {
            return;
        }
    }

    std::vector<SessionTransition> events;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        if (PooledCountLocked(session->Tool()) >= settings_.session_pool_size) {
            {
                std::lock_guard<std::mutex> session_lock(session->mutex_);
                if (session->pending_ > 0) return;
                MarkTerminated(*session, now, events);
            }
            sessions_.erase(session->Id());
        } else {
            std::lock_guard<std::mutex> session_lock(session->mutex_);
            session->pooled_ = true;
        }
    }
    // A pooled session is evictable, so waiters for capacity can proceed.
    capacity_cv_.notify_all();
    Emit(events);
}

Result<void, Error> SessionManager::WakeUp(const std::string& id) {
    auto found = GetSession(id);
    if (found.IsErr()) {
        return Result<void, Error>::Err(found.Error());
    }
    auto session = std::move(found).Value();
    std::vector<SessionTransition> events;
    {
        std::lock_guard<std::mutex> lock(session->mutex_);
        if (session->state_ == SessionState::Terminated) {
            return Result<void, Error>::Err(Expired(id, "has been terminated"));
        }
        Activate(*session, clock_.Now(), events);
    }
    Emit(events);
    return Result<void, Error>::Ok();
}

GatePtr SessionManager::GateFor(const std::string& tool) {
    auto def = registry_.Get(tool);
    const int limit = def ? def->ConcurrencyLimit(settings_.default_concurrency_limit) : 1;

    std::lock_guard<std::mutex> lock(gates_mutex_);
    auto& gate = gates_[tool];
    if (!gate) {
        gate = std::make_shared<ConcurrencyGate>(limit);
    } else if (gate->Limit() != limit) {
        gate->SetLimit(limit);
    }
    return gate;
}

void SessionManager::UnbindTool(const std::string& tool) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    for (const auto& [id, session] : sessions_) {
        if (session->tool_ != tool) continue;
        std::lock_guard<std::mutex> session_lock(session->mutex_);
        session->instance_.reset();
    }
}

// ---------------------------------------------------------------------------
// Sweep
// ---------------------------------------------------------------------------
std::vector<SessionTransition> SessionManager::Sweep() {
    const auto now = clock_.Now();
    std::vector<SessionPtr> sessions;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        for (const auto& [id, session] : sessions_) sessions.push_back(session);
    }

    std::vector<SessionTransition> events;
    std::vector<std::string> expired;
    std::set<std::string> hibernated_tools;

    for (const auto& session : sessions) {
        std::lock_guard<std::mutex> lock(session->mutex_);
        if (session->state_ == SessionState::Terminated) continue;

        if (now - session->created_ >= settings_.max_session_lifetime) {
            MarkTerminated(*session, now, events);
            expired.push_back(session->id_);
            continue;
        }
        if (session->pending_ > 0) continue;

        const auto idle = now - session->last_activity_;
        if (session->state_ == SessionState::Active && idle >= settings_.idle_timeout) {
            events.push_back({session->id_, session->tool_, SessionState::Active,
                              SessionState::Idle, now});
            session->state_ = SessionState::Idle;
        }
        if (session->state_ == SessionState::Idle && idle >= settings_.hibernation_timeout) {
            events.push_back({session->id_, session->tool_, SessionState::Idle,
                              SessionState::Hibernating, now});
            session->state_ = SessionState::Hibernating;
            session->instance_.reset();
            hibernated_tools.insert(session->tool_);
        }
    }

    if (!expired.empty()) {
        {
            std::lock_guard<std::mutex> lock(table_mutex_);
            for (const auto& id : expired) sessions_.erase(id);
        }
        capacity_cv_.notify_all();
    }

    if (settings_.stop_instance_on_hibernate) {
        for (const auto& tool : hibernated_tools) {
            bool awake = false;
            {
                std::lock_guard<std::mutex> lock(table_mutex_);
                for (const auto& [id, session] : sessions_) {
                    if (session->tool_ != tool) continue;
                    const auto state = session->State();
                    if (state == SessionState::Active || state == SessionState::Idle) {
                        awake = true;
                        break;
                    }
                }
            }
            if (awake) continue;
            LogInfo("session", "All sessions of '" + tool + "' hibernating; stopping instance");
            auto stopped = processes_.Stop(tool, true);
            if (stopped.IsErr()) {
                LogWarn("session", stopped.Error().ToString());
            }
        }
    }

    Emit(events);
    return events;
}

void SessionManager::StartSweeper() {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    if (sweeper_.joinable()) return;
    sweeper_stop_ = false;
    sweeper_ = std::thread([this] {
        std::unique_lock<std::mutex> lock(sweeper_mutex_);
        while (!sweeper_cv_.wait_for(lock, settings_.sweep_interval,
                                     [this] { return sweeper_stop_; })) {
            lock.unlock();
            Sweep();
            lock.lock();
        }
    });
}

void SessionManager::StopSweeper() {
    std::thread sweeper;
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = true;
        sweeper.swap(sweeper_);
    }
    sweeper_cv_.notify_all();
    if (sweeper.joinable()) {
        sweeper.join();
    }
}

} // namespace mcp_fleet
