#include <mcp_fleet/router/request_router.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/session/concurrency_gate.hpp>

#include <algorithm>

namespace mcp_fleet {

namespace {

// Ends the session's pending call on every exit path.
class CallScope {
public:
    CallScope(SessionManager& sessions, SessionPtr session, bool release_to_pool)
        : sessions_(sessions), session_(std::move(session)), release_(release_to_pool) {}
    ~CallScope() { sessions_.EndCall(session_, release_); }

    CallScope(const CallScope&) = delete;
    CallScope& operator=(const CallScope&) = delete;

private:
    SessionManager& sessions_;
    SessionPtr session_;
    bool release_;
};

} // anonymous namespace

RequestRouter::RequestRouter(ToolRegistry& registry, ProcessManager& processes,
                             SessionManager& sessions, RouterSettings settings)
    : registry_(registry),
      processes_(processes),
      sessions_(sessions),
      settings_(std::move(settings)) {}

void RequestRouter::SetCallObserver(CallObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(observer);
}

void RequestRouter::Observe(const std::string& tool, Millis latency, const Error* error) {
    CallObserver observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) observer(tool, latency, error);
}

Result<CallResult, Error> RequestRouter::Call(const std::string& tool, const std::string& method,
                                              nlohmann::json params,
                                              const std::optional<std::string>& session_id,
                                              std::optional<Millis> timeout,
                                              RequestOrigin origin) {
    const auto started = SteadyClock::now();
    const auto deadline = started + timeout.value_or(settings_.request_timeout);

    if (!registry_.Contains(tool)) {
        return Result<CallResult, Error>::Err(
            Error::Make(ErrorKind::ToolUnavailable, method, "Unknown tool", tool));
    }
    if (params.is_null()) {
        params = nlohmann::json::object();
    }

    auto begun = sessions_.BeginCall(tool, session_id);
    if (begun.IsErr()) {
        return Result<CallResult, Error>::Err(begun.Error());
    }
    auto session = std::move(begun).Value();

    auto result = [&] {
        CallScope scope(sessions_, session, !session_id.has_value());
        return Dispatch(tool, method, params, session, deadline, origin);
    }();

    const auto elapsed = ToMillis(SteadyClock::now() - started);
    if (result.IsErr()) {
        LogDebug("router", "Call " + tool + "." + method + " failed after " +
                               std::to_string(elapsed.count()) + " ms: " +
                               result.Error().ToString());
        Observe(tool, elapsed, &result.Error());
        return result;
    }

    auto outcome = std::move(result).Value();
    outcome.execution_time = elapsed;
    outcome.session_id = session->Id();
    Observe(tool, elapsed, nullptr);
    return Result<CallResult, Error>::Ok(std::move(outcome));
}

Result<CallResult, Error> RequestRouter::Dispatch(const std::string& tool,
                                                  const std::string& method,
                                                  const nlohmann::json& params,
                                                  const SessionPtr& session, TimePoint deadline,
                                                  RequestOrigin origin) {
    using R = Result<CallResult, Error>;

    auto gate = sessions_.GateFor(tool);
    if (!gate->Acquire(deadline)) {
        return R::Err(Error::Make(ErrorKind::RequestTimeout, method,
                                  "Timed out waiting for a free slot on the tool", tool));
    }
    GatePass pass(gate);

    const int max_attempts = 1 + std::max(0, settings_.retry_count);
    std::optional<Error> last_error;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (SteadyClock::now() >= deadline) {
            return R::Err(Error::Make(ErrorKind::RequestTimeout, method,
                                      "Deadline passed before the call was sent", tool));
        }
        auto resolved = ResolveInstance(tool, session, deadline);
        if (resolved.IsErr()) {
            if (!resolved.Error().IsTransient()) {
                return R::Err(resolved.Error());
            }
            last_error = resolved.Error();
            continue;
        }
        auto instance = std::move(resolved).Value();

        auto envelope = RequestEnvelope::Make(method, params,
                                              ToMillis(deadline - SteadyClock::now()), origin);
        if (envelope.Expired()) {
            return R::Err(Error::Make(ErrorKind::RequestTimeout, method,
                                      "Deadline passed before the call was sent", tool));
        }

        auto sent = instance->Send(envelope);
        if (sent.IsOk()) {
            CallResult outcome;
            outcome.result = std::move(sent).Value();
            outcome.attempts = attempt;
            return R::Ok(std::move(outcome));
        }

        const auto& error = sent.Error();
        if (!error.IsTransient()) {
            return R::Err(error);
        }
        last_error = error;
        LogWarn("router", "Call " + tool + "." + method + " hit " + error.KindName() +
                              " (attempt " + std::to_string(attempt) + " of " +
                              std::to_string(max_attempts) + "): " + error.message);
        processes_.ReportFailure(tool, error);
    }

    return R::Err(Error::Make(
        ErrorKind::ToolUnavailable, method,
        "Tool unavailable after " + std::to_string(max_attempts) + " attempts" +
            (last_error ? ": " + last_error->message : std::string()),
        tool));
}

Result<InstancePtr, Error> RequestRouter::ResolveInstance(const std::string& tool,
                                                          const SessionPtr& session,
                                                          TimePoint deadline) {
    using R = Result<InstancePtr, Error>;

    if (auto bound = session->Instance()) {
        return R::Ok(bound);
    }

    Result<InstancePtr, Error> resolved = R::Err(
        Error::Make(ErrorKind::ToolUnavailable, "Resolve", "Tool is not running", tool));
    switch (processes_.State(tool)) {
        case InstanceState::Running:
            if (auto instance = processes_.Instance(tool)) {
                resolved = R::Ok(instance);
            } else {
                resolved = processes_.Start(tool);
            }
            break;
        case InstanceState::Error:
            resolved = processes_.Recover(tool, deadline);
            break;
        case InstanceState::Failed:
            resolved = R::Err(Error::Make(ErrorKind::ToolUnavailable, "Resolve",
                                          "Tool has failed and must be restarted", tool));
            break;
        case InstanceState::Stopped:
        case InstanceState::Starting:
        case InstanceState::Stopping:
            if (!settings_.auto_start) {
                return R::Err(Error::Make(ErrorKind::ToolUnavailable, "Resolve",
                                          "Tool is not running and auto_start is disabled",
                                          tool));
            }
            resolved = processes_.Start(tool);
            break;
    }

    if (resolved.IsOk()) {
        sessions_.Bind(session, resolved.Value());
    }
    return resolved;
}

} // namespace mcp_fleet
