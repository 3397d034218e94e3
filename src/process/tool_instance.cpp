#include <mcp_fleet/process/tool_instance.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/transport/jsonrpc.hpp>

#include <algorithm>
#include <thread>

namespace mcp_fleet {

namespace {

constexpr Millis kReadinessPollInterval{200};
constexpr Millis kReadinessAttemptTimeout{1000};
constexpr Millis kVoluntaryExitWait{1000};
constexpr std::size_t kStartupTailLines = 5;

Millis Remaining(TimePoint deadline) {
    auto left = ToMillis(deadline - SteadyClock::now());
    return left.count() > 0 ? left : Millis(0);
}

} // anonymous namespace

const char* InstanceStateName(InstanceState state) {
    switch (state) {
        case InstanceState::Stopped:  return "STOPPED";
        case InstanceState::Starting: return "STARTING";
        case InstanceState::Running:  return "RUNNING";
        case InstanceState::Stopping: return "STOPPING";
        case InstanceState::Error:    return "ERROR";
        case InstanceState::Failed:   return "FAILED";
    }
    return "STOPPED";
}

// ---------------------------------------------------------------------------
// OutputLog
// ---------------------------------------------------------------------------
void OutputLog::Append(std::string stream, std::string text) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.Push(OutputLine{std::chrono::system_clock::now(), std::move(stream), std::move(text)});
}

std::vector<OutputLine> OutputLog::Tail(std::size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.Tail(n);
}

nlohmann::json OutputLog::TailJson(std::size_t n) const {
    auto out = nlohmann::json::array();
    for (const auto& line : Tail(n)) {
        out.push_back({{"stream", line.stream}, {"text", line.text}});
    }
    return out;
}

// ---------------------------------------------------------------------------
// ToolInstance
// ---------------------------------------------------------------------------
ToolInstance::ToolInstance(ToolDefinitionPtr definition, std::shared_ptr<OutputLog> output)
    : definition_(std::move(definition)), output_(std::move(output)) {
    if (!output_) {
        output_ = std::make_shared<OutputLog>();
    }
}

ToolInstance::~ToolInstance() {
    // Connection-loss callbacks from here on must not report a crash.
    SetState(InstanceState::Stopping);
    Shutdown(false, Millis(0));
}

Millis ToolInstance::Uptime() const {
    if (State() != InstanceState::Running) {
        return Millis(0);
    }
    return ToMillis(SteadyClock::now() - started_at_);
}

std::optional<Error> ToolInstance::LastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void ToolInstance::SetLastError(const Error& error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = error;
}

bool ToolInstance::MarkCrashed(const Error& error) {
    if (!CompareAndSetState(InstanceState::Running, InstanceState::Error)) {
        return false;
    }
    SetLastError(error);
    LogWarn("process", "Tool '" + Name() + "' crashed: " + error.message);
    return true;
}

void ToolInstance::OnConnectionLost(const std::string& reason) {
    auto message = reason;
    if (child_ && !child_->Alive()) {
        if (auto exit = child_->ExitDescription()) {
            message += " (" + *exit + ")";
        }
    }
    auto error = Error::Make(ErrorKind::ProcessCrash, "Monitor", message, Name());
    if (MarkCrashed(error) && on_crash_) {
        on_crash_(Name(), error);
    }
}

bool ToolInstance::ProcessAlive() {
    if (child_) {
        return child_->Alive();
    }
    std::shared_lock<std::shared_mutex> lock(bridge_mutex_);
    return bridge_ && bridge_->IsOpen();
}

Error ToolInstance::StartupFailure(ErrorKind kind, const std::string& message) {
    auto text = message;
    if (child_ && !child_->Alive()) {
        if (auto exit = child_->ExitDescription()) {
            text += " (" + *exit + ")";
        }
    }
    const auto tail = output_->Tail(kStartupTailLines);
    if (!tail.empty()) {
        text += "; last output:";
        for (const auto& line : tail) {
            text += "\n  [" + line.stream + "] " + line.text;
        }
    }
    return Error::Make(kind, "Start", text, Name());
}

void ToolInstance::StartOutputReader(UniqueFd fd, const std::string& stream) {
    if (!fd) return;
    auto output = output_;
    const auto tag = "tool:" + Name();
    auto reader = std::make_unique<LineReader>(
        std::move(fd), stream + ":" + Name(),
        [output, stream, tag](std::string line) {
            LogDebug(tag, line);
            output->Append(stream, std::move(line));
        },
        nullptr);
    reader->Start();
    output_readers_.push_back(std::move(reader));
}

Result<void, Error> ToolInstance::Launch(const ProcessSettings& settings, CrashCallback on_crash) {
    on_crash_ = std::move(on_crash);
    const auto& def = *definition_;
    const auto timeout = def.startup_timeout.count() > 0 ? def.startup_timeout
                                                         : settings.startup_timeout;
    const auto deadline = SteadyClock::now() + timeout;

    if (def.NeedsProcess()) {
        SpawnOptions options{def.command, def.args, def.env, def.working_directory};
        auto spawned = ChildProcess::Spawn(options, def.name);
        if (spawned.IsErr()) {
            SetLastError(spawned.Error());
            return Result<void, Error>::Err(spawned.Error());
        }
        child_ = std::move(spawned).Value();
        pid_ = child_->Pid();
        StartOutputReader(child_->TakeStderr(), "stderr");
    }

    Result<void, Error> ready = Result<void, Error>::Ok();
    switch (def.connection_type) {
        case ConnectionType::Stdio:
            ready = ConnectStdio(deadline);
            break;
        case ConnectionType::Http:
            if (child_) StartOutputReader(child_->TakeStdout(), "stdout");
            ready = ConnectHttp(deadline);
            break;
        case ConnectionType::WebSocket:
            if (child_) StartOutputReader(child_->TakeStdout(), "stdout");
            ready = ConnectWebSocket(deadline);
            break;
    }

    if (ready.IsErr()) {
        SetLastError(ready.Error());
        return ready;
    }
    started_at_ = SteadyClock::now();
    return Result<void, Error>::Ok();
}

Result<void, Error> ToolInstance::ConnectStdio(TimePoint deadline) {
    if (!child_) {
        return Result<void, Error>::Err(
            StartupFailure(ErrorKind::ProcessStart, "stdio tool has no process"));
    }

    StdioTransport::Callbacks callbacks;
    auto output = output_;
    callbacks.on_output = [output](const std::string& line) { output->Append("stdout", line); };
    callbacks.on_eof = [this] { OnConnectionLost("Tool closed its stdout"); };

    auto transport = std::make_unique<StdioTransport>(
        Name(), child_->TakeStdin(), child_->TakeStdout(), std::move(callbacks));
    {
        std::unique_lock<std::shared_mutex> lock(bridge_mutex_);
        bridge_ = std::make_unique<TransportBridge>(std::move(transport));
    }
    return Handshake(deadline);
}

Result<void, Error> ToolInstance::ConnectHttp(TimePoint deadline) {
    const auto& def = *definition_;
    auto transport = std::make_unique<HttpTransport>(def.name, def.host, def.port,
                                                     def.endpoint_path);
    auto* http = transport.get();
    {
        std::unique_lock<std::shared_mutex> lock(bridge_mutex_);
        bridge_ = std::make_unique<TransportBridge>(std::move(transport));
    }

    std::string last_failure = "no response";
    while (SteadyClock::now() < deadline) {
        if (child_ && !child_->Alive()) {
            return Result<void, Error>::Err(
                StartupFailure(ErrorKind::ProcessStart, "Tool exited during startup"));
        }

        const auto attempt = std::min(kReadinessAttemptTimeout, Remaining(deadline));
        auto health = http->CheckHealth(attempt);
        if (health.IsOk()) {
            return Result<void, Error>::Ok();
        }
        last_failure = health.Error().message;

        // No /health route: an initialize round trip also proves readiness.
        auto envelope = RequestEnvelope::Make("initialize", jsonrpc::InitializeParams(),
                                              std::min(kReadinessAttemptTimeout,
                                                       Remaining(deadline)));
        auto init = http->Send(envelope);
        if (init.IsOk()) {
            if (init.Value().is_object()) {
                capabilities_ = init.Value().value("capabilities", nlohmann::json::object());
                server_info_ = init.Value().value("serverInfo", nlohmann::json::object());
            }
            return Result<void, Error>::Ok();
        }
        last_failure = init.Error().message;
        std::this_thread::sleep_for(std::min(kReadinessPollInterval, Remaining(deadline)));
    }
    return Result<void, Error>::Err(StartupFailure(
        ErrorKind::ProcessTimeout, "Not ready before startup_timeout: " + last_failure));
}

Result<void, Error> ToolInstance::ConnectWebSocket(TimePoint deadline) {
    const auto& def = *definition_;
    std::string last_failure = "no connection";

    while (SteadyClock::now() < deadline) {
        if (child_ && !child_->Alive()) {
            return Result<void, Error>::Err(
                StartupFailure(ErrorKind::ProcessStart, "Tool exited during startup"));
        }

        auto connected = WebSocketTransport::Connect(
            def.name, def.host, def.port, def.endpoint_path,
            std::min(kReadinessAttemptTimeout, Remaining(deadline)),
            [this] { OnConnectionLost("WebSocket connection lost"); });
        if (connected.IsOk()) {
            {
                std::unique_lock<std::shared_mutex> lock(bridge_mutex_);
                bridge_ = std::make_unique<TransportBridge>(std::move(connected).Value());
            }
            return Handshake(deadline);
        }
        last_failure = connected.Error().message;
        if (connected.Error().kind == ErrorKind::Config) {
            return Result<void, Error>::Err(connected.Error());
        }
        std::this_thread::sleep_for(std::min(kReadinessPollInterval, Remaining(deadline)));
    }
    return Result<void, Error>::Err(StartupFailure(
        ErrorKind::ProcessTimeout, "Not ready before startup_timeout: " + last_failure));
}

Result<void, Error> ToolInstance::Handshake(TimePoint deadline) {
    auto envelope = RequestEnvelope::Make("initialize", jsonrpc::InitializeParams(),
                                          Remaining(deadline));
    Result<nlohmann::json, Error> result = Result<nlohmann::json, Error>::Err(
        Error::Make(ErrorKind::Internal, "initialize", "no transport", Name()));
    {
        std::shared_lock<std::shared_mutex> lock(bridge_mutex_);
        if (bridge_) {
            result = bridge_->Send(envelope);
        }
    }

    if (result.IsErr()) {
        const auto& error = result.Error();
        switch (error.kind) {
            case ErrorKind::RequestTimeout:
                return Result<void, Error>::Err(StartupFailure(
                    ErrorKind::ProcessTimeout,
                    "initialize handshake did not complete before startup_timeout"));
            case ErrorKind::ProcessCrash:
                return Result<void, Error>::Err(StartupFailure(
                    ErrorKind::ProcessStart, "Tool exited during initialize"));
            default:
                return Result<void, Error>::Err(StartupFailure(
                    ErrorKind::ProcessStart, "initialize rejected: " + error.message));
        }
    }

    if (result.Value().is_object()) {
        capabilities_ = result.Value().value("capabilities", nlohmann::json::object());
        server_info_ = result.Value().value("serverInfo", nlohmann::json::object());
    }

    std::shared_lock<std::shared_mutex> lock(bridge_mutex_);
    auto notified = bridge_->Notify("notifications/initialized");
    if (notified.IsErr()) {
        return Result<void, Error>::Err(StartupFailure(
            ErrorKind::ProcessStart, "Cannot confirm initialize: " + notified.Error().message));
    }
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> ToolInstance::Send(RequestEnvelope& envelope) {
    const auto state = State();
    if (state != InstanceState::Running) {
        // A crash noticed by another caller is still a crash for this one.
        const auto kind =
            state == InstanceState::Error ? ErrorKind::ProcessCrash : ErrorKind::ToolUnavailable;
        return Result<nlohmann::json, Error>::Err(Error::Make(
            kind, envelope.method, std::string("Tool is ") + InstanceStateName(state), Name()));
    }

    Result<nlohmann::json, Error> result = Result<nlohmann::json, Error>::Err(
        Error::Make(ErrorKind::ToolUnavailable, envelope.method, "No connection", Name()));
    {
        std::shared_lock<std::shared_mutex> lock(bridge_mutex_);
        if (bridge_) {
            result = bridge_->Send(envelope);
        }
    }

    // Network tools only notice a dead peer when a call fails.
    if (result.IsErr() && result.Error().kind == ErrorKind::ProcessCrash &&
        definition_->connection_type != ConnectionType::Stdio) {
        OnConnectionLost(result.Error().message);
    }
    return result;
}

void ToolInstance::Shutdown(bool graceful, Millis grace) {
    {
        std::shared_lock<std::shared_mutex> lock(bridge_mutex_);
        if (bridge_) {
            bridge_->Close();
        }
    }

    if (child_) {
        if (graceful) {
            // Closed stdin is the polite stop signal for stdio servers.
            if (!child_->WaitFor(std::min(grace, kVoluntaryExitWait))) {
                child_->Terminate(grace);
            }
        } else {
            child_->Kill();
        }
        if (auto exit = child_->ExitDescription()) {
            LogDebug("process", "Tool '" + Name() + "' (pid " + std::to_string(pid_) +
                                    ") ended: " + *exit);
        }
    }

    for (auto& reader : output_readers_) {
        reader->Stop();
    }
    output_readers_.clear();

    std::unique_lock<std::shared_mutex> lock(bridge_mutex_);
    bridge_.reset();
}

} // namespace mcp_fleet
