#include <mcp_fleet/process/process_manager.hpp>

#include <mcp_fleet/core/log.hpp>

namespace mcp_fleet {

namespace {

constexpr std::size_t kStatusOutputLines = 20;

Error UnknownTool(const std::string& operation, const std::string& name) {
    return Error::Make(ErrorKind::ToolUnavailable, operation, "Unknown tool", name);
}

double Seconds(Millis ms) {
    return static_cast<double>(ms.count()) / 1000.0;
}

} // anonymous namespace

nlohmann::json InstanceStatus::ToJson() const {
    nlohmann::json j = {
        {"name", name},
        {"state", InstanceStateName(state)},
        {"uptime", Seconds(uptime)},
        {"restart_count", restart_count},
        {"capabilities", capabilities},
        {"recent_output", recent_output},
    };
    j["pid"] = pid > 0 ? nlohmann::json(pid) : nlohmann::json();
    j["last_error"] = last_error ? last_error->ToJson() : nlohmann::json();
    if (!server_info.empty()) {
        j["server_info"] = server_info;
    }
    return j;
}

ProcessManager::ProcessManager(ToolRegistry& registry, ProcessSettings settings)
    : registry_(registry), settings_(std::move(settings)) {}

ProcessManager::~ProcessManager() {
    Shutdown();
}

void ProcessManager::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(recovery_mutex_);
        stopping_ = true;
    }
    recovery_cv_.notify_all();

    StopAll();

    std::map<std::string, std::shared_ptr<Recovery>> recoveries;
    {
        std::lock_guard<std::mutex> lock(recovery_mutex_);
        recoveries.swap(recoveries_);
    }
    for (auto& [name, recovery] : recoveries) {
        if (recovery->thread.joinable()) {
            recovery->thread.join();
        }
    }
    // A recovery may have restarted a tool while StopAll ran.
    StopAll();
}

// ---------------------------------------------------------------------------
// Records
// ---------------------------------------------------------------------------
ProcessManager::RecordPtr ProcessManager::FindRecord(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(records_mutex_);
    auto it = records_.find(name);
    return it == records_.end() ? nullptr : it->second;
}

ProcessManager::RecordPtr ProcessManager::RecordFor(const std::string& name) {
    if (auto existing = FindRecord(name)) {
        return existing;
    }
    std::unique_lock<std::shared_mutex> lock(records_mutex_);
    auto& slot = records_[name];
    if (!slot) {
        slot = std::make_shared<Record>(name);
    }
    return slot;
}

InstanceState ProcessManager::StateOf(const Record& record) {
    std::lock_guard<std::mutex> lock(record.mutex);
    if (record.instance) {
        return record.instance->State();
    }
    return record.failed ? InstanceState::Failed : InstanceState::Stopped;
}

// ---------------------------------------------------------------------------
// Slots
// ---------------------------------------------------------------------------
bool ProcessManager::ReserveSlot() {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    if (reserved_slots_ >= settings_.max_processes) {
        return false;
    }
    ++reserved_slots_;
    return true;
}

void ProcessManager::ReleaseSlot(Record& record) {
    {
        std::lock_guard<std::mutex> lock(record.mutex);
        if (!record.holds_slot) return;
        record.holds_slot = false;
    }
    std::lock_guard<std::mutex> lock(slots_mutex_);
    --reserved_slots_;
}

int ProcessManager::ReservedSlots() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return reserved_slots_;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
Result<InstancePtr, Error> ProcessManager::Start(const std::string& name) {
    auto def = registry_.Get(name);
    if (!def) {
        return Result<InstancePtr, Error>::Err(UnknownTool("Start", name));
    }
    auto record = RecordFor(name);
    std::lock_guard<std::mutex> transition(record->transition);

    switch (StateOf(*record)) {
        case InstanceState::Running: {
            std::lock_guard<std::mutex> lock(record->mutex);
            return Result<InstancePtr, Error>::Ok(record->instance);
        }
        case InstanceState::Failed:
            return Result<InstancePtr, Error>::Err(Error::Make(
                ErrorKind::ToolUnavailable, "Start",
                "Tool has failed and must be reset or restarted", name));
        default:
            break;
    }

    {
        std::lock_guard<std::mutex> lock(record->mutex);
        record->attempts = 0;
    }
    return StartLocked(*record, def);
}

Result<InstancePtr, Error> ProcessManager::StartLocked(Record& record,
                                                       const ToolDefinitionPtr& def) {
    // A previous run left in ERROR is cleaned up before the new one.
    InstanceState from = InstanceState::Stopped;
    InstancePtr previous;
    {
        std::lock_guard<std::mutex> lock(record.mutex);
        previous = std::move(record.instance);
    }
    if (previous) {
        from = previous->State();
        previous->SetState(InstanceState::Stopping);
        previous->Shutdown(false, Millis(0));
        ReleaseSlot(record);
        previous->SetState(InstanceState::Stopped);
    }

    if (!ReserveSlot()) {
        auto error = Error::Make(ErrorKind::ToolUnavailable, "Start",
                                 "Process limit reached (" +
                                     std::to_string(settings_.max_processes) + ")",
                                 record.name);
        LogWarn("process", error.ToString());
        return Result<InstancePtr, Error>::Err(error);
    }

    auto instance = std::make_shared<ToolInstance>(def, record.output);
    {
        std::lock_guard<std::mutex> lock(record.mutex);
        record.instance = instance;
        record.holds_slot = true;
    }
    Notify(record.name, from, InstanceState::Starting);
    LogInfo("process", "Starting '" + record.name + "' (" +
                           ConnectionTypeName(def->connection_type) + ")");

    auto launched = instance->Launch(
        settings_, [this](const std::string& tool, const Error& error) {
            OnInstanceCrash(tool, error);
        });
    if (launched.IsErr()) {
        const auto& error = launched.Error();
        instance->SetState(InstanceState::Error);
        {
            std::lock_guard<std::mutex> lock(record.mutex);
            record.last_error = error;
        }
        Notify(record.name, InstanceState::Starting, InstanceState::Error);
        LogError("process", error.ToString());
        // The instance stays in ERROR; its process and slot are released.
        instance->Shutdown(false, Millis(0));
        ReleaseSlot(record);
        return Result<InstancePtr, Error>::Err(error);
    }

    instance->SetState(InstanceState::Running);
    Notify(record.name, InstanceState::Starting, InstanceState::Running);
    LogInfo("process", "Tool '" + record.name + "' running" +
                           (instance->Pid() > 0 ? " (pid " + std::to_string(instance->Pid()) + ")"
                                                : std::string()));
    return Result<InstancePtr, Error>::Ok(instance);
}

void ProcessManager::TeardownLocked(Record& record, bool graceful) {
    InstancePtr instance;
    {
        std::lock_guard<std::mutex> lock(record.mutex);
        instance = record.instance;
    }
    if (!instance) return;

    const auto from = instance->State();
    instance->SetState(InstanceState::Stopping);
    if (from != InstanceState::Stopping) {
        Notify(record.name, from, InstanceState::Stopping);
    }
    instance->Shutdown(graceful, settings_.shutdown_grace);
    ReleaseSlot(record);
    instance->SetState(InstanceState::Stopped);
    {
        std::lock_guard<std::mutex> lock(record.mutex);
        if (record.instance == instance) {
            record.instance.reset();
        }
    }
    Notify(record.name, InstanceState::Stopping, InstanceState::Stopped);
}

void ProcessManager::MarkFailedLocked(Record& record, const Error& cause) {
    InstancePtr instance;
    {
        std::lock_guard<std::mutex> lock(record.mutex);
        instance = record.instance;
    }
    if (instance) {
        instance->Shutdown(false, Millis(0));
        ReleaseSlot(record);
    }
    {
        std::lock_guard<std::mutex> lock(record.mutex);
        record.instance.reset();
        record.failed = true;
        record.last_error = cause;
    }
    Notify(record.name, InstanceState::Error, InstanceState::Failed);
    LogError("process", "Tool '" + record.name + "' failed permanently: " + cause.message);
}

Result<void, Error> ProcessManager::Stop(const std::string& name, bool graceful) {
    auto record = FindRecord(name);
    if (!record) {
        if (!registry_.Contains(name)) {
            return Result<void, Error>::Err(UnknownTool("Stop", name));
        }
        return Result<void, Error>::Ok();
    }

    std::lock_guard<std::mutex> transition(record->transition);
    bool running;
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        running = record->instance != nullptr;
    }
    if (!running) {
        return Result<void, Error>::Ok();
    }
    LogInfo("process", "Stopping '" + name + "'" + (graceful ? "" : " (forced)"));
    TeardownLocked(*record, graceful);
    return Result<void, Error>::Ok();
}

Result<InstancePtr, Error> ProcessManager::Restart(const std::string& name) {
    auto def = registry_.Get(name);
    if (!def) {
        return Result<InstancePtr, Error>::Err(UnknownTool("Restart", name));
    }
    auto record = RecordFor(name);
    std::lock_guard<std::mutex> transition(record->transition);

    bool was_failed;
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        was_failed = record->failed;
        record->failed = false;
        record->attempts = 0;
        ++record->restart_count;
    }
    if (was_failed) {
        Notify(name, InstanceState::Failed, InstanceState::Stopped);
    }
    LogInfo("process", "Restarting '" + name + "'");
    TeardownLocked(*record, true);
    return StartLocked(*record, def);
}

Result<void, Error> ProcessManager::Reset(const std::string& name) {
    auto record = FindRecord(name);
    if (!record) {
        if (!registry_.Contains(name)) {
            return Result<void, Error>::Err(UnknownTool("Reset", name));
        }
        return Result<void, Error>::Ok();
    }
    std::lock_guard<std::mutex> transition(record->transition);
    bool was_failed;
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        was_failed = record->failed;
        record->failed = false;
        record->attempts = 0;
    }
    if (was_failed) {
        Notify(name, InstanceState::Failed, InstanceState::Stopped);
        LogInfo("process", "Tool '" + name + "' reset");
    }
    return Result<void, Error>::Ok();
}

void ProcessManager::StopAll() {
    std::vector<RecordPtr> records;
    {
        std::shared_lock<std::shared_mutex> lock(records_mutex_);
        for (const auto& [name, record] : records_) {
            records.push_back(record);
        }
    }
    for (const auto& record : records) {
        auto stopped = Stop(record->name, true);
        if (stopped.IsErr()) {
            LogWarn("process", stopped.Error().ToString());
        }
    }
}

// ---------------------------------------------------------------------------
// Failure handling
// ---------------------------------------------------------------------------
BackoffPolicy ProcessManager::PolicyFor(const ToolDefinition& def) const {
    return BackoffPolicy(settings_.restart_delay, settings_.restart_delay_max,
                         def.max_restart_attempts);
}

Result<InstancePtr, Error> ProcessManager::Recover(const std::string& name,
                                                   std::optional<TimePoint> deadline) {
    using R = Result<InstancePtr, Error>;
    auto record = FindRecord(name);
    if (!record) {
        return R::Err(UnknownTool("Recover", name));
    }
    auto out_of_time = [&name](const std::string& message) {
        return R::Err(Error::Make(ErrorKind::RequestTimeout, "Recover", message, name));
    };

    std::unique_lock<std::timed_mutex> recover(record->recover, std::defer_lock);
    if (deadline) {
        if (!recover.try_lock_until(*deadline)) {
            return out_of_time("Deadline passed while the tool was being recovered");
        }
    } else {
        recover.lock();
    }

    while (true) {
        const auto state = StateOf(*record);
        if (state == InstanceState::Running) {
            std::lock_guard<std::mutex> lock(record->mutex);
            return R::Ok(record->instance);
        }
        if (state != InstanceState::Error) {
            return R::Err(Error::Make(ErrorKind::ToolUnavailable, "Recover",
                                      std::string("Tool is ") + InstanceStateName(state), name));
        }

        auto def = registry_.Get(name);
        int attempt;
        Error cause = Error::Make(ErrorKind::ProcessCrash, "Recover", "Tool crashed", name);
        {
            std::lock_guard<std::mutex> lock(record->mutex);
            attempt = record->attempts;
            if (record->last_error) cause = *record->last_error;
        }

        if (!def || !def->auto_restart || PolicyFor(*def).Exhausted(attempt)) {
            std::lock_guard<std::mutex> transition(record->transition);
            if (StateOf(*record) != InstanceState::Error) continue;
            const auto reason = !def                 ? std::string("tool is no longer registered")
                                : !def->auto_restart ? std::string("auto_restart is disabled")
                                                     : "restart attempts exhausted (" +
                                                           std::to_string(attempt) + ")";
            MarkFailedLocked(*record, cause);
            return R::Err(Error::Make(ErrorKind::ToolUnavailable, "Recover",
                                      "Tool failed: " + reason + "; last error: " + cause.message,
                                      name));
        }

        const auto delay = PolicyFor(*def).DelayFor(attempt);
        if (deadline && SteadyClock::now() + delay > *deadline) {
            // The background recovery owns the restart from here.
            recover.unlock();
            ScheduleRecovery(name);
            return out_of_time("Restart backoff of " + std::to_string(delay.count()) +
                               " ms exceeds the call deadline");
        }
        LogInfo("process", "Restarting '" + name + "' in " + std::to_string(delay.count()) +
                               " ms (attempt " + std::to_string(attempt + 1) + " of " +
                               std::to_string(def->max_restart_attempts) + ")");
        if (!SleepUnlessStopping(delay)) {
            return R::Err(Error::Make(ErrorKind::ToolUnavailable, "Recover",
                                      "Fleet is shutting down", name));
        }

        std::lock_guard<std::mutex> transition(record->transition);
        if (StateOf(*record) != InstanceState::Error) continue;
        {
            std::lock_guard<std::mutex> lock(record->mutex);
            ++record->attempts;
            ++record->restart_count;
        }
        auto started = StartLocked(*record, def);
        if (started.IsOk()) {
            return started;
        }
        // Launch failed: the instance is in ERROR again; loop spends the
        // next attempt or gives up.
    }
}

void ProcessManager::OnInstanceCrash(const std::string& name, const Error& error) {
    if (auto record = FindRecord(name)) {
        std::lock_guard<std::mutex> lock(record->mutex);
        record->last_error = error;
    }
    Notify(name, InstanceState::Running, InstanceState::Error);
    ScheduleRecovery(name);
}

void ProcessManager::ReportFailure(const std::string& name, const Error& error) {
    auto instance = Instance(name);
    if (!instance) return;
    if (instance->MarkCrashed(error)) {
        OnInstanceCrash(name, error);
    } else if (instance->State() == InstanceState::Error) {
        ScheduleRecovery(name);
    }
}

void ProcessManager::ScheduleRecovery(const std::string& name) {
    std::lock_guard<std::mutex> lock(recovery_mutex_);
    if (stopping_) return;

    auto& slot = recoveries_[name];
    if (slot && !slot->done) {
        slot->rerun = true;
        return;
    }
    if (slot && slot->thread.joinable()) {
        slot->thread.join();
    }

    auto recovery = std::make_shared<Recovery>();
    recovery->thread = std::thread([this, name, recovery] {
        while (true) {
            auto recovered = Recover(name);
            if (recovered.IsErr()) {
                LogWarn("process", recovered.Error().ToString());
            }
            std::lock_guard<std::mutex> guard(recovery_mutex_);
            if (stopping_ || !recovery->rerun) {
                recovery->done = true;
                return;
            }
            recovery->rerun = false;
        }
    });
    slot = recovery;
}

bool ProcessManager::SleepUnlessStopping(Millis delay) {
    std::unique_lock<std::mutex> lock(recovery_mutex_);
    return !recovery_cv_.wait_for(lock, delay, [this] { return stopping_; });
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
InstancePtr ProcessManager::Instance(const std::string& name) const {
    auto record = FindRecord(name);
    if (!record) return nullptr;
    std::lock_guard<std::mutex> lock(record->mutex);
    return record->instance;
}

InstanceState ProcessManager::State(const std::string& name) const {
    auto record = FindRecord(name);
    return record ? StateOf(*record) : InstanceState::Stopped;
}

bool ProcessManager::CheckAlive(const std::string& name) const {
    auto instance = Instance(name);
    return instance && instance->ProcessAlive();
}

Result<InstanceStatus, Error> ProcessManager::Status(const std::string& name) const {
    InstanceStatus status;
    status.name = name;

    auto record = FindRecord(name);
    if (!record) {
        if (!registry_.Contains(name)) {
            return Result<InstanceStatus, Error>::Err(UnknownTool("Status", name));
        }
        return Result<InstanceStatus, Error>::Ok(std::move(status));
    }

    InstancePtr instance;
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        instance = record->instance;
        status.state = instance ? instance->State()
                                : (record->failed ? InstanceState::Failed : InstanceState::Stopped);
        status.restart_count = record->restart_count;
        status.last_error = record->last_error;
    }
    if (instance) {
        status.pid = instance->Pid();
        status.uptime = instance->Uptime();
        if (status.state == InstanceState::Running) {
            status.capabilities = instance->Capabilities();
            status.server_info = instance->ServerInfo();
        }
    }
    status.recent_output = record->output->TailJson(kStatusOutputLines);
    return Result<InstanceStatus, Error>::Ok(std::move(status));
}

std::vector<InstanceStatus> ProcessManager::StatusAll() const {
    std::vector<InstanceStatus> out;
    for (const auto& def : registry_.List()) {
        auto status = Status(def->name);
        if (status.IsOk()) {
            out.push_back(std::move(status).Value());
        }
    }
    return out;
}

int ProcessManager::RunningCount() const {
    std::vector<RecordPtr> records;
    {
        std::shared_lock<std::shared_mutex> lock(records_mutex_);
        for (const auto& [name, record] : records_) {
            records.push_back(record);
        }
    }
    int running = 0;
    for (const auto& record : records) {
        if (StateOf(*record) == InstanceState::Running) ++running;
    }
    return running;
}

// ---------------------------------------------------------------------------
// Listener
// ---------------------------------------------------------------------------
void ProcessManager::SetStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void ProcessManager::Notify(const std::string& name, InstanceState from, InstanceState to) {
    LogDebug("process", "'" + name + "' " + InstanceStateName(from) + " -> " +
                            InstanceStateName(to));
    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(name, from, to);
    }
}

} // namespace mcp_fleet
