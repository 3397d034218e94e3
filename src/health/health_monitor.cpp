#include <mcp_fleet/health/health_monitor.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/types.hpp>

namespace mcp_fleet {

namespace {

double Seconds(Millis ms) {
    return static_cast<double>(ms.count()) / 1000.0;
}

// A JSON-RPC error reply still proves the tool is alive and answering.
bool CountsAsAlive(const Error& error) {
    return error.kind == ErrorKind::ToolError;
}

} // anonymous namespace

nlohmann::json HealthRecord::ToJson() const {
    nlohmann::json j = {
        {"timestamp", FormatIso8601(at)},
        {"success", success},
        {"latency_ms", latency.count()},
    };
    if (!error.empty()) j["error"] = error;
    return j;
}

HealthMonitor::HealthMonitor(ToolRegistry& registry, ProcessManager& processes,
                             HealthSettings settings, IClock& clock)
    : registry_(registry),
      processes_(processes),
      settings_(std::move(settings)),
      clock_(clock),
      started_(clock.Now()) {}

HealthMonitor::~HealthMonitor() {
    Stop();
}

void HealthMonitor::SetGateProvider(GateProvider provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    gate_provider_ = std::move(provider);
}

HealthMonitor::ToolHealth& HealthMonitor::EntryLocked(const std::string& tool) {
    auto it = tools_.find(tool);
    if (it == tools_.end()) {
        it = tools_.emplace(tool, ToolHealth(settings_.history_size)).first;
    }
    return it->second;
}

HealthRecord HealthMonitor::Record(const std::string& tool, bool success, Millis latency,
                                   const std::string& error) {
    HealthRecord record{std::chrono::system_clock::now(), success, latency, error};
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = EntryLocked(tool);
    entry.history.Push(record);
    entry.last_check = record.at;
    entry.consecutive_failures = success ? 0 : entry.consecutive_failures + 1;
    return record;
}

// ---------------------------------------------------------------------------
// Probing
// ---------------------------------------------------------------------------
std::optional<HealthRecord> HealthMonitor::CheckTool(const std::string& name) {
    switch (processes_.State(name)) {
        case InstanceState::Running:
            break;
        case InstanceState::Error: {
            auto status = processes_.Status(name);
            auto cause = status.IsOk() && status.Value().last_error
                             ? *status.Value().last_error
                             : Error::Make(ErrorKind::ProcessCrash, "HealthCheck",
                                           "Instance is in ERROR", name);
            processes_.ReportFailure(name, cause);
            return std::nullopt;
        }
        default:
            return std::nullopt;
    }

    auto instance = processes_.Instance(name);
    if (!instance) return std::nullopt;

    if (!instance->ProcessAlive()) {
        auto error = Error::Make(ErrorKind::ProcessCrash, "HealthCheck",
                                 "Tool process is no longer running", name);
        auto record = Record(name, false, Millis(0), error.message);
        LogWarn("health", "'" + name + "': " + error.message);
        processes_.ReportFailure(name, error);
        return record;
    }

    GatePass pass;
    GateProvider provider;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        provider = gate_provider_;
    }
    if (provider) {
        auto gate = provider(name);
        if (!gate->Acquire(SteadyClock::now() + settings_.check_timeout)) {
            LogDebug("health", "'" + name + "' busy; check skipped");
            return std::nullopt;
        }
        pass = GatePass(gate);
    }

    auto envelope = RequestEnvelope::Make(settings_.check_method, nlohmann::json::object(),
                                          settings_.check_timeout, RequestOrigin::Health);
    const auto started = SteadyClock::now();
    auto checked = instance->Send(envelope);
    const auto latency = ToMillis(SteadyClock::now() - started);
    pass.Reset();

    if (checked.IsOk() || CountsAsAlive(checked.Error())) {
        return Record(name, true, latency, "");
    }

    const auto& error = checked.Error();
    auto record = Record(name, false, latency, error.message);
    const int failures = ConsecutiveFailures(name);
    LogWarn("health", "'" + name + "' health check failed (" + std::to_string(failures) + "/" +
                          std::to_string(settings_.failure_threshold) + "): " + error.message);

    if (failures >= settings_.failure_threshold) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            EntryLocked(name).consecutive_failures = 0;
        }
        LogError("health", "'" + name + "' failed " + std::to_string(failures) +
                               " consecutive failed checks; restarting");
        processes_.ReportFailure(
            name, Error::Make(ErrorKind::ProcessTimeout, "HealthCheck",
                              "Failed " + std::to_string(failures) +
                                  " consecutive health checks: " + error.message,
                              name));
    }
    return record;
}

void HealthMonitor::CheckAll() {
    for (const auto& def : registry_.List()) {
        CheckTool(def->name);
    }
}

void HealthMonitor::Start() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (thread_.joinable()) return;
    stop_ = false;
    thread_ = std::thread([this] {
        std::unique_lock<std::mutex> lock(thread_mutex_);
        while (!thread_cv_.wait_for(lock, settings_.interval, [this] { return stop_; })) {
            lock.unlock();
            CheckAll();
            lock.lock();
        }
    });
    LogInfo("health", "Health checks every " + std::to_string(settings_.interval.count()) + " ms");
}

void HealthMonitor::Stop() {
    std::thread thread;
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        stop_ = true;
        thread.swap(thread_);
    }
    thread_cv_.notify_all();
    if (thread.joinable()) {
        thread.join();
    }
}

// ---------------------------------------------------------------------------
// Metrics
// ---------------------------------------------------------------------------
void HealthMonitor::RecordRequest(const std::string& tool, Millis latency, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = EntryLocked(tool);
    ++entry.request_count;
    if (!success) ++entry.error_count;
    entry.total_latency_ms += latency.count();
}

std::vector<HealthRecord> HealthMonitor::History(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(tool);
    return it == tools_.end() ? std::vector<HealthRecord>{} : it->second.history.Snapshot();
}

int HealthMonitor::ConsecutiveFailures(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(tool);
    return it == tools_.end() ? 0 : it->second.consecutive_failures;
}

nlohmann::json HealthMonitor::Metrics() const {
    const auto statuses = processes_.StatusAll();

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total_requests = 0;
    uint64_t total_errors = 0;
    int running = 0;
    auto tools = nlohmann::json::object();

    for (const auto& status : statuses) {
        nlohmann::json t = {
            {"state", InstanceStateName(status.state)},
            {"uptime_seconds", Seconds(status.uptime)},
            {"restart_count", status.restart_count},
            {"request_count", 0},
            {"error_count", 0},
            {"avg_latency_ms", 0.0},
            {"consecutive_failures", 0},
            {"last_check", nullptr},
        };
        if (status.state == InstanceState::Running) ++running;

        auto it = tools_.find(status.name);
        if (it != tools_.end()) {
            const auto& entry = it->second;
            t["request_count"] = entry.request_count;
            t["error_count"] = entry.error_count;
            t["avg_latency_ms"] = entry.request_count == 0
                                      ? 0.0
                                      : static_cast<double>(entry.total_latency_ms) /
                                            static_cast<double>(entry.request_count);
            t["consecutive_failures"] = entry.consecutive_failures;
            if (entry.last_check) t["last_check"] = FormatIso8601(*entry.last_check);
            total_requests += entry.request_count;
            total_errors += entry.error_count;
        }
        tools[status.name] = std::move(t);
    }

    return {
        {"uptime_seconds", Seconds(ToMillis(clock_.Now() - started_))},
        {"total_requests", total_requests},
        {"total_errors", total_errors},
        {"error_rate", total_requests == 0 ? 0.0
                                           : static_cast<double>(total_errors) /
                                                 static_cast<double>(total_requests)},
        {"running_instances", running},
        {"tools", tools},
    };
}

} // namespace mcp_fleet
