#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/process/backoff_policy.hpp>
#include <mcp_fleet/process/tool_instance.hpp>
#include <mcp_fleet/registry/tool_registry.hpp>

#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// Snapshot of one tool's lifecycle, as reported by get_tool_status.
struct InstanceStatus {
    std::string name;
    InstanceState state = InstanceState::Stopped;
    pid_t pid = 0;
    Millis uptime{0};
    int restart_count = 0;
    std::optional<Error> last_error;
    nlohmann::json capabilities = nlohmann::json::object();
    nlohmann::json server_info = nlohmann::json::object();
    nlohmann::json recent_output = nlohmann::json::array();

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ProcessManager: lifecycle of every tool instance in the fleet.
//
// Per tool name it keeps a record holding the current ToolInstance (null
// when STOPPED or FAILED), the restart counters and the output log that
// survives restarts. Lifecycle operations on one tool serialize on that
// tool's transition lock; different tools never block each other.
//
// A connection lost while RUNNING moves the instance to ERROR and queues
// an automatic recovery, which restarts it after the backoff delay or
// declares it FAILED once the attempt budget is spent.
// ---------------------------------------------------------------------------
class ProcessManager {
public:
    /// Called on every lifecycle transition. Must not call back into the
    /// manager.
    using StateListener = std::function<void(const std::string& tool, InstanceState from,
                                             InstanceState to)>;

    ProcessManager(ToolRegistry& registry, ProcessSettings settings);
    ~ProcessManager();

    ProcessManager(const ProcessManager&) = delete;
    ProcessManager& operator=(const ProcessManager&) = delete;

    /// Start the tool unless it is already RUNNING. Fails with
    /// ToolUnavailable for unknown or FAILED tools and when the process
    /// limit is reached; ProcessStart / ProcessTimeout when launch fails.
    Result<InstancePtr, Error> Start(const std::string& name);

    /// Idempotent: succeeds without side effects when nothing is running.
    Result<void, Error> Stop(const std::string& name, bool graceful = true);

    /// Stop then start immediately; clears a FAILED state.
    Result<InstancePtr, Error> Restart(const std::string& name);

    /// Bring an ERROR instance back, honouring the backoff policy and the
    /// tool's attempt budget. Returns the RUNNING instance, or
    /// ToolUnavailable once the tool is FAILED.
    ///
    /// With a deadline, neither waiting for a concurrent recovery nor the
    /// backoff delay may run past it: the caller gets RequestTimeout and
    /// the restart is left to the background recovery.
    Result<InstancePtr, Error> Recover(const std::string& name,
                                       std::optional<TimePoint> deadline = std::nullopt);

    /// Report a failure noticed outside the transport (dead child, failed
    /// health checks). The instance goes to ERROR and recovery is queued.
    void ReportFailure(const std::string& name, const Error& error);

    /// FAILED -> STOPPED with a fresh restart budget.
    Result<void, Error> Reset(const std::string& name);

    void StopAll();

    /// Cancel pending recoveries and stop every instance. Nothing restarts
    /// afterwards.
    void Shutdown();

    [[nodiscard]] InstancePtr Instance(const std::string& name) const;
    [[nodiscard]] InstanceState State(const std::string& name) const;
    [[nodiscard]] bool CheckAlive(const std::string& name) const;
    [[nodiscard]] Result<InstanceStatus, Error> Status(const std::string& name) const;
    [[nodiscard]] std::vector<InstanceStatus> StatusAll() const;
    [[nodiscard]] int RunningCount() const;
    [[nodiscard]] int ReservedSlots() const;

    [[nodiscard]] BackoffPolicy PolicyFor(const ToolDefinition& def) const;
    [[nodiscard]] const ProcessSettings& Settings() const noexcept { return settings_; }

    void SetStateListener(StateListener listener);

private:
    struct Record {
        explicit Record(std::string tool_name)
            : name(std::move(tool_name)), output(std::make_shared<OutputLog>()) {}

        const std::string name;
        std::mutex transition;  // held for a whole lifecycle operation
        std::timed_mutex recover;  // one recovery at a time

        mutable std::mutex mutex;  // guards the fields below; never held while blocking
        InstancePtr instance;
        bool holds_slot = false;
        bool failed = false;
        int restart_count = 0;
        int attempts = 0;  // automatic restarts since the last explicit start
        std::optional<Error> last_error;
        std::shared_ptr<OutputLog> output;
    };
    using RecordPtr = std::shared_ptr<Record>;

    RecordPtr FindRecord(const std::string& name) const;
    RecordPtr RecordFor(const std::string& name);
    static InstanceState StateOf(const Record& record);

    // All *Locked helpers require the record's transition lock.
    Result<InstancePtr, Error> StartLocked(Record& record, const ToolDefinitionPtr& def);
    void TeardownLocked(Record& record, bool graceful);
    void MarkFailedLocked(Record& record, const Error& cause);

    bool ReserveSlot();
    void ReleaseSlot(Record& record);

    void OnInstanceCrash(const std::string& name, const Error& error);
    void ScheduleRecovery(const std::string& name);
    bool SleepUnlessStopping(Millis delay);
    void Notify(const std::string& name, InstanceState from, InstanceState to);

    ToolRegistry& registry_;
    const ProcessSettings settings_;

    mutable std::shared_mutex records_mutex_;
    std::map<std::string, RecordPtr> records_;

    mutable std::mutex slots_mutex_;
    int reserved_slots_ = 0;

    std::mutex listener_mutex_;
    StateListener listener_;

    // Guarded by recovery_mutex_.
    struct Recovery {
        std::thread thread;
        bool done = false;
        bool rerun = false;  // another failure arrived while recovering
    };
    std::mutex recovery_mutex_;
    std::condition_variable recovery_cv_;
    bool stopping_ = false;
    std::map<std::string, std::shared_ptr<Recovery>> recoveries_;
};

} // namespace mcp_fleet
