#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/clock.hpp>
#include <mcp_fleet/core/ring_buffer.hpp>
#include <mcp_fleet/process/process_manager.hpp>
#include <mcp_fleet/registry/tool_registry.hpp>
#include <mcp_fleet/session/concurrency_gate.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

struct HealthRecord {
    std::chrono::system_clock::time_point at;
    bool success = false;
    Millis latency{0};
    std::string error;

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// HealthMonitor: liveness probing, automatic restart triggers and metrics.
//
// Each round checks every tool that has an instance: a dead child or an
// instance already in ERROR is handed to the ProcessManager at once; a
// RUNNING instance gets a health check request (health.check_method). After
// failure_threshold consecutive failed checks the tool is reported as
// failed, which queues its restart. FAILED tools are not checked until
// they are reset or restarted.
// ---------------------------------------------------------------------------
class HealthMonitor {
public:
    /// Lets health checks wait their turn behind in-flight calls.
    using GateProvider = std::function<GatePtr(const std::string& tool)>;

    HealthMonitor(ToolRegistry& registry, ProcessManager& processes, HealthSettings settings,
                  IClock& clock = DefaultClock());
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void SetGateProvider(GateProvider provider);

    void Start();
    void Stop();

    /// One health check round over every tool.
    void CheckAll();

    /// Check one tool now. Empty when the tool was not checked.
    std::optional<HealthRecord> CheckTool(const std::string& name);

    /// Router outcome of one call.
    void RecordRequest(const std::string& tool, Millis latency, bool success);

    [[nodiscard]] std::vector<HealthRecord> History(const std::string& tool) const;
    [[nodiscard]] int ConsecutiveFailures(const std::string& tool) const;
    [[nodiscard]] nlohmann::json Metrics() const;

private:
    struct ToolHealth {
        explicit ToolHealth(std::size_t history_size) : history(history_size) {}

        RingBuffer<HealthRecord> history;
        uint64_t request_count = 0;
        uint64_t error_count = 0;
        int64_t total_latency_ms = 0;
        int consecutive_failures = 0;
        std::optional<std::chrono::system_clock::time_point> last_check;
    };

    ToolHealth& EntryLocked(const std::string& tool);
    HealthRecord Record(const std::string& tool, bool success, Millis latency,
                        const std::string& error);

    ToolRegistry& registry_;
    ProcessManager& processes_;
    const HealthSettings settings_;
    IClock& clock_;
    const TimePoint started_;

    mutable std::mutex mutex_;
    std::map<std::string, ToolHealth> tools_;
    GateProvider gate_provider_;

    std::mutex thread_mutex_;
    std::condition_variable thread_cv_;
    bool stop_ = false;
    std::thread thread_;
};

} // namespace mcp_fleet
