#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/clock.hpp>
#include <mcp_fleet/core/line_reader.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/core/ring_buffer.hpp>
#include <mcp_fleet/process/child_process.hpp>
#include <mcp_fleet/registry/tool_registry.hpp>
#include <mcp_fleet/transport/transport_bridge.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

enum class InstanceState {
    Stopped,
    Starting,
    Running,
    Stopping,
    Error,
    Failed,
};

const char* InstanceStateName(InstanceState state);

struct OutputLine {
    std::chrono::system_clock::time_point at;
    std::string stream;  // "stdout" or "stderr"
    std::string text;
};

// Recent tool output, shared by every run of the same tool so the tail of
// a crashed run is still available after the restart.
class OutputLog {
public:
    static constexpr std::size_t kDefaultCapacity = 200;

    explicit OutputLog(std::size_t capacity = kDefaultCapacity) : lines_(capacity) {}

    void Append(std::string stream, std::string text);
    [[nodiscard]] std::vector<OutputLine> Tail(std::size_t n) const;
    [[nodiscard]] nlohmann::json TailJson(std::size_t n) const;

private:
    mutable std::mutex mutex_;
    RingBuffer<OutputLine> lines_;
};

// ---------------------------------------------------------------------------
// ToolInstance: one run of one tool.
//
// Owns the child process (if the tool has a command), the output readers
// and the transport connection. The pid is fixed for the life of the
// object; a restart creates a new instance. State changes other than the
// crash transition are made by ProcessManager while it holds the tool's
// transition lock.
// ---------------------------------------------------------------------------
class ToolInstance {
public:
    // Runs when the connection drops while the instance is RUNNING.
    using CrashCallback = std::function<void(const std::string& tool, const Error& error)>;

    ToolInstance(ToolDefinitionPtr definition, std::shared_ptr<OutputLog> output);
    ~ToolInstance();

    ToolInstance(const ToolInstance&) = delete;
    ToolInstance& operator=(const ToolInstance&) = delete;

    [[nodiscard]] const std::string& Name() const noexcept { return definition_->name; }
    [[nodiscard]] const ToolDefinitionPtr& Definition() const noexcept { return definition_; }
    [[nodiscard]] InstanceState State() const noexcept { return state_.load(); }
    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }
    [[nodiscard]] TimePoint StartedAt() const noexcept { return started_at_; }
    [[nodiscard]] Millis Uptime() const;
    [[nodiscard]] const nlohmann::json& Capabilities() const noexcept { return capabilities_; }
    [[nodiscard]] const nlohmann::json& ServerInfo() const noexcept { return server_info_; }
    [[nodiscard]] std::optional<Error> LastError() const;

    /// Send one request over the instance's transport. Fails with
    /// ProcessCrash when the instance is in ERROR and with ToolUnavailable
    /// in any other state but RUNNING.
    Result<nlohmann::json, Error> Send(RequestEnvelope& envelope);

    /// Non-blocking check that the child (if any) has not exited.
    bool ProcessAlive();

    /// RUNNING -> ERROR. Returns false if the instance was not RUNNING.
    bool MarkCrashed(const Error& error);

private:
    friend class ProcessManager;

    void SetState(InstanceState state) noexcept { state_.store(state); }
    bool CompareAndSetState(InstanceState expected, InstanceState desired) noexcept {
        return state_.compare_exchange_strong(expected, desired);
    }
    void SetLastError(const Error& error);

    /// Spawn (if the tool has a command) and wait for readiness.
    Result<void, Error> Launch(const ProcessSettings& settings, CrashCallback on_crash);

    /// Close the transport and end the child: graceful uses SIGTERM and
    /// `grace`, otherwise SIGKILL.
    void Shutdown(bool graceful, Millis grace);

    Result<void, Error> ConnectStdio(TimePoint deadline);
    Result<void, Error> ConnectHttp(TimePoint deadline);
    Result<void, Error> ConnectWebSocket(TimePoint deadline);
    Result<void, Error> Handshake(TimePoint deadline);
    void StartOutputReader(UniqueFd fd, const std::string& stream);
    void OnConnectionLost(const std::string& reason);
    Error StartupFailure(ErrorKind kind, const std::string& message);

    ToolDefinitionPtr definition_;
    std::shared_ptr<OutputLog> output_;
    CrashCallback on_crash_;

    std::atomic<InstanceState> state_{InstanceState::Starting};
    pid_t pid_ = 0;
    TimePoint started_at_{};
    nlohmann::json capabilities_ = nlohmann::json::object();
    nlohmann::json server_info_ = nlohmann::json::object();

    std::unique_ptr<ChildProcess> child_;
    std::vector<std::unique_ptr<LineReader>> output_readers_;

    mutable std::shared_mutex bridge_mutex_;
    std::unique_ptr<TransportBridge> bridge_;

    mutable std::mutex error_mutex_;
    std::optional<Error> last_error_;
};

using InstancePtr = std::shared_ptr<ToolInstance>;

} // namespace mcp_fleet
