#pragma once

#include <mcp_fleet/core/line_reader.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/core/unique_fd.hpp>
#include <mcp_fleet/transport/pending_requests.hpp>
#include <mcp_fleet/transport/request_envelope.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// StdioTransport: newline-delimited JSON-RPC 2.0 over a child's pipes.
//
// Writes are serialized so concurrent senders never interleave bytes on the
// child's stdin. A single reader thread parses stdout line by line and
// completes the matching pending id. Lines that are not JSON are counted as
// protocol errors and handed to on_output; the connection keeps running.
// ---------------------------------------------------------------------------
class StdioTransport {
public:
    struct Callbacks {
        // Non-protocol stdout lines (diagnostics printed by the tool).
        std::function<void(const std::string& line)> on_output;
        // Child closed stdout. Runs on the reader thread.
        std::function<void()> on_eof;
    };

    StdioTransport(std::string tool, UniqueFd to_child, UniqueFd from_child,
                   Callbacks callbacks);
    ~StdioTransport();

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// Assigns envelope.id, writes the request and waits for the matching
    /// response until envelope.deadline.
    Result<nlohmann::json, Error> Send(RequestEnvelope& envelope);

    Result<void, Error> Notify(const std::string& method, const nlohmann::json& params);

    void Close();

    [[nodiscard]] bool IsOpen() const noexcept { return open_.load(); }
    [[nodiscard]] std::size_t PendingCount() const { return pending_.Size(); }
    [[nodiscard]] uint64_t ProtocolErrors() const noexcept { return protocol_errors_.load(); }
    [[nodiscard]] std::optional<Error> LastProtocolError() const;

private:
    Result<void, Error> WriteLine(const std::string& line);
    void OnLine(std::string line);
    void OnEof();
    void HandleMessage(const nlohmann::json& message);

    std::string tool_;
    UniqueFd to_child_;
    Callbacks callbacks_;
    PendingRequests pending_;
    std::unique_ptr<LineReader> reader_;

    std::mutex write_mutex_;
    std::atomic<bool> open_{true};
    std::atomic<uint64_t> protocol_errors_{0};
    mutable std::mutex error_mutex_;
    std::optional<Error> last_protocol_error_;
};

} // namespace mcp_fleet
