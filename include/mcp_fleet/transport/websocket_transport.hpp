#pragma once

#include <mcp_fleet/core/clock.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/transport/request_envelope.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// WebSocketTransport: JSON-RPC over ws://host:port<endpoint_path>.
//
// One text frame per message. An asio thread owned by the transport
// receives frames and completes pending ids; on close or failure every
// pending call fails with a ProcessCrash error and on_close runs.
// ---------------------------------------------------------------------------
class WebSocketTransport {
public:
    using CloseCallback = std::function<void()>;

    static Result<std::unique_ptr<WebSocketTransport>, Error> Connect(
        const std::string& tool, const std::string& host, uint16_t port,
        const std::string& endpoint_path, Millis timeout, CloseCallback on_close);

    ~WebSocketTransport();

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    Result<nlohmann::json, Error> Send(RequestEnvelope& envelope);

    Result<void, Error> Notify(const std::string& method, const nlohmann::json& params);

    void Close();

    [[nodiscard]] bool IsOpen() const noexcept;
    [[nodiscard]] std::string Uri() const;

private:
    struct Impl;
    explicit WebSocketTransport(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_fleet
