#pragma once

#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/core/types.hpp>
#include <mcp_fleet/transport/http_transport.hpp>
#include <mcp_fleet/transport/request_envelope.hpp>
#include <mcp_fleet/transport/stdio_transport.hpp>
#include <mcp_fleet/transport/websocket_transport.hpp>

#include <memory>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// TransportBridge: the one send/notify surface over every wire transport.
//
// Holds exactly one connection, chosen when the instance starts. Dispatch
// goes through std::visit; callers never see which alternative is active.
// ---------------------------------------------------------------------------
class TransportBridge {
public:
    using Connection = std::variant<std::unique_ptr<StdioTransport>,
                                    std::unique_ptr<HttpTransport>,
                                    std::unique_ptr<WebSocketTransport>>;

    explicit TransportBridge(Connection connection);
    ~TransportBridge();

    TransportBridge(const TransportBridge&) = delete;
    TransportBridge& operator=(const TransportBridge&) = delete;

    /// Send one request and wait for its correlated result.
    Result<nlohmann::json, Error> Send(RequestEnvelope& envelope);

    Result<void, Error> Notify(const std::string& method,
                               const nlohmann::json& params = nlohmann::json());

    void Close();

    [[nodiscard]] bool IsOpen() const;
    [[nodiscard]] ConnectionType Type() const noexcept;

private:
    Connection connection_;
};

} // namespace mcp_fleet
