#include <mcp_fleet/transport/transport_bridge.hpp>

#include <mcp_fleet/core/log.hpp>

namespace mcp_fleet {

TransportBridge::TransportBridge(Connection connection)
    : connection_(std::move(connection)) {}

TransportBridge::~TransportBridge() {
    Close();
}

Result<nlohmann::json, Error> TransportBridge::Send(RequestEnvelope& envelope) {
    auto result = std::visit(
        [&](auto& transport) -> Result<nlohmann::json, Error> {
            if (!transport) {
                return Result<nlohmann::json, Error>::Err(Error::Make(
                    ErrorKind::ProcessCrash, envelope.method, "No connection"));
            }
            return transport->Send(envelope);
        },
        connection_);

    if (result.IsErr()) {
        LogDebug("transport", envelope.method + " #" + std::to_string(envelope.id) +
                                  " failed: " + result.Error().ToString());
    }
    return result;
}

Result<void, Error> TransportBridge::Notify(const std::string& method,
                                            const nlohmann::json& params) {
    return std::visit(
        [&](auto& transport) -> Result<void, Error> {
            if (!transport) {
                return Result<void, Error>::Err(Error::Make(
                    ErrorKind::ProcessCrash, method, "No connection"));
            }
            return transport->Notify(method, params);
        },
        connection_);
}

void TransportBridge::Close() {
    std::visit(
        [](auto& transport) {
            if (transport) transport->Close();
        },
        connection_);
}

bool TransportBridge::IsOpen() const {
    return std::visit(
        [](const auto& transport) { return transport && transport->IsOpen(); },
        connection_);
}

ConnectionType TransportBridge::Type() const noexcept {
    switch (connection_.index()) {
        case 1:  return ConnectionType::Http;
        case 2:  return ConnectionType::WebSocket;
        default: return ConnectionType::Stdio;
    }
}

} // namespace mcp_fleet
