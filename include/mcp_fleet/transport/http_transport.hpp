#pragma once

#include <mcp_fleet/core/clock.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/transport/request_envelope.hpp>

#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// HttpTransport: proxies envelopes to a tool's own HTTP endpoint.
//
// Each call is a POST of the JSON-RPC request to host:port<endpoint_path>.
// A JSON-RPC response body is unwrapped (result or error); any other body
// is passed through verbatim as the result: JSON as parsed, text as a
// string. Calls still go through the same id correlation and deadline
// handling as stdio.
//
// Uses pimpl to keep httplib out of the public header.
// ---------------------------------------------------------------------------
class HttpTransport {
public:
    HttpTransport(std::string tool, std::string host, uint16_t port,
                  std::string endpoint_path);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    Result<nlohmann::json, Error> Send(RequestEnvelope& envelope);

    Result<void, Error> Notify(const std::string& method, const nlohmann::json& params);

    /// GET /health; 2xx means ready.
    Result<void, Error> CheckHealth(Millis timeout);

    void Close();

    [[nodiscard]] bool IsOpen() const noexcept;
    [[nodiscard]] std::string BaseUrl() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_fleet
