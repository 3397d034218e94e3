#pragma once

#include <mcp_fleet/core/clock.hpp>

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// Caller-facing surface a request entered through.
enum class RequestOrigin {
    Mcp,
    Cli,
    Api,
    Health,
    Internal,
};

const char* RequestOriginName(RequestOrigin origin);

// ---------------------------------------------------------------------------
// RequestEnvelope: one normalized call, independent of the tool's wire
// transport. The wire id is assigned by the connection when the envelope
// is sent; it stays 0 until then.
// ---------------------------------------------------------------------------
struct RequestEnvelope {
    int64_t id = 0;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
    RequestOrigin origin = RequestOrigin::Internal;
    TimePoint submitted{};
    TimePoint deadline{};

    static RequestEnvelope Make(std::string method, nlohmann::json params,
                                Millis timeout,
                                RequestOrigin origin = RequestOrigin::Internal) {
        RequestEnvelope envelope;
        envelope.method = std::move(method);
        envelope.params = params.is_null() ? nlohmann::json::object() : std::move(params);
        envelope.origin = origin;
        envelope.submitted = SteadyClock::now();
        envelope.deadline = envelope.submitted + timeout;
        return envelope;
    }

    [[nodiscard]] Millis Remaining() const {
        auto left = ToMillis(deadline - SteadyClock::now());
        return left.count() > 0 ? left : Millis(0);
    }

    [[nodiscard]] bool Expired() const { return SteadyClock::now() >= deadline; }
};

} // namespace mcp_fleet
