#include <mcp_fleet/transport/http_transport.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/transport/jsonrpc.hpp>
#include <mcp_fleet/transport/pending_requests.hpp>

#include <httplib.h>

#include <atomic>

namespace mcp_fleet {

namespace {

constexpr Millis kConnectTimeout{5000};

// Map an httplib transport failure. Connection-level failures mean the
// tool's listener went away, which the router treats like a crashed pipe.
Error FromTransportError(const std::string& tool, const std::string& operation,
                         httplib::Error error, bool deadline_passed) {
    const auto text = "HTTP request failed: " + httplib::to_string(error);
    if (deadline_passed) {
        return Error::Make(ErrorKind::RequestTimeout, operation, text, tool);
    }
    switch (error) {
        case httplib::Error::Connection:
        case httplib::Error::Read:
        case httplib::Error::Write:
            return Error::Make(ErrorKind::ProcessCrash, operation, text, tool);
        case httplib::Error::ConnectionTimeout:
            return Error::Make(ErrorKind::ToolUnavailable, operation, text, tool);
        default:
            return Error::Make(ErrorKind::Protocol, operation, text, tool);
    }
}

template <typename Duration>
void ApplyTimeouts(httplib::Client& client, Duration read_timeout) {
    client.set_connection_timeout(std::chrono::duration_cast<std::chrono::microseconds>(
        std::min<Millis>(kConnectTimeout, ToMillis(read_timeout))));
    client.set_read_timeout(std::chrono::duration_cast<std::chrono::microseconds>(read_timeout));
    client.set_write_timeout(std::chrono::duration_cast<std::chrono::microseconds>(read_timeout));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct HttpTransport::Impl {
    std::string tool;
    std::string host;
    uint16_t port;
    std::string endpoint_path;
    PendingRequests pending;
    std::atomic<bool> open{true};

    Impl(std::string t, std::string h, uint16_t p, std::string path)
        : tool(std::move(t)),
          host(std::move(h)),
          port(p),
          endpoint_path(std::move(path)),
          pending(tool) {}

    // A fresh client per call keeps concurrent callers independent.
    std::unique_ptr<httplib::Client> MakeClient(Millis timeout) const {
        auto client = std::make_unique<httplib::Client>(host, port);
        client->set_keep_alive(false);
        ApplyTimeouts(*client, timeout.count() > 0 ? timeout : Millis(1));
        return client;
    }

    // Decide what an HTTP 2xx body means for this request.
    Result<nlohmann::json, Error> Interpret(int64_t id, const std::string& method,
                                            const std::string& body) {
        auto parsed = nlohmann::json::parse(body, nullptr, false);
        if (parsed.is_discarded()) {
            return Result<nlohmann::json, Error>::Ok(nlohmann::json(body));
        }
        if (jsonrpc::Classify(parsed) != jsonrpc::MessageKind::Response) {
            return Result<nlohmann::json, Error>::Ok(std::move(parsed));
        }
        int64_t response_id = 0;
        if (!jsonrpc::ResponseId(parsed, response_id) || response_id != id) {
            LogWarn("transport", "Dropping HTTP response from '" + tool +
                                     "' with unmatched id " + parsed["id"].dump());
            return Result<nlohmann::json, Error>::Err(Error::Make(
                ErrorKind::Protocol, method, "Response id does not match request", tool));
        }
        return jsonrpc::UnwrapResponse(parsed, method, tool);
    }
};

HttpTransport::HttpTransport(std::string tool, std::string host, uint16_t port,
                             std::string endpoint_path)
    : impl_(std::make_unique<Impl>(std::move(tool), std::move(host), port,
                                   std::move(endpoint_path))) {}

HttpTransport::~HttpTransport() = default;

Result<nlohmann::json, Error> HttpTransport::Send(RequestEnvelope& envelope) {
    auto& impl = *impl_;
    if (!impl.open) {
        return Result<nlohmann::json, Error>::Err(Error::Make(
            ErrorKind::ProcessCrash, envelope.method, "Transport is closed", impl.tool));
    }

    envelope.id = impl.pending.NextId();
    auto slot = impl.pending.Add(envelope.id);
    const auto body = jsonrpc::MakeRequest(envelope.id, envelope.method, envelope.params).dump();

    LogDebug("transport", "POST " + BaseUrl() + impl.endpoint_path + " " + envelope.method);
    auto client = impl.MakeClient(envelope.Remaining());
    auto res = client->Post(impl.endpoint_path, body, "application/json");

    if (!res) {
        impl.pending.Fail(envelope.id, FromTransportError(impl.tool, envelope.method,
                                                          res.error(), envelope.Expired()));
    } else if (res->status < 200 || res->status >= 300) {
        impl.pending.Fail(envelope.id, Error::FromHttpStatus(envelope.method, impl.tool,
                                                             res->status, res->body));
    } else {
        auto interpreted = impl.Interpret(envelope.id, envelope.method, res->body);
        if (interpreted.IsErr()) {
            impl.pending.Fail(envelope.id, interpreted.Error());
        } else {
            impl.pending.Complete(envelope.id, std::move(interpreted).Value());
        }
    }

    return impl.pending.Wait(slot, envelope.id, envelope.deadline, envelope.method);
}

Result<void, Error> HttpTransport::Notify(const std::string& method,
                                          const nlohmann::json& params) {
    auto& impl = *impl_;
    const auto body = jsonrpc::MakeNotification(method, params).dump();
    auto client = impl.MakeClient(kConnectTimeout);
    auto res = client->Post(impl.endpoint_path, body, "application/json");
    if (!res) {
        return Result<void, Error>::Err(
            FromTransportError(impl.tool, method, res.error(), false));
    }
    if (res->status >= 400) {
        return Result<void, Error>::Err(
            Error::FromHttpStatus(method, impl.tool, res->status, res->body));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> HttpTransport::CheckHealth(Millis timeout) {
    auto& impl = *impl_;
    auto client = impl.MakeClient(timeout);
    auto res = client->Get("/health");
    if (!res) {
        return Result<void, Error>::Err(
            FromTransportError(impl.tool, "CheckHealth", res.error(), false));
    }
    if (res->status < 200 || res->status >= 300) {
        return Result<void, Error>::Err(
            Error::FromHttpStatus("CheckHealth", impl.tool, res->status, res->body));
    }
    return Result<void, Error>::Ok();
}

void HttpTransport::Close() {
    impl_->open = false;
    impl_->pending.Close(Error::Make(ErrorKind::ProcessCrash, "Close",
                                     "Transport closed", impl_->tool));
}

bool HttpTransport::IsOpen() const noexcept {
    return impl_->open.load();
}

std::string HttpTransport::BaseUrl() const {
    return "http://" + impl_->host + ":" + std::to_string(impl_->port);
}

} // namespace mcp_fleet
