#include <mcp_fleet/transport/websocket_transport.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/transport/jsonrpc.hpp>
#include <mcp_fleet/transport/pending_requests.hpp>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

#include <atomic>
#include <future>
#include <mutex>
#include <thread>

namespace mcp_fleet {

namespace {

typedef websocketpp::client<websocketpp::config::asio_client> ws_client;
typedef websocketpp::connection_hdl connection_hdl;
typedef ws_client::message_ptr message_ptr;

Error MakeWsError(ErrorKind kind, const std::string& tool, const std::string& operation,
                  const std::string& message) {
    return Error::Make(kind, operation, message, tool);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct WebSocketTransport::Impl {
    std::string tool;
    std::string uri;
    CloseCallback on_close;
    PendingRequests pending;

    ws_client client;
    connection_hdl hdl;
    std::thread io_thread;
    std::mutex send_mutex;
    std::atomic<bool> open{false};
    std::atomic<bool> close_reported{false};

    std::promise<Result<void, Error>> opened;
    std::atomic<bool> open_settled{false};

    Impl(std::string t, std::string u, CloseCallback cb)
        : tool(std::move(t)), uri(std::move(u)), on_close(std::move(cb)), pending(tool) {
        // stdout belongs to the MCP front end; keep websocketpp quiet.
        client.clear_access_channels(websocketpp::log::alevel::all);
        client.clear_error_channels(websocketpp::log::elevel::all);
        client.init_asio();

        client.set_open_handler([this](connection_hdl) {
            open = true;
            Settle(Result<void, Error>::Ok());
        });
        client.set_fail_handler([this](connection_hdl h) {
            std::string reason = "WebSocket connect failed";
            auto con = client.get_con_from_hdl(h);
            if (con) reason += ": " + con->get_ec().message();
            auto error = MakeWsError(ErrorKind::ProcessCrash, tool, "Connect", reason);
            Settle(Result<void, Error>::Err(error));
            Lost(error);
        });
        client.set_close_handler([this](connection_hdl) {
            Lost(MakeWsError(ErrorKind::ProcessCrash, tool, "Read",
                             "WebSocket closed by tool"));
        });
        client.set_message_handler([this](connection_hdl, message_ptr msg) {
            OnMessage(msg->get_payload());
        });
    }

    void Settle(Result<void, Error> result) {
        if (!open_settled.exchange(true)) {
            opened.set_value(std::move(result));
        }
    }

    void Lost(const Error& error) {
        open = false;
        pending.Close(error);
        if (!close_reported.exchange(true) && on_close) {
            on_close();
        }
    }

    void OnMessage(const std::string& payload) {
        auto parsed = jsonrpc::ParseLine(payload, tool);
        if (parsed.IsErr()) {
            LogWarn("transport", parsed.Error().ToString());
            return;
        }
        const auto& message = parsed.Value();
        if (jsonrpc::Classify(message) != jsonrpc::MessageKind::Response) {
            LogDebug("transport", "Ignoring non-response frame from '" + tool + "'");
            return;
        }
        int64_t id = 0;
        if (!jsonrpc::ResponseId(message, id) || !pending.Complete(id, message)) {
            LogWarn("transport", "Dropping WebSocket response from '" + tool +
                                     "' with unmatched id " + message["id"].dump());
        }
    }

    Result<void, Error> SendText(const std::string& payload, const std::string& operation) {
        std::lock_guard<std::mutex> lock(send_mutex);
        if (!open) {
            return Result<void, Error>::Err(MakeWsError(
                ErrorKind::ProcessCrash, tool, operation, "Transport is closed"));
        }
        websocketpp::lib::error_code ec;
        client.send(hdl, payload, websocketpp::frame::opcode::text, ec);
        if (ec) {
            return Result<void, Error>::Err(MakeWsError(
                ErrorKind::ProcessCrash, tool, operation, "WebSocket send failed: " + ec.message()));
        }
        return Result<void, Error>::Ok();
    }

    void Shutdown() {
        if (open.exchange(false)) {
            websocketpp::lib::error_code ec;
            client.close(hdl, websocketpp::close::status::going_away, "client closing", ec);
        }
        close_reported = true;
        pending.Close(MakeWsError(ErrorKind::ProcessCrash, tool, "Close", "Transport closed"));
        client.stop();
        if (io_thread.joinable()) {
            if (io_thread.get_id() == std::this_thread::get_id()) {
                io_thread.detach();
            } else {
                io_thread.join();
            }
        }
    }
};

WebSocketTransport::WebSocketTransport(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

WebSocketTransport::~WebSocketTransport() {
    Close();
}

Result<std::unique_ptr<WebSocketTransport>, Error> WebSocketTransport::Connect(
    const std::string& tool, const std::string& host, uint16_t port,
    const std::string& endpoint_path, Millis timeout, CloseCallback on_close) {
    using R = Result<std::unique_ptr<WebSocketTransport>, Error>;

    const auto uri = "ws://" + host + ":" + std::to_string(port) + endpoint_path;
    std::unique_ptr<Impl> impl;
    try {
        impl = std::make_unique<Impl>(tool, uri, std::move(on_close));
    } catch (const websocketpp::exception& e) {
        return R::Err(MakeWsError(ErrorKind::ProcessStart, tool, "Connect", e.what()));
    }

    websocketpp::lib::error_code ec;
    auto con = impl->client.get_connection(uri, ec);
    if (ec) {
        return R::Err(MakeWsError(ErrorKind::Config, tool, "Connect",
                                  "Invalid WebSocket URI " + uri + ": " + ec.message()));
    }
    impl->hdl = con->get_handle();
    impl->client.connect(con);

    auto opened = impl->opened.get_future();
    auto* raw = impl.get();
    impl->io_thread = std::thread([raw] {
        try {
            raw->client.run();
        } catch (const std::exception& e) {
            LogError("transport", "WebSocket loop for '" + raw->tool + "' failed: " + e.what());
            raw->Lost(MakeWsError(ErrorKind::ProcessCrash, raw->tool, "Read", e.what()));
        }
    });

    if (opened.wait_for(timeout) != std::future_status::ready) {
        impl->Shutdown();
        return R::Err(MakeWsError(ErrorKind::ProcessTimeout, tool, "Connect",
                                  "Timed out connecting to " + uri));
    }
    auto result = opened.get();
    if (result.IsErr()) {
        impl->Shutdown();
        return R::Err(result.Error());
    }

    LogInfo("transport", "Connected to " + uri);
    return R::Ok(std::unique_ptr<WebSocketTransport>(new WebSocketTransport(std::move(impl))));
}

Result<nlohmann::json, Error> WebSocketTransport::Send(RequestEnvelope& envelope) {
    auto& impl = *impl_;
    envelope.id = impl.pending.NextId();
    auto slot = impl.pending.Add(envelope.id);

    auto sent = impl.SendText(
        jsonrpc::MakeRequest(envelope.id, envelope.method, envelope.params).dump(),
        envelope.method);
    if (sent.IsErr()) {
        impl.pending.Fail(envelope.id, sent.Error());
    }

    auto response = impl.pending.Wait(slot, envelope.id, envelope.deadline, envelope.method);
    if (response.IsErr()) {
        return response;
    }
    return jsonrpc::UnwrapResponse(response.Value(), envelope.method, impl.tool);
}

Result<void, Error> WebSocketTransport::Notify(const std::string& method,
                                               const nlohmann::json& params) {
    return impl_->SendText(jsonrpc::MakeNotification(method, params).dump(), method);
}

void WebSocketTransport::Close() {
    if (impl_) {
        impl_->Shutdown();
    }
}

bool WebSocketTransport::IsOpen() const noexcept {
    return impl_ && impl_->open.load();
}

std::string WebSocketTransport::Uri() const {
    return impl_->uri;
}

} // namespace mcp_fleet
