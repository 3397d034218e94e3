#include <mcp_fleet/transport/stdio_transport.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/transport/jsonrpc.hpp>

#include <cerrno>
#include <cstring>

namespace mcp_fleet {

namespace {

Error MakeCrashError(const std::string& tool, const std::string& operation,
                     const std::string& message) {
    return Error::Make(ErrorKind::ProcessCrash, operation, message, tool);
}

} // anonymous namespace

StdioTransport::StdioTransport(std::string tool, UniqueFd to_child, UniqueFd from_child,
                               Callbacks callbacks)
    : tool_(std::move(tool)),
      to_child_(std::move(to_child)),
      callbacks_(std::move(callbacks)),
      pending_(tool_) {
    reader_ = std::make_unique<LineReader>(
        std::move(from_child), "stdout:" + tool_,
        [this](std::string line) { OnLine(std::move(line)); },
        [this] { OnEof(); });
    reader_->Start();
}

StdioTransport::~StdioTransport() {
    Close();
}

Result<void, Error> StdioTransport::WriteLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!open_ || !to_child_) {
        return Result<void, Error>::Err(
            MakeCrashError(tool_, "Write", "Transport is closed"));
    }

    const char* data = line.data();
    std::size_t left = line.size();
    while (left > 0) {
        const auto n = ::write(to_child_.Get(), data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            const auto reason = std::string(std::strerror(errno));
            return Result<void, Error>::Err(MakeCrashError(
                tool_, "Write",
                errno == EPIPE ? "Broken pipe" : "Write to tool stdin failed: " + reason));
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> StdioTransport::Send(RequestEnvelope& envelope) {
    if (!open_) {
        return Result<nlohmann::json, Error>::Err(
            MakeCrashError(tool_, envelope.method, "Transport is closed"));
    }

    envelope.id = pending_.NextId();
    auto slot = pending_.Add(envelope.id);

    auto line = jsonrpc::MakeRequest(envelope.id, envelope.method, envelope.params).dump();
    line.push_back('\n');

    auto written = WriteLine(line);
    if (written.IsErr()) {
        pending_.Fail(envelope.id, written.Error());
    }

    auto response = pending_.Wait(slot, envelope.id, envelope.deadline, envelope.method);
    if (response.IsErr()) {
        return response;
    }
    return jsonrpc::UnwrapResponse(response.Value(), envelope.method, tool_);
}

Result<void, Error> StdioTransport::Notify(const std::string& method,
                                           const nlohmann::json& params) {
    auto line = jsonrpc::MakeNotification(method, params).dump();
    line.push_back('\n');
    return WriteLine(line);
}

void StdioTransport::Close() {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        open_ = false;
        to_child_.Reset();
    }
    pending_.Close(MakeCrashError(tool_, "Close", "Transport closed"));
    if (reader_) {
        reader_->Stop();
    }
}

std::optional<Error> StdioTransport::LastProtocolError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_protocol_error_;
}

void StdioTransport::OnLine(std::string line) {
    if (line.find_first_not_of(" \t") == std::string::npos) {
        return;
    }

    auto parsed = jsonrpc::ParseLine(line, tool_);
    if (parsed.IsErr()) {
        ++protocol_errors_;
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            last_protocol_error_ = parsed.Error();
        }
        LogDebug("tool:" + tool_, line);
        if (callbacks_.on_output) {
            callbacks_.on_output(line);
        }
        return;
    }

    const auto& message = parsed.Value();
    if (message.is_array()) {
        for (const auto& item : message) {
            HandleMessage(item);
        }
        return;
    }
    HandleMessage(message);
}

void StdioTransport::HandleMessage(const nlohmann::json& message) {
    switch (jsonrpc::Classify(message)) {
        case jsonrpc::MessageKind::Response: {
            int64_t id = 0;
            if (!jsonrpc::ResponseId(message, id) || !pending_.Complete(id, message)) {
                LogWarn("transport", "Dropping response from '" + tool_ +
                                         "' with unmatched id " + message["id"].dump());
            }
            return;
        }
        case jsonrpc::MessageKind::Request: {
            // Server-initiated requests: answer ping, refuse everything else.
            const auto method = message["method"].get<std::string>();
            auto reply = method == "ping"
                             ? jsonrpc::MakeResult(message["id"], nlohmann::json::object())
                             : jsonrpc::MakeError(message["id"], jsonrpc::kMethodNotFound,
                                                  "Method not supported by client: " + method);
            auto line = reply.dump();
            line.push_back('\n');
            auto written = WriteLine(line);
            if (written.IsErr()) {
                LogDebug("transport", written.Error().ToString());
            }
            return;
        }
        case jsonrpc::MessageKind::Notification:
            LogDebug("transport", "Notification from '" + tool_ + "': " +
                                      message["method"].get<std::string>());
            return;
        case jsonrpc::MessageKind::Invalid:
            break;
    }

    ++protocol_errors_;
    auto error = Error::Make(ErrorKind::Protocol, "HandleMessage",
                             "Not a JSON-RPC message: " + message.dump().substr(0, 120), tool_);
    LogWarn("transport", error.ToString());
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_protocol_error_ = std::move(error);
}

void StdioTransport::OnEof() {
    open_ = false;
    pending_.Close(MakeCrashError(tool_, "Read", "Tool closed its stdout"));
    LogDebug("transport", "EOF on stdout of '" + tool_ + "'");
    if (callbacks_.on_eof) {
        callbacks_.on_eof();
    }
}

} // namespace mcp_fleet
