#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/transport/stdio_transport.hpp>
#include <mcp_fleet/transport/transport_bridge.hpp>

#include "../mocks/fixtures.hpp"

#include <unistd.h>

#include <csignal>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_fleet;
using namespace mcp_fleet::testing;
using nlohmann::json;

namespace {

// ---------------------------------------------------------------------------
// FakeTool: the other end of a StdioTransport, driven in-process.
//
// Every line the transport writes is parsed and handed to the handler on
// the fake's reader thread; the handler answers through Write().
// ---------------------------------------------------------------------------
class FakeTool {
public:
    using Handler = std::function<void(FakeTool& tool, const json& message)>;

    explicit FakeTool(Handler handler) : handler_(std::move(handler)) {
        ::signal(SIGPIPE, SIG_IGN);
        int requests[2];
        int responses[2];
        REQUIRE(::pipe(requests) == 0);
        REQUIRE(::pipe(responses) == 0);
        to_tool_ = UniqueFd(requests[1]);
        from_tool_ = UniqueFd(responses[0]);
        tool_out_ = UniqueFd(responses[1]);

        reader_ = std::make_unique<LineReader>(
            UniqueFd(requests[0]), "fake-tool",
            [this](std::string line) {
                auto message = json::parse(line);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    received_.push_back(message);
                }
                if (handler_) handler_(*this, message);
            },
            [] {});
        reader_->Start();
    }

    ~FakeTool() { reader_->Stop(); }

    std::unique_ptr<StdioTransport> Connect() {
        StdioTransport::Callbacks callbacks;
        callbacks.on_output = [this](const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex_);
            output_.push_back(line);
        };
        callbacks.on_eof = [this] { eof_ = true; };
        return std::make_unique<StdioTransport>("fake", std::move(to_tool_),
                                                std::move(from_tool_), callbacks);
    }

    void Write(const std::string& line) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!tool_out_) return;
        const auto text = line + "\n";
        if (::write(tool_out_.Get(), text.data(), text.size()) !=
            static_cast<ssize_t>(text.size())) {
            ++write_failures_;
        }
    }

    void Reply(const json& request, const json& result) {
        Write(json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", result}}.dump());
    }

    void CloseStdout() {
        std::lock_guard<std::mutex> lock(write_mutex_);
        tool_out_.Reset();
    }

    std::vector<json> Received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    std::vector<std::string> Output() {
        std::lock_guard<std::mutex> lock(mutex_);
        return output_;
    }

    bool SawEof() const { return eof_; }
    int WriteFailures() const { return write_failures_; }

private:
    Handler handler_;
    UniqueFd to_tool_;
    UniqueFd from_tool_;
    UniqueFd tool_out_;
    std::mutex write_mutex_;
    std::unique_ptr<LineReader> reader_;
    std::mutex mutex_;
    std::vector<json> received_;
    std::vector<std::string> output_;
    std::atomic<bool> eof_{false};
    std::atomic<int> write_failures_{0};
};

RequestEnvelope Envelope(const std::string& method, json params = json::object(),
                         Millis timeout = Millis(5000)) {
    return RequestEnvelope::Make(method, std::move(params), timeout, RequestOrigin::Api);
}

void EchoParams(FakeTool& tool, const json& message) {
    if (message.contains("id")) tool.Reply(message, message["params"]);
}

} // anonymous namespace

TEST_CASE("StdioTransport: request round-trip", "[transport][stdio]") {
    FakeTool tool(EchoParams);
    auto transport = tool.Connect();

    auto first = Envelope("echo", {{"text", "hi"}});
    auto result = transport->Send(first);
    REQUIRE(result.IsOk());
    CHECK(result.Value()["text"] == "hi");
    CHECK(first.id == 1);
    CHECK(tool.WriteFailures() == 0);

    auto second = Envelope("echo", {{"n", 2}});
    REQUIRE(transport->Send(second).IsOk());
    CHECK(second.id == 2);
    CHECK(transport->PendingCount() == 0);

    auto received = tool.Received();
    REQUIRE(received.size() == 2);
    CHECK(received[0]["jsonrpc"] == "2.0");
    CHECK(received[0]["method"] == "echo");
}

TEST_CASE("StdioTransport: stray stdout lines do not break the connection",
          "[transport][stdio]") {
    FakeTool tool([](FakeTool& t, const json& message) {
        t.Write("Loading index...");
        t.Write("");
        t.Reply(message, "done");
    });
    auto transport = tool.Connect();

    auto envelope = Envelope("index");
    auto result = transport->Send(envelope);
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "done");
    CHECK(transport->IsOpen());
    CHECK(transport->ProtocolErrors() == 1);
    REQUIRE(transport->LastProtocolError().has_value());
    CHECK(transport->LastProtocolError()->kind == ErrorKind::Protocol);
    CHECK(tool.Output() == std::vector<std::string>{"Loading index..."});
}

TEST_CASE("StdioTransport: responses are matched by id, not arrival order",
          "[transport][stdio]") {
    std::mutex held_mutex;
    json held;
    FakeTool tool([&](FakeTool& t, const json& message) {
        std::lock_guard<std::mutex> lock(held_mutex);
        if (held.is_null()) {
            held = message;
            return;
        }
        t.Reply(message, {{"method", message["method"]}});
        t.Reply(held, {{"method", held["method"]}});
    });
    auto transport = tool.Connect();

    std::optional<Result<json, Error>> first_result;
    std::thread first([&] {
        auto envelope = Envelope("first");
        first_result = transport->Send(envelope);
    });
    REQUIRE(WaitUntil([&] { return transport->PendingCount() == 1; }));

    auto envelope = Envelope("second");
    auto second = transport->Send(envelope);
    first.join();

    REQUIRE(second.IsOk());
    CHECK(second.Value()["method"] == "second");
    REQUIRE(first_result.has_value());
    REQUIRE(first_result->IsOk());
    CHECK(first_result->Value()["method"] == "first");
}

TEST_CASE("StdioTransport: unmatched ids are dropped", "[transport][stdio]") {
    FakeTool tool([](FakeTool& t, const json& message) {
        t.Write(R"({"jsonrpc":"2.0","id":999,"result":"stray"})");
        t.Write(R"({"jsonrpc":"2.0","result":"no id"})");
        t.Reply(message, "mine");
    });
    auto transport = tool.Connect();

    auto envelope = Envelope("op");
    auto result = transport->Send(envelope);
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "mine");
    CHECK(transport->ProtocolErrors() == 1);
}

TEST_CASE("StdioTransport: batched responses are split", "[transport][stdio]") {
    std::mutex held_mutex;
    std::vector<json> held;
    FakeTool tool([&](FakeTool& t, const json& message) {
        std::lock_guard<std::mutex> lock(held_mutex);
        held.push_back(message);
        if (held.size() < 2) return;
        auto batch = json::array();
        for (const auto& request : held) {
            batch.push_back({{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", request["method"]}});
        }
        t.Write(batch.dump());
    });
    auto transport = tool.Connect();

    std::optional<Result<json, Error>> first_result;
    std::thread first([&] {
        auto envelope = Envelope("a");
        first_result = transport->Send(envelope);
    });
    REQUIRE(WaitUntil([&] { return transport->PendingCount() == 1; }));
    auto envelope = Envelope("b");
    auto second = transport->Send(envelope);
    first.join();

    REQUIRE(second.IsOk());
    CHECK(second.Value() == "b");
    REQUIRE(first_result.has_value());
    REQUIRE(first_result->IsOk());
    CHECK(first_result->Value() == "a");
}

TEST_CASE("StdioTransport: error responses carry the rpc code", "[transport][stdio]") {
    FakeTool tool([](FakeTool& t, const json& message) {
        t.Write(json{{"jsonrpc", "2.0"},
                     {"id", message["id"]},
                     {"error", {{"code", -32000}, {"message", "division by zero"}}}}
                    .dump());
    });
    auto transport = tool.Connect();

    auto envelope = Envelope("divide", {{"a", 1}, {"b", 0}});
    auto result = transport->Send(envelope);
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::ToolError);
    CHECK(result.Error().rpc_code == -32000);
    CHECK(result.Error().message == "division by zero");
    CHECK(result.Error().tool == "fake");
}

TEST_CASE("StdioTransport: silence past the deadline times out", "[transport][stdio]") {
    FakeTool tool(nullptr);
    auto transport = tool.Connect();

    auto envelope = Envelope("slow", json::object(), Millis(50));
    auto result = transport->Send(envelope);
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::RequestTimeout);
    CHECK(transport->PendingCount() == 0);
    CHECK(transport->IsOpen());
}

TEST_CASE("StdioTransport: stdout EOF fails pending calls", "[transport][stdio]") {
    FakeTool tool([](FakeTool& t, const json&) { t.CloseStdout(); });
    auto transport = tool.Connect();

    auto envelope = Envelope("crash");
    auto result = transport->Send(envelope);
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::ProcessCrash);
    CHECK(WaitUntil([&] { return tool.SawEof(); }));
    CHECK_FALSE(transport->IsOpen());

    auto after = Envelope("echo");
    auto rejected = transport->Send(after);
    REQUIRE(rejected.IsErr());
    CHECK(rejected.Error().kind == ErrorKind::ProcessCrash);
}

TEST_CASE("StdioTransport: server pings are answered", "[transport][stdio]") {
    FakeTool tool(nullptr);
    auto transport = tool.Connect();

    tool.Write(R"({"jsonrpc":"2.0","id":"srv-1","method":"ping"})");
    tool.Write(R"({"jsonrpc":"2.0","id":"srv-2","method":"sampling/createMessage"})");
    REQUIRE(WaitUntil([&] { return tool.Received().size() == 2; }));

    auto replies = tool.Received();
    CHECK(replies[0]["id"] == "srv-1");
    CHECK(replies[0]["result"] == json::object());
    CHECK(replies[1]["id"] == "srv-2");
    CHECK(replies[1]["error"]["code"] == -32601);
}

TEST_CASE("StdioTransport: notifications carry no id", "[transport][stdio]") {
    FakeTool tool(nullptr);
    auto transport = tool.Connect();

    REQUIRE(transport->Notify("notifications/initialized", json::object()).IsOk());
    REQUIRE(WaitUntil([&] { return tool.Received().size() == 1; }));
    auto note = tool.Received()[0];
    CHECK(note["method"] == "notifications/initialized");
    CHECK_FALSE(note.contains("id"));

    transport->Close();
    CHECK(transport->Notify("late", json::object()).IsErr());
}

TEST_CASE("TransportBridge: dispatches to the stdio connection", "[transport][bridge]") {
    FakeTool tool(EchoParams);
    TransportBridge bridge(tool.Connect());
    CHECK(bridge.Type() == ConnectionType::Stdio);
    CHECK(bridge.IsOpen());

    auto envelope = Envelope("echo", {{"k", "v"}});
    auto result = bridge.Send(envelope);
    REQUIRE(result.IsOk());
    CHECK(result.Value()["k"] == "v");

    bridge.Close();
    CHECK_FALSE(bridge.IsOpen());
    auto after = Envelope("echo");
    CHECK(bridge.Send(after).Error().kind == ErrorKind::ProcessCrash);
}
