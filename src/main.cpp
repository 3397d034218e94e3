#include <mcp_fleet/api/fleet_service.hpp>
#include <mcp_fleet/config/config_loader.hpp>
#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/terminal.hpp>
#include <mcp_fleet/core/types.hpp>
#include <mcp_fleet/core/version.hpp>
#include <mcp_fleet/mcp/fleet_handlers.hpp>
#include <mcp_fleet/mcp/mcp_server.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitConfig  = 2;

// Errors before the logger exists go straight to stderr.
void PrintError(const mcp_fleet::Error& error) {
    std::cerr << "mcp-fleet: " << error.ToString() << "\n";
}

// --version: print and exit before argparse sees the arguments.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "mcp-fleet " << mcp_fleet::kVersion << "\n";
            return true;
        }
    }
    return false;
}

// Console sink on stderr, optionally teed into a log file. stdout is
// reserved for MCP protocol messages and command output.
mcp_fleet::Result<void, mcp_fleet::Error> InitLogging(
    const mcp_fleet::LoggingSettings& logging, bool use_color) {
    using namespace mcp_fleet;

    auto level = ParseLogLevel(logging.level);
    if (level.IsErr()) {
        return Result<void, Error>::Err(level.Error());
    }

    std::unique_ptr<ILogSink> sink;
    if (logging.json) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ColorConsoleSink>(use_color);
    }

    if (logging.file && !logging.file->empty()) {
        auto file = FileSink::Open(*logging.file, logging.json);
        if (file.IsErr()) {
            return Result<void, Error>::Err(file.Error());
        }
        sink = std::make_unique<TeeSink>(std::move(sink), std::move(file).Value());
    }

    InitGlobalLogger(std::move(sink), level.Value());
    return Result<void, Error>::Ok();
}

int RunServe(mcp_fleet::FleetConfig config) {
    using namespace mcp_fleet;

    FleetService fleet(std::move(config));
    auto initialized = fleet.Initialize();
    if (initialized.IsErr()) {
        LogError("api", initialized.Error().ToString());
        return kExitConfig;
    }
    fleet.StartBackground();

    HandlerRegistry handlers;
    RegisterFleetHandlers(handlers, fleet);

    LogInfo("mcp", "Serving MCP on stdin/stdout");
    McpServer server(std::move(handlers));
    server.Run();

    LogInfo("mcp", "stdin closed; shutting down");
    fleet.Shutdown();
    return kExitSuccess;
}

int RunCall(mcp_fleet::FleetConfig config, const mcp_fleet::CliOptions& cli) {
    using namespace mcp_fleet;

    nlohmann::json params;
    try {
        params = nlohmann::json::parse(cli.params_json);
    } catch (const nlohmann::json::parse_error& e) {
        PrintError(Error::Make(ErrorKind::Config, "ParseParams",
                               std::string("params is not valid JSON: ") + e.what()));
        return kExitConfig;
    }

    FleetService fleet(std::move(config));
    auto initialized = fleet.Initialize();
    if (initialized.IsErr()) {
        PrintError(initialized.Error());
        return kExitConfig;
    }

    std::optional<Millis> timeout;
    if (cli.timeout_seconds) timeout = SecondsToMillis(*cli.timeout_seconds);

    auto response = fleet.CallTool(cli.tool, cli.method, params, cli.session_id, timeout);
    std::cout << response.dump(2) << "\n";
    fleet.Shutdown();
    return response.value("success", false) ? kExitSuccess : kExitFailure;
}

int RunDiscover(mcp_fleet::FleetConfig config) {
    using namespace mcp_fleet;

    const auto paths = config.discovery.paths;
    const bool recursive = config.discovery.recursive;
    config.discovery.paths.clear(); // Initialize must not scan them a second time

    FleetService fleet(std::move(config));
    auto initialized = fleet.Initialize();
    if (initialized.IsErr()) {
        PrintError(initialized.Error());
        return kExitConfig;
    }
    auto response = fleet.DiscoverTools(paths, recursive);
    response["tools"] = fleet.ListAvailableTools()["tools"];
    std::cout << response.dump(2) << "\n";
    return kExitSuccess;
}

int RunValidate(const mcp_fleet::FleetConfig& config) {
    using namespace mcp_fleet;

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        std::cout << "INVALID: " << valid.Error().message << "\n";
        return kExitConfig;
    }
    std::cout << "OK (" << config.tools.size() << " tool(s))\n";
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcp_fleet;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error());
        return kExitConfig;
    }
    const auto cli = std::move(cli_result).Value();

    FleetConfig config;
    if (cli.config_path) {
        auto loaded = LoadFromYaml(*cli.config_path);
        if (loaded.IsErr()) {
            PrintError(loaded.Error());
            return kExitConfig;
        }
        config = std::move(loaded).Value();
    }
    config = MergeCliOverrides(std::move(config), cli);

    auto logging = InitLogging(config.logging, UseColorForStderr(false, false));
    if (logging.IsErr()) {
        PrintError(logging.Error());
        return kExitConfig;
    }

    if (cli.command == Subcommand::Validate) {
        return RunValidate(config);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error());
        return kExitConfig;
    }

    switch (cli.command) {
        case Subcommand::Call:
            return RunCall(std::move(config), cli);
        case Subcommand::Discover:
            return RunDiscover(std::move(config));
        case Subcommand::Serve:
        case Subcommand::Validate:
            break;
    }
    return RunServe(std::move(config));
}
