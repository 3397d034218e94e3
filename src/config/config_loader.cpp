#include <mcp_fleet/config/config_loader.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/types.hpp>
#include <mcp_fleet/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <optional>
#include <set>
#include <sstream>

namespace mcp_fleet {

namespace {

Error MakeConfigError(const std::string& message, const std::string& tool = "") {
    return Error::Make(ErrorKind::Config, "ConfigLoader", message, tool);
}

// Convert a YAML subtree to JSON so tool records share one parser with the
// persistence collaborator's JSON records.
nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Sequence: {
            auto arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(YamlToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            auto obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = YamlToJson(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Scalar: {
            // Quoted scalars stay strings.
            if (node.Tag() == "!") {
                return node.Scalar();
            }
            long long int_value = 0;
            if (YAML::convert<long long>::decode(node, int_value)) {
                return int_value;
            }
            double double_value = 0.0;
            if (YAML::convert<double>::decode(node, double_value)) {
                return double_value;
            }
            bool bool_value = false;
            if (YAML::convert<bool>::decode(node, bool_value)) {
                return bool_value;
            }
            return node.Scalar();
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return nullptr;
}

Result<void, Error> ReadSeconds(const YAML::Node& section, const char* key,
                                Millis& out) {
    if (!section[key]) return Result<void, Error>::Ok();
    try {
        out = SecondsToMillis(section[key].as<double>());
    } catch (const YAML::Exception& e) {
        return Result<void, Error>::Err(MakeConfigError(
            std::string("'") + key + "' must be a number of seconds: " + e.what()));
    }
    return Result<void, Error>::Ok();
}

template <typename T>
Result<void, Error> ReadValue(const YAML::Node& section, const char* key, T& out) {
    if (!section[key]) return Result<void, Error>::Ok();
    try {
        out = section[key].as<T>();
    } catch (const YAML::Exception& e) {
        return Result<void, Error>::Err(MakeConfigError(
            std::string("Invalid value for '") + key + "': " + e.what()));
    }
    return Result<void, Error>::Ok();
}

// Reads the keys of one config section in order and keeps the first error;
// keys after a failed one are not read.
class SectionReader {
public:
    explicit SectionReader(const YAML::Node& section) : section_(section) {}

    SectionReader& Seconds(const char* key, Millis& out) {
        if (!error_) Keep(ReadSeconds(section_, key, out));
        return *this;
    }

    template <typename T>
    SectionReader& Value(const char* key, T& out) {
        if (!error_) Keep(ReadValue(section_, key, out));
        return *this;
    }

    [[nodiscard]] const std::optional<Error>& Failure() const { return error_; }

private:
    void Keep(const Result<void, Error>& read) {
        if (read.IsErr()) error_ = read.Error();
    }

    const YAML::Node& section_;
    std::optional<Error> error_;
};

Result<FleetConfig, Error> ParseRoot(const YAML::Node& root) {
    FleetConfig config;
    if (!root || root.IsNull()) {
        return Result<FleetConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<FleetConfig, Error>::Err(
            MakeConfigError("Top level of config must be a mapping"));
    }

    if (const auto p = root["process"]) {
        SectionReader read(p);
        read.Value("max_processes", config.process.max_processes)
            .Seconds("startup_timeout", config.process.startup_timeout)
            .Seconds("shutdown_grace", config.process.shutdown_grace)
            .Seconds("restart_delay", config.process.restart_delay)
            .Seconds("restart_delay_max", config.process.restart_delay_max)
            .Value("max_restart_attempts", config.process.max_restart_attempts);
        if (read.Failure()) {
            return Result<FleetConfig, Error>::Err(*read.Failure());
        }
    }

    if (const auto s = root["session"]) {
        SectionReader read(s);
        read.Seconds("idle_timeout", config.session.idle_timeout)
            .Seconds("hibernation_timeout", config.session.hibernation_timeout)
            .Seconds("max_session_lifetime", config.session.max_session_lifetime)
            .Value("max_concurrent_sessions", config.session.max_concurrent_sessions)
            .Value("session_pool_size", config.session.session_pool_size)
            .Seconds("acquire_timeout", config.session.acquire_timeout)
            .Seconds("sweep_interval", config.session.sweep_interval)
            .Value("stop_instance_on_hibernate", config.session.stop_instance_on_hibernate)
            .Value("default_concurrency_limit", config.session.default_concurrency_limit);
        if (read.Failure()) {
            return Result<FleetConfig, Error>::Err(*read.Failure());
        }
    }

    if (const auto r = root["router"]) {
        SectionReader read(r);
        read.Value("retry_count", config.router.retry_count)
            .Seconds("request_timeout", config.router.request_timeout)
            .Value("auto_start", config.router.auto_start);
        if (read.Failure()) {
            return Result<FleetConfig, Error>::Err(*read.Failure());
        }
    }

    if (const auto h = root["health"]) {
        SectionReader read(h);
        read.Seconds("interval", config.health.interval)
            .Value("failure_threshold", config.health.failure_threshold)
            .Value("history_size", config.health.history_size)
            .Seconds("check_timeout", config.health.check_timeout)
            .Value("check_method", config.health.check_method);
        if (read.Failure()) {
            return Result<FleetConfig, Error>::Err(*read.Failure());
        }
    }

    if (const auto d = root["discovery"]) {
        SectionReader read(d);
        read.Value("paths", config.discovery.paths)
            .Value("recursive", config.discovery.recursive)
            .Seconds("interval", config.discovery.interval);
        if (read.Failure()) {
            return Result<FleetConfig, Error>::Err(*read.Failure());
        }
    }

    if (const auto l = root["logging"]) {
        std::string file;
        SectionReader read(l);
        read.Value("level", config.logging.level)
            .Value("file", file)
            .Value("json", config.logging.json);
        if (read.Failure()) {
            return Result<FleetConfig, Error>::Err(*read.Failure());
        }
        if (!file.empty()) config.logging.file = file;
    }

// -- Tools --
    if (const auto tools = root["tools"]) {
        if (!tools.IsSequence()) {
            return Result<FleetConfig, Error>::Err(
                MakeConfigError("'tools' must be a list"));
        }
        for (const auto& node : tools) {
            auto def = ToolDefinitionFromYaml(node);
            if (def.IsErr()) {
                return Result<FleetConfig, Error>::Err(std::move(def).Error());
            }
            auto tool = std::move(def).Value();
            // Fleet-wide process settings fill in what the entry leaves out.
            if (!node["startup_timeout"] && !node["timeout"]) {
                tool.startup_timeout = config.process.startup_timeout;
            }
            if (!node["max_restart_attempts"]) {
                tool.max_restart_attempts = config.process.max_restart_attempts;
            }
            config.tools.push_back(std::move(tool));
        }
    }

    return Result<FleetConfig, Error>::Ok(std::move(config));
}


Result<std::vector<std::string>, Error> ReadStringList(const nlohmann::json& j,
                                                      const char* key,
                                                      const std::string& tool) {
    std::vector<std::string> out;
    const auto& value = j.at(key);
    if (!value.is_array()) {
        return Result<std::vector<std::string>, Error>::Err(
            MakeConfigError(std::string("'") + key + "' must be a list", tool));
    }
    for (const auto& item : value) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else {
            out.push_back(item.dump());
        }
    }
    return Result<std::vector<std::string>, Error>::Ok(std::move(out));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<FleetConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<FleetConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }
    LogDebug("config", "Loaded " + std::string(file_path));
    return ParseRoot(root);
}

Result<FleetConfig, Error> LoadFromYamlString(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return Result<FleetConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML: " + std::string(e.what())));
    }
    return ParseRoot(root);
}

// ---------------------------------------------------------------------------
// Tool records
// ---------------------------------------------------------------------------
Result<ToolDefinition, Error> ToolDefinitionFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<ToolDefinition, Error>::Err(
            MakeConfigError("Tool entry must be an object"));
    }
    if (!j.contains("name") || !j["name"].is_string()) {
        return Result<ToolDefinition, Error>::Err(
            MakeConfigError("Tool entry missing 'name' field"));
    }

    ToolDefinition def;
    def.name = j["name"].get<std::string>();

    try {
        // -- command / args --
        if (j.contains("command") && !j["command"].is_null()) {
            const auto& cmd = j["command"];
            if (cmd.is_array()) {
                auto parts = ReadStringList(j, "command", def.name);
                if (parts.IsErr()) {
                    return Result<ToolDefinition, Error>::Err(std::move(parts).Error());
                }
                auto argv = std::move(parts).Value();
                if (!argv.empty()) {
                    def.command = argv.front();
                    def.args.assign(argv.begin() + 1, argv.end());
                }
            } else if (cmd.is_string()) {
                auto command = cmd.get<std::string>();
                if (j.contains("args")) {
                    def.command = command;
                } else {
                    auto split = SplitCommandLine(command);
                    if (split.IsErr()) {
                        return Result<ToolDefinition, Error>::Err(MakeConfigError(
                            "Invalid command: " + split.Error(), def.name));
                    }
                    auto argv = std::move(split).Value();
                    if (!argv.empty()) {
                        def.command = argv.front();
                        def.args.assign(argv.begin() + 1, argv.end());
                    }
                }
            } else {
                return Result<ToolDefinition, Error>::Err(MakeConfigError(
                    "'command' must be a string or a list", def.name));
            }
        }
        if (j.contains("args") && !j["args"].is_null()) {
            auto args = ReadStringList(j, "args", def.name);
            if (args.IsErr()) {
                return Result<ToolDefinition, Error>::Err(std::move(args).Error());
            }
            auto extra = std::move(args).Value();
            def.args.insert(def.args.end(), extra.begin(), extra.end());
        }

        // -- environment --
        if (j.contains("env") && !j["env"].is_null()) {
            if (!j["env"].is_object()) {
                return Result<ToolDefinition, Error>::Err(
                    MakeConfigError("'env' must be a mapping", def.name));
            }
            for (const auto& [key, value] : j["env"].items()) {
                def.env[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
        def.working_directory = j.value("working_directory", std::string{});

        // -- connection --
        if (j.contains("connection_type")) {
            auto type = ParseConnectionType(j["connection_type"].get<std::string>());
            if (type.IsErr()) {
                return Result<ToolDefinition, Error>::Err(
                    MakeConfigError(type.Error(), def.name));
            }
            def.connection_type = type.Value();
        }
        def.host = j.value("host", std::string{});
        if (j.contains("port") && !j["port"].is_null()) {
            auto port = j["port"].get<int>();
            if (port < 0 || port > 65535) {
                return Result<ToolDefinition, Error>::Err(
                    MakeConfigError("Invalid port: " + std::to_string(port), def.name));
            }
            def.port = static_cast<uint16_t>(port);
        }
        def.endpoint_path = j.value("endpoint_path", def.endpoint_path);
        if (def.connection_type != ConnectionType::Stdio && def.host.empty()) {
            def.host = "127.0.0.1";
        }

        // -- lifecycle --
        if (j.contains("startup_timeout")) {
            def.startup_timeout = SecondsToMillis(j["startup_timeout"].get<double>());
        } else if (j.contains("timeout")) {
            def.startup_timeout = SecondsToMillis(j["timeout"].get<double>());
        }
        def.auto_restart = j.value("auto_restart", def.auto_restart);
        def.max_restart_attempts = j.value("max_restart_attempts", def.max_restart_attempts);
        def.auto_start = j.value("auto_start", def.auto_start);
        def.concurrency_safe = j.value("concurrency_safe", def.concurrency_safe);
        def.max_concurrency = j.value("max_concurrency", def.max_concurrency);
        def.description = j.value("description", std::string{});
    } catch (const nlohmann::json::exception& e) {
        return Result<ToolDefinition, Error>::Err(
            MakeConfigError("Invalid tool entry: " + std::string(e.what()), def.name));
    }

    auto valid = ValidateToolDefinition(def);
    if (valid.IsErr()) {
        return Result<ToolDefinition, Error>::Err(valid.Error());
    }
    return Result<ToolDefinition, Error>::Ok(std::move(def));
}

Result<ToolDefinition, Error> ToolDefinitionFromYaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<ToolDefinition, Error>::Err(
            MakeConfigError("Tool entry must be a mapping"));
    }
    nlohmann::json j;
    try {
        j = YamlToJson(node);
    } catch (const YAML::Exception& e) {
        return Result<ToolDefinition, Error>::Err(
            MakeConfigError("Invalid tool entry: " + std::string(e.what())));
    }
    return ToolDefinitionFromJson(j);
}

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------
SubcommandParse ParseSubcommand(int argc, const char* const* argv) {
    if (argc < 2) {
        return {Subcommand::Serve, false};
    }
    std::string_view arg1{argv[1]};
    if (arg1 == "serve") return {Subcommand::Serve, true};
    if (arg1 == "call") return {Subcommand::Call, true};
    if (arg1 == "discover") return {Subcommand::Discover, true};
    if (arg1 == "validate") return {Subcommand::Validate, true};
    return {Subcommand::Serve, false};
}

Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    auto [command, has_subcommand] = ParseSubcommand(argc, argv);

    // argparse sees "mcp-fleet <flags...>" with the subcommand removed.
    std::vector<const char*> args;
    args.push_back(argc > 0 ? argv[0] : "mcp-fleet");
    for (int i = has_subcommand ? 2 : 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    argparse::ArgumentParser program("mcp-fleet", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-file")
        .help("Append log records to this file");
    program.add_argument("--json-log")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--max-processes")
        .help("Maximum concurrently running tool processes")
        .scan<'i', int>();
    program.add_argument("--no-auto-start")
        .help("Do not start tools lazily on first call")
        .default_value(false)
        .implicit_value(true);

    switch (command) {
        case Subcommand::Call:
            program.add_argument("tool").help("Tool name");
            program.add_argument("method").help("JSON-RPC method");
            program.add_argument("params")
                .help("JSON object with parameters")
                .nargs(argparse::nargs_pattern::optional)
                .default_value(std::string("{}"));
            program.add_argument("--session").help("Reuse an existing session id");
            program.add_argument("--timeout")
                .help("Per-call timeout in seconds")
                .scan<'g', double>();
            break;
        case Subcommand::Discover:
            program.add_argument("paths")
                .help("Files or directories to scan")
                .nargs(argparse::nargs_pattern::any);
            program.add_argument("--no-recursive")
                .help("Do not descend into subdirectories")
                .default_value(false)
                .implicit_value(true);
            break;
        case Subcommand::Serve:
        case Subcommand::Validate:
            break;
    }

    try {
        program.parse_args(static_cast<int>(args.size()), args.data());
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    cli.command = command;
    if (auto val = program.present("--config")) cli.config_path = *val;
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (level.IsErr()) {
            return Result<CliOptions, Error>::Err(level.Error());
        }
        cli.log_level = *val;
    }
    if (auto val = program.present("--log-file")) cli.log_file = *val;
    cli.json_log = program.get<bool>("--json-log");
    if (auto val = program.present<int>("--max-processes")) {
        if (*val <= 0) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("--max-processes must be positive"));
        }
        cli.max_processes = *val;
    }
    cli.no_auto_start = program.get<bool>("--no-auto-start");

    if (command == Subcommand::Call) {
        cli.tool = program.get<std::string>("tool");
        cli.method = program.get<std::string>("method");
        cli.params_json = program.get<std::string>("params");
        if (auto val = program.present("--session")) cli.session_id = *val;
        if (auto val = program.present<double>("--timeout")) {
            if (*val <= 0.0) {
                return Result<CliOptions, Error>::Err(
                    MakeConfigError("--timeout must be positive"));
            }
            cli.timeout_seconds = *val;
        }
    } else if (command == Subcommand::Discover) {
        if (program.is_used("paths")) {
            cli.discover_paths = program.get<std::vector<std::string>>("paths");
        }
        cli.no_recursive = program.get<bool>("--no-recursive");
    }

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

FleetConfig MergeCliOverrides(FleetConfig base, const CliOptions& cli) {
    if (cli.log_level.has_value()) base.logging.level = *cli.log_level;
    if (cli.log_file.has_value()) base.logging.file = cli.log_file;
    if (cli.json_log) base.logging.json = true;
    if (cli.max_processes.has_value()) base.process.max_processes = *cli.max_processes;
    if (cli.no_auto_start) base.router.auto_start = false;
    if (cli.timeout_seconds.has_value()) {
        base.router.request_timeout = SecondsToMillis(*cli.timeout_seconds);
    }
    if (cli.command == Subcommand::Discover) {
        if (!cli.discover_paths.empty()) base.discovery.paths = cli.discover_paths;
        if (cli.no_recursive) base.discovery.recursive = false;
    }
    return base;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const FleetConfig& config) {
    auto fail = [](const std::string& message) {
        return Result<void, Error>::Err(MakeConfigError(message));
    };

    const auto& p = config.process;
    if (p.max_processes <= 0) return fail("process.max_processes must be positive");
    if (p.startup_timeout.count() <= 0) return fail("process.startup_timeout must be positive");
    if (p.shutdown_grace.count() < 0) return fail("process.shutdown_grace must not be negative");
    if (p.restart_delay.count() < 0) return fail("process.restart_delay must not be negative");
    if (p.restart_delay_max < p.restart_delay) {
        return fail("process.restart_delay_max must be >= restart_delay");
    }
    if (p.max_restart_attempts < 0) {
        return fail("process.max_restart_attempts must not be negative");
    }

    const auto& s = config.session;
    if (s.idle_timeout.count() <= 0) return fail("session.idle_timeout must be positive");
    if (s.hibernation_timeout < s.idle_timeout) {
        return fail("session.hibernation_timeout must be >= idle_timeout");
    }
    if (s.max_session_lifetime < s.hibernation_timeout) {
        return fail("session.max_session_lifetime must be >= hibernation_timeout");
    }
    if (s.max_concurrent_sessions <= 0) {
        return fail("session.max_concurrent_sessions must be positive");
    }
    if (s.session_pool_size < 0) return fail("session.session_pool_size must not be negative");
    if (s.acquire_timeout.count() <= 0) return fail("session.acquire_timeout must be positive");
    if (s.sweep_interval.count() <= 0) return fail("session.sweep_interval must be positive");
    if (s.default_concurrency_limit <= 0) {
        return fail("session.default_concurrency_limit must be positive");
    }

    const auto& r = config.router;
    if (r.retry_count < 0) return fail("router.retry_count must not be negative");
    if (r.request_timeout.count() <= 0) return fail("router.request_timeout must be positive");

    const auto& h = config.health;
    if (h.interval.count() <= 0) return fail("health.interval must be positive");
    if (h.failure_threshold <= 0) return fail("health.failure_threshold must be positive");
    if (h.history_size == 0) return fail("health.history_size must be positive");
    if (h.check_timeout.count() <= 0) return fail("health.check_timeout must be positive");
    if (h.check_method.empty()) return fail("health.check_method must not be empty");

    if (config.discovery.interval.count() < 0) {
        return fail("discovery.interval must not be negative");
    }

    auto level = ParseLogLevel(config.logging.level);
    if (level.IsErr()) return Result<void, Error>::Err(level.Error());

    std::set<std::string> names;
    for (const auto& tool : config.tools) {
        auto valid = ValidateToolDefinition(tool);
        if (valid.IsErr()) return valid;
        if (!names.insert(tool.name).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate tool name: " + tool.name, tool.name));
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_fleet
