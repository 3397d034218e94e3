#pragma once

#include <mcp_fleet/core/clock.hpp>
#include <mcp_fleet/registry/tool_definition.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mcp_fleet {

struct ProcessSettings {
    int max_processes = 10;
    Millis startup_timeout{30000};
    Millis shutdown_grace{10000};
    Millis restart_delay{5000};
    Millis restart_delay_max{60000};
    int max_restart_attempts = 3;
};

struct SessionSettings {
    Millis idle_timeout{300000};
    Millis hibernation_timeout{1800000};
    Millis max_session_lifetime{7200000};
    int max_concurrent_sessions = 50;
    int session_pool_size = 10;
    Millis acquire_timeout{30000};
    Millis sweep_interval{1000};
    bool stop_instance_on_hibernate = false;
    int default_concurrency_limit = 4;
};

struct RouterSettings {
    int retry_count = 3;
    Millis request_timeout{30000};
    bool auto_start = true;
};

struct HealthSettings {
    Millis interval{30000};
    int failure_threshold = 3;
    std::size_t history_size = 100;
    Millis check_timeout{5000};
    std::string check_method = "tools/list";
};

struct DiscoverySettings {
    std::vector<std::string> paths;
    bool recursive = true;
    Millis interval{0}; // 0 disables periodic discovery
};

struct LoggingSettings {
    std::string level = "info";
    std::optional<std::string> file;
    bool json = false;
};

struct FleetConfig {
    ProcessSettings process;
    SessionSettings session;
    RouterSettings router;
    HealthSettings health;
    DiscoverySettings discovery;
    LoggingSettings logging;
    std::vector<ToolDefinition> tools;
};

enum class Subcommand {
    Serve,
    Call,
    Discover,
    Validate,
};

// Command-line invocation. Optional fields are only set when the flag was
// given, so MergeCliOverrides can tell "absent" from "default".
struct CliOptions {
    Subcommand command = Subcommand::Serve;
    std::optional<std::string> config_path;

    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool json_log = false;
    std::optional<int> max_processes;
    bool no_auto_start = false;

    // call
    std::string tool;
    std::string method;
    std::string params_json = "{}";
    std::optional<std::string> session_id;
    std::optional<double> timeout_seconds;

    // discover
    std::vector<std::string> discover_paths;
    bool no_recursive = false;
};

} // namespace mcp_fleet
