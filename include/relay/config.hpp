#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace relay {

// ============================================================================
// Launcher Configuration
// ============================================================================
//
// Resolution priority, highest first:
//   1. --relay-* command line options
//   2. RELAY_MANIFEST, RELAY_INSTALL_DIR, RELAY_LOG_LEVEL
//   3. JSON config file (--relay-config, else relay.json beside the launcher)
//   4. Values compiled in through the RELAY_DEFAULT_* CMake cache variables

constexpr const char* kConfigFileName = "relay.json";

struct LauncherConfig {
    // Identity of the managed application
    std::string app_dir_name;
    std::string app_title;
    std::string support_message;    // shown when there is nothing to launch
    std::string app_exe;            // base names; ".exe" is added on Windows
    std::string tool_exe;
    std::string launcher_exe;       // empty: name of the running launcher

    // Locations
    std::string install_dir;        // empty until resolved
    std::string manifest;
    std::string runtime_descriptor;

    // Timing bounds
    std::chrono::milliseconds manifest_timeout{5000};
    std::chrono::milliseconds ping_timeout{1000};
    std::chrono::milliseconds shutdown_timeout{2000};
    std::chrono::milliseconds poll_interval{250};
    int graceful_polls = 20;
    int kill_polls = 12;

    bool self_update = true;
    bool relaunched = false;        // RELAY_HANDOFF was set
    std::string log_level = "info";  // spdlog level name; unknown names resolve to info

    std::string source_path;        // config file that was applied, if any
};

// Compiled-in defaults (install_dir left empty)
LauncherConfig default_launcher_config();

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> warnings;
};

// Apply a JSON document on top of config. Unknown keys are ignored; values of
// the wrong type are reported as warnings and skipped.
ConfigParseResult apply_config_json(LauncherConfig& config,
                                    const std::string& json_text,
                                    const std::string& source_path = "");

ConfigParseResult load_config_file(LauncherConfig& config, const std::string& path);

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// The process environment (get_env)
EnvLookup process_environment();

// Per-user data directory that holds install directories
std::string default_data_root(const EnvLookup& env);

void apply_environment(LauncherConfig& config, const EnvLookup& env);

struct ConfigOverrides {
    std::optional<std::string> config_file;
    std::optional<std::string> manifest;
    std::optional<std::string> install_dir;
    std::optional<std::string> log_level;
};

struct ConfigResolution {
    LauncherConfig config;
    std::vector<std::string> warnings;
};

/**
 * @brief Build the effective configuration for one run
 *
 * @param overrides Values given on the command line
 * @param launcher_path Path of the running launcher; relay.json is looked up
 *        beside it when no config file is given explicitly
 */
ConfigResolution resolve_config(const ConfigOverrides& overrides,
                                const std::string& launcher_path,
                                const EnvLookup& env);

} // namespace relay
