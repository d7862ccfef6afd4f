#include "relay/config.hpp"
#include "relay/platform.hpp"
#include "relay/runtime_descriptor.hpp"

#include <cctype>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#ifndef RELAY_DEFAULT_APP_DIR_NAME
#define RELAY_DEFAULT_APP_DIR_NAME "ValidationTool"
#endif
#ifndef RELAY_DEFAULT_MANIFEST
#define RELAY_DEFAULT_MANIFEST ""
#endif
#ifndef RELAY_DEFAULT_APP_EXE
#define RELAY_DEFAULT_APP_EXE "validation-ui"
#endif
#ifndef RELAY_DEFAULT_TOOL_EXE
#define RELAY_DEFAULT_TOOL_EXE "pbi-tools"
#endif
#ifndef RELAY_DEFAULT_SUPPORT_MESSAGE
#define RELAY_DEFAULT_SUPPORT_MESSAGE "Contact your administrator for access."
#endif
#ifndef RELAY_DEFAULT_APP_TITLE
#define RELAY_DEFAULT_APP_TITLE "Validation Tool"
#endif

namespace relay {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> non_empty(const std::optional<std::string>& value) {
    if (!value) return std::nullopt;
    std::string v = trim(*value);
    if (v.empty()) return std::nullopt;
    return v;
}

// from_str maps every unknown name to "off"
bool is_known_log_level(const std::string& name) {
    return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

// Reads typed values out of the config object, collecting type warnings
class ConfigReader {
public:
    ConfigReader(const nlohmann::json& j, std::vector<std::string>& warnings)
        : j_(j), warnings_(warnings) {}

    void string(const char* key, std::string& out) {
        if (!j_.contains(key)) return;
        const auto& v = j_[key];
        if (!v.is_string()) {
            warnings_.push_back(std::string(key) + ": expected a string");
            return;
        }
        out = trim(v.get<std::string>());
    }

    void count(const char* key, int& out) {
        if (!j_.contains(key)) return;
        const auto& v = j_[key];
        if (!v.is_number_integer() || v.get<long long>() < 1 || v.get<long long>() > 10000) {
            warnings_.push_back(std::string(key) + ": expected an integer between 1 and 10000");
            return;
        }
        out = v.get<int>();
    }

    void millis(const char* key, std::chrono::milliseconds& out) {
        if (!j_.contains(key)) return;
        const auto& v = j_[key];
        if (!v.is_number_integer() || v.get<long long>() < 0) {
            warnings_.push_back(std::string(key) + ": expected a non-negative integer");
            return;
        }
        out = std::chrono::milliseconds(v.get<long long>());
    }

    void boolean(const char* key, bool& out) {
        if (!j_.contains(key)) return;
        const auto& v = j_[key];
        if (!v.is_boolean()) {
            warnings_.push_back(std::string(key) + ": expected true or false");
            return;
        }
        out = v.get<bool>();
    }

private:
    const nlohmann::json& j_;
    std::vector<std::string>& warnings_;
};

} // namespace

LauncherConfig default_launcher_config() {
    LauncherConfig config;
    config.app_dir_name = RELAY_DEFAULT_APP_DIR_NAME;
    config.app_title = RELAY_DEFAULT_APP_TITLE;
    config.support_message = RELAY_DEFAULT_SUPPORT_MESSAGE;
    config.app_exe = RELAY_DEFAULT_APP_EXE;
    config.tool_exe = RELAY_DEFAULT_TOOL_EXE;
    config.manifest = RELAY_DEFAULT_MANIFEST;
    config.runtime_descriptor = kRuntimeDescriptorName;
    return config;
}

ConfigParseResult apply_config_json(LauncherConfig& config,
                                    const std::string& json_text,
                                    const std::string& source_path) {
    ConfigParseResult result;

    std::string text = json_text;
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        text.erase(0, 3);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = "JSON must be an object";
        return result;
    }

    ConfigReader read(j, result.warnings);

    read.string("app_dir_name", config.app_dir_name);
    read.string("app_title", config.app_title);
    read.string("support_message", config.support_message);
    read.string("app_exe", config.app_exe);
    read.string("tool_exe", config.tool_exe);
    read.string("launcher_exe", config.launcher_exe);
    read.string("install_dir", config.install_dir);
    read.string("manifest", config.manifest);
    read.string("runtime_descriptor", config.runtime_descriptor);

    read.millis("manifest_timeout_ms", config.manifest_timeout);
    read.millis("ping_timeout_ms", config.ping_timeout);
    read.millis("shutdown_timeout_ms", config.shutdown_timeout);
    read.millis("poll_interval_ms", config.poll_interval);
    read.count("graceful_polls", config.graceful_polls);
    read.count("kill_polls", config.kill_polls);

    read.boolean("self_update", config.self_update);
    read.string("log_level", config.log_level);

    if (config.runtime_descriptor.empty()) {
        config.runtime_descriptor = kRuntimeDescriptorName;
    }

    config.source_path = source_path;
    result.ok = true;
    return result;
}

ConfigParseResult load_config_file(LauncherConfig& config, const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        ConfigParseResult result;
        result.error = "cannot read " + path;
        return result;
    }
    return apply_config_json(config, *content, path);
}

EnvLookup process_environment() {
    return [](const std::string& name) { return get_env(name); };
}

std::string default_data_root(const EnvLookup& env) {
    for (const char* name : {"LOCALAPPDATA", "APPDATA", "XDG_DATA_HOME"}) {
        if (auto dir = non_empty(env(name))) {
            return *dir;
        }
    }

    if (auto home = non_empty(env("HOME"))) {
        return join_path(join_path(*home, ".local"), "share");
    }

    if (auto profile = non_empty(env("USERPROFILE"))) {
        return *profile;
    }

    return ".";
}

void apply_environment(LauncherConfig& config, const EnvLookup& env) {
    if (auto manifest = non_empty(env("RELAY_MANIFEST"))) {
        config.manifest = *manifest;
    }
    if (auto dir = non_empty(env("RELAY_INSTALL_DIR"))) {
        config.install_dir = *dir;
    }
    if (auto level = non_empty(env("RELAY_LOG_LEVEL"))) {
        config.log_level = *level;
    }
    if (non_empty(env("RELAY_HANDOFF"))) {
        config.relaunched = true;
    }
}

ConfigResolution resolve_config(const ConfigOverrides& overrides,
                                const std::string& launcher_path,
                                const EnvLookup& env) {
    ConfigResolution resolution;
    LauncherConfig& config = resolution.config;
    config = default_launcher_config();

    // 1. Config file
    std::string config_path;
    bool explicit_file = false;
    if (auto given = non_empty(overrides.config_file)) {
        config_path = *given;
        explicit_file = true;
    } else if (!launcher_path.empty()) {
        std::string beside = join_path(get_parent_directory(launcher_path), kConfigFileName);
        if (is_regular_file(beside)) {
            config_path = beside;
        }
    }

    if (!config_path.empty()) {
        // Parse into a copy so a broken file leaves the defaults intact
        LauncherConfig candidate = config;
        auto loaded = load_config_file(candidate, config_path);
        for (const auto& w : loaded.warnings) {
            resolution.warnings.push_back(config_path + ": " + w);
        }
        if (loaded.ok) {
            config = candidate;
        } else if (explicit_file || path_exists(config_path)) {
            resolution.warnings.push_back(config_path + ": " + loaded.error);
        }
    }

    // 2. Environment
    apply_environment(config, env);

    // 3. Command line
    if (auto manifest = non_empty(overrides.manifest)) config.manifest = *manifest;
    if (auto dir = non_empty(overrides.install_dir)) config.install_dir = *dir;
    if (auto level = non_empty(overrides.log_level)) config.log_level = *level;

    if (!is_known_log_level(config.log_level)) {
        resolution.warnings.push_back("unknown log level '" + config.log_level +
                                      "', using info");
        config.log_level = "info";
    }

    // 4. Install directory default
    if (config.install_dir.empty()) {
        config.install_dir = join_path(default_data_root(env), config.app_dir_name);
    }

    return resolution;
}

} // namespace relay
