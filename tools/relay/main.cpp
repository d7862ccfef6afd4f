/**
 * relay launcher - Entry Point
 *
 * Brings the managed application up to date and starts it (or hands the user
 * over to the instance that is already running).
 *
 *   relay-launcher [--relay-<option> ...] [application arguments ...]
 *
 * Leading --relay-* options belong to the launcher; everything from the first
 * other argument on is forwarded to the application untouched.
 */

#include <CLI/CLI.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "relay/config.hpp"
#include "relay/controller.hpp"
#include "relay/http_client.hpp"
#include "relay/platform.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

constexpr const char* kLogFileName = "relay.log";

void configure_logging(const relay::LauncherConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string log_path = relay::join_path(config.install_dir, kLogFileName);
    std::string file_error;
    if (relay::create_directories(config.install_dir)) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path, 1024 * 1024, 3));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    } else {
        file_error = "cannot create " + config.install_dir;
    }

    auto logger = std::make_shared<spdlog::logger>("relay", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::flush_on(spdlog::level::warn);

    if (!file_error.empty()) {
        spdlog::warn("logging to stderr only: {}", file_error);
    }
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"relay - update and single-instance launcher"};
    app.prefix_command();
    app.set_help_flag("--relay-help", "Print launcher help and exit");
    app.set_version_flag("--relay-version", RELAY_VERSION);

    std::string config_file;
    std::string manifest;
    std::string install_dir;
    std::string log_level;
    app.add_option("--relay-config", config_file, "Launcher config file (JSON)");
    app.add_option("--relay-manifest", manifest, "Manifest path or URL");
    app.add_option("--relay-install-dir", install_dir, "Install directory");
    app.add_option("--relay-log-level", log_level,
                   "trace, debug, info, warn, error, critical or off");

    CLI11_PARSE(app, argc, argv);

    relay::ConfigOverrides overrides;
    if (!config_file.empty()) overrides.config_file = config_file;
    if (!manifest.empty()) overrides.manifest = manifest;
    if (!install_dir.empty()) overrides.install_dir = install_dir;
    if (!log_level.empty()) overrides.log_level = log_level;

    std::vector<std::string> forwarded = app.remaining();
    std::vector<std::string> launcher_args(argv + 1, argv + argc);

    std::string launcher_path = relay::current_executable_path();
    auto resolution = relay::resolve_config(overrides, launcher_path,
                                            relay::process_environment());
    const relay::LauncherConfig& config = resolution.config;

    configure_logging(config);
    spdlog::info("relay {} starting (install dir {})", RELAY_VERSION, config.install_dir);
    if (!config.source_path.empty()) {
        spdlog::debug("configuration from {}", config.source_path);
    }
    for (const auto& warning : resolution.warnings) {
        spdlog::warn("config: {}", warning);
    }

    relay::TransferDownloader downloader;
    relay::CurlHttpClient http;
    relay::SystemProcessControl processes;
    relay::BrowserPresenter presenter;
    relay::DetachedSpawner spawner;
    relay::DialogNotifier notifier;

    relay::ControllerServices services{downloader, http, processes, presenter,
                                       spawner, notifier, relay::real_sleep()};
    relay::Controller controller(config, launcher_path, services);

    auto outcome = controller.run(forwarded, launcher_args);
    spdlog::info("finished at {} with exit code {}: {}",
                 relay::run_stage_name(outcome.stage), outcome.exit_code, outcome.message);
    spdlog::shutdown();

    return outcome.exit_code;
}
