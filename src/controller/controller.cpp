#include "relay/controller.hpp"
#include "relay/install_state.hpp"

#include <spdlog/spdlog.h>

namespace relay {

const char* run_stage_name(RunStage stage) {
    switch (stage) {
        case RunStage::Manifest: return "manifest";
        case RunStage::Handoff: return "handoff";
        case RunStage::Coordinate: return "coordinate";
        case RunStage::Install: return "install";
        case RunStage::Launch: return "launch";
        case RunStage::Done: return "done";
    }
    return "unknown";
}

void DialogNotifier::show_error(const std::string& title, const std::string& message) {
    show_error_dialog(title, message);
}

Controller::Controller(LauncherConfig config, std::string launcher_path,
                       ControllerServices services)
    : config_(std::move(config)),
      launcher_path_(std::move(launcher_path)),
      services_(std::move(services)) {
    if (!config_.launcher_exe.empty() && !launcher_path_.empty()) {
        launcher_path_ = join_path(get_parent_directory(launcher_path_),
                                   executable_file_name(config_.launcher_exe));
    }
}

RunOutcome& Controller::fail(RunOutcome& outcome, RunStage stage, const std::string& message) {
    outcome.exit_code = 1;
    outcome.stage = stage;
    outcome.message = message;
    spdlog::critical("{}", message);
    services_.notifier.show_error(config_.app_title, message);
    return outcome;
}

RunOutcome Controller::run(const std::vector<std::string>& args,
                           const std::vector<std::string>& launcher_args) {
    RunOutcome outcome;

    InstallationState state = make_installation_state(config_.install_dir,
                                                      config_.app_exe, config_.tool_exe);

    // ------------------------------------------------------------------------
    // Manifest (fetched exactly once)
    // ------------------------------------------------------------------------

    outcome.stage = RunStage::Manifest;
    auto fetched = fetch_manifest(config_.manifest, config_.manifest_timeout);
    outcome.manifest_status = fetched.status;
    std::optional<RemoteManifest> manifest;
    if (fetched.ok()) {
        manifest = fetched.manifest;
        spdlog::info("manifest offers version {}", manifest->version);
    } else if (fetched.status == ManifestStatus::Unavailable) {
        spdlog::info("no update information available: {}", fetched.error);
    } else {
        spdlog::warn("manifest unavailable: {}", fetched.error);
    }

    // ------------------------------------------------------------------------
    // Launcher self-update
    // ------------------------------------------------------------------------

    if (manifest) {
        outcome.stage = RunStage::Handoff;

        HandoffOptions handoff;
        handoff.enabled = config_.self_update;
        handoff.relaunched = config_.relaunched;
        handoff.install_dir = config_.install_dir;
        handoff.launcher_path = launcher_path_;
        handoff.arguments = launcher_args;
        handoff.parent_pid = current_process_id();

        auto handed = try_update_self(*manifest, handoff, services_.downloader,
                                      services_.spawner);
        outcome.handoff = handed.status;
        if (handed.handoff_started()) {
            outcome.message = "launcher update in progress";
            return outcome;
        }
    }

    // ------------------------------------------------------------------------
    // Single instance
    // ------------------------------------------------------------------------

    outcome.stage = RunStage::Coordinate;

    std::string target_version = manifest ? manifest->version : installed_version(state);

    CoordinatorOptions coordination;
    coordination.descriptor_path = join_path(config_.install_dir, config_.runtime_descriptor);
    coordination.install_dir = config_.install_dir;
    coordination.app_file_name = executable_file_name(config_.app_exe);
    coordination.ping_timeout = config_.ping_timeout;
    coordination.shutdown_timeout = config_.shutdown_timeout;
    coordination.poll_interval = config_.poll_interval;
    coordination.graceful_polls = config_.graceful_polls;
    coordination.kill_polls = config_.kill_polls;

    InstanceCoordinator coordinator(coordination, services_.http, services_.processes,
                                    services_.presenter, services_.sleep);
    outcome.coordination = coordinator.coordinate(target_version);

    switch (outcome.coordination->decision) {
        case CoordinatorDecision::Reuse:
            outcome.stage = RunStage::Done;
            outcome.message = "reused running instance";
            return outcome;
        case CoordinatorDecision::Blocked:
            return fail(outcome, RunStage::Coordinate,
                        "A previous " + config_.app_title +
                            " window is still running and could not be closed. "
                            "Close it and try again.");
        case CoordinatorDecision::Proceed:
            break;
    }

    // ------------------------------------------------------------------------
    // Install
    // ------------------------------------------------------------------------

    if (manifest) {
        outcome.stage = RunStage::Install;

        outcome.application = install_artifact(application_request(state, *manifest),
                                               services_.downloader);
        if (auto tool = tool_request(state, *manifest)) {
            outcome.tool = install_artifact(*tool, services_.downloader);
        }
    }

    // ------------------------------------------------------------------------
    // Launch
    // ------------------------------------------------------------------------

    outcome.stage = RunStage::Launch;

    if (!state.app_available()) {
        return fail(outcome, RunStage::Launch,
                    config_.app_title + " is not installed. " + config_.support_message);
    }

    auto launched = launch_process(state.app_path, args, config_.install_dir, services_.spawner);
    if (!launched.ok) {
        return fail(outcome, RunStage::Launch, launched.error);
    }

    outcome.launched_pid = launched.pid;
    outcome.stage = RunStage::Done;
    outcome.message = "launched " + state.app_path;
    return outcome;
}

} // namespace relay
