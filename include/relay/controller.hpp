#pragma once

#include "relay/config.hpp"
#include "relay/coordinator.hpp"
#include "relay/http_client.hpp"
#include "relay/installer.hpp"
#include "relay/launcher.hpp"
#include "relay/manifest.hpp"
#include "relay/self_update.hpp"
#include "relay/transfer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace relay {

// ============================================================================
// User-visible Failures
// ============================================================================

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void show_error(const std::string& title, const std::string& message) = 0;
};

/// Blocking modal on Windows, stderr elsewhere
class DialogNotifier : public Notifier {
public:
    void show_error(const std::string& title, const std::string& message) override;
};

// ============================================================================
// Run Controller
// ============================================================================

enum class RunStage {
    Manifest,
    Handoff,
    Coordinate,
    Install,
    Launch,
    Done
};

struct RunOutcome {
    int exit_code = 0;
    RunStage stage = RunStage::Manifest;
    std::string message;

    ManifestStatus manifest_status = ManifestStatus::Failed;
    std::optional<HandoffStatus> handoff;
    std::optional<CoordinatorOutcome> coordination;
    std::optional<InstallResult> application;
    std::optional<InstallResult> tool;
    ProcessId launched_pid = 0;

    bool handed_off() const { return handoff && *handoff == HandoffStatus::Started; }
    bool reused() const {
        return coordination && coordination->decision == CoordinatorDecision::Reuse;
    }
};

/// Everything the controller talks to outside its own process
struct ControllerServices {
    Downloader& downloader;
    HttpClient& http;
    ProcessControl& processes;
    InstancePresenter& presenter;
    Spawner& spawner;
    Notifier& notifier;
    SleepFunction sleep;
};

/**
 * @brief One launch: manifest, handoff, coordination, install, launch
 *
 * The manifest is fetched once and every later stage sees the same snapshot.
 * Download, verification and write failures fall back to whatever is already
 * installed. Only two conditions end a run with exit code 1, both reported
 * through the Notifier: nothing runnable is installed, or a previous instance
 * could not be stopped.
 */
class Controller {
public:
    Controller(LauncherConfig config, std::string launcher_path, ControllerServices services);

    /**
     * @param args Arguments forwarded to the application
     * @param launcher_args The launcher's own command line (without argv[0]),
     *        replayed when a launcher handoff relaunches the updated binary
     */
    RunOutcome run(const std::vector<std::string>& args,
                   const std::vector<std::string>& launcher_args);

    // Without launcher-private options both lists are the same
    RunOutcome run(const std::vector<std::string>& args) { return run(args, args); }

    const LauncherConfig& config() const { return config_; }

private:
    RunOutcome& fail(RunOutcome& outcome, RunStage stage, const std::string& message);

    LauncherConfig config_;
    std::string launcher_path_;
    ControllerServices services_;
};

const char* run_stage_name(RunStage stage);

} // namespace relay
