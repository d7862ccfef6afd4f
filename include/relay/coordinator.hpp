#pragma once

/**
 * @file coordinator.hpp
 * @brief Single-instance coordination with an already-running application
 *
 * Before a new build is installed or launched, any instance advertised by the
 * runtime descriptor is either reused (same version) or retired:
 *
 * ```
 * NoRuntime ─────────────────────────────────────────────► proceed
 * CheckRunning ── ping fails ────────────────────────────► proceed
 *      │ ping ok, same version ──► Reuse ────────────────► exit 0
 *      ▼
 * ShutdownRequested ─► WaitExit ── stops answering ─► Exited ─► proceed
 *                          │ still answering
 *                          ▼
 *                     EscalateKill ─► WaitExit2 ── gone ─► Exited ─► proceed
 *                                         │ still answering
 *                                         ▼
 *                                      Blocked ──────────► error, exit 1
 * ```
 *
 * Every wait is bounded by a poll count, so a wedged peer can delay a launch
 * but never hang it. A forced kill is only issued after the descriptor's pid
 * has been resolved to this application's binary inside the install
 * directory.
 */

#include "relay/http_client.hpp"
#include "relay/platform.hpp"
#include "relay/runtime_descriptor.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace relay {

enum class CoordinatorState {
    NoRuntime,
    CheckRunning,
    Reuse,
    ShutdownRequested,
    WaitExit,
    Exited,
    EscalateKill,
    WaitExit2,
    Blocked
};

/// What the caller should do next
enum class CoordinatorDecision {
    Proceed,    // install and launch
    Reuse,      // instance presented to the user; exit successfully
    Blocked     // instance could not be retired; report and exit with failure
};

struct CoordinatorOptions {
    std::string descriptor_path;
    std::string install_dir;
    std::string app_file_name;      // expected image name of a killable instance
    std::chrono::milliseconds ping_timeout{1000};
    std::chrono::milliseconds shutdown_timeout{2000};
    std::chrono::milliseconds poll_interval{250};
    int graceful_polls = 20;
    int kill_polls = 12;
};

struct PingResult {
    bool running = false;
    std::string version;
    std::string error;
};

struct CoordinatorOutcome {
    CoordinatorDecision decision = CoordinatorDecision::Proceed;
    CoordinatorState final_state = CoordinatorState::NoRuntime;
    std::vector<CoordinatorState> trace;
    std::optional<RuntimeDescriptor> descriptor;
    std::string running_version;
    int pings = 0;
    int shutdown_requests = 0;
    int kill_attempts = 0;
    std::string error;
};

// ============================================================================
// Collaborators
// ============================================================================

/**
 * Process inspection and termination, abstracted for tests.
 */
class ProcessControl {
public:
    virtual ~ProcessControl() = default;
    virtual std::optional<ProcessHandle> resolve(ProcessId pid) = 0;
    virtual TerminateResult terminate(ProcessId pid) = 0;
};

class SystemProcessControl : public ProcessControl {
public:
    std::optional<ProcessHandle> resolve(ProcessId pid) override;
    TerminateResult terminate(ProcessId pid) override;
};

/**
 * Brings an already-running instance to the user's attention.
 */
class InstancePresenter {
public:
    virtual ~InstancePresenter() = default;
    virtual bool present(const RuntimeDescriptor& descriptor) = 0;
};

/// Opens the instance's endpoint in the default browser
class BrowserPresenter : public InstancePresenter {
public:
    bool present(const RuntimeDescriptor& descriptor) override;
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

// std::this_thread::sleep_for
SleepFunction real_sleep();

// ============================================================================
// InstanceCoordinator
// ============================================================================

class InstanceCoordinator {
public:
    InstanceCoordinator(CoordinatorOptions options,
                        HttpClient& http,
                        ProcessControl& processes,
                        InstancePresenter& presenter,
                        SleepFunction sleep = real_sleep());

    /**
     * @brief Run the state machine once
     * @param target_version Version the run is about to install or launch.
     *        Empty when unknown, in which case a live instance is reused.
     */
    CoordinatorOutcome coordinate(const std::string& target_version);

    /// GET /ping; running only for a 2xx JSON body with ok == true
    PingResult ping(const RuntimeDescriptor& descriptor);

    /// POST /shutdown with the validation token; true on transport success
    bool request_shutdown(const RuntimeDescriptor& descriptor);

    /// True if descriptor.pid is this application's binary in the install dir
    bool validate_kill_target(const RuntimeDescriptor& descriptor, std::string& reason);

private:
    // Poll until the instance stops answering; false if it never does
    bool wait_for_exit(const RuntimeDescriptor& descriptor, int polls, CoordinatorOutcome& outcome);

    void enter(CoordinatorOutcome& outcome, CoordinatorState state);
    CoordinatorOutcome& finish(CoordinatorOutcome& outcome, CoordinatorDecision decision);

    CoordinatorOptions options_;
    HttpClient& http_;
    ProcessControl& processes_;
    InstancePresenter& presenter_;
    SleepFunction sleep_;
};

const char* coordinator_state_name(CoordinatorState state);

} // namespace relay
