#include "relay/coordinator.hpp"
#include "relay/version.hpp"

#include <thread>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace relay {

const char* coordinator_state_name(CoordinatorState state) {
    switch (state) {
        case CoordinatorState::NoRuntime: return "no-runtime";
        case CoordinatorState::CheckRunning: return "check-running";
        case CoordinatorState::Reuse: return "reuse";
        case CoordinatorState::ShutdownRequested: return "shutdown-requested";
        case CoordinatorState::WaitExit: return "wait-exit";
        case CoordinatorState::Exited: return "exited";
        case CoordinatorState::EscalateKill: return "escalate-kill";
        case CoordinatorState::WaitExit2: return "wait-exit-2";
        case CoordinatorState::Blocked: return "blocked";
    }
    return "unknown";
}

// ============================================================================
// Default collaborators
// ============================================================================

std::optional<ProcessHandle> SystemProcessControl::resolve(ProcessId pid) {
    return resolve_process(pid);
}

TerminateResult SystemProcessControl::terminate(ProcessId pid) {
    return terminate_process(pid);
}

bool BrowserPresenter::present(const RuntimeDescriptor& descriptor) {
    return open_url(descriptor.base_url() + "/");
}

SleepFunction real_sleep() {
    return [](std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    };
}

// ============================================================================
// InstanceCoordinator
// ============================================================================

InstanceCoordinator::InstanceCoordinator(CoordinatorOptions options,
                                         HttpClient& http,
                                         ProcessControl& processes,
                                         InstancePresenter& presenter,
                                         SleepFunction sleep)
    : options_(std::move(options)),
      http_(http),
      processes_(processes),
      presenter_(presenter),
      sleep_(std::move(sleep)) {}

void InstanceCoordinator::enter(CoordinatorOutcome& outcome, CoordinatorState state) {
    outcome.final_state = state;
    outcome.trace.push_back(state);
    spdlog::debug("coordinator: {}", coordinator_state_name(state));
}

CoordinatorOutcome& InstanceCoordinator::finish(CoordinatorOutcome& outcome,
                                                CoordinatorDecision decision) {
    outcome.decision = decision;
    return outcome;
}

PingResult InstanceCoordinator::ping(const RuntimeDescriptor& descriptor) {
    PingResult result;

    HttpRequest request;
    request.url = descriptor.base_url() + "/ping";
    request.timeout = options_.ping_timeout;

    auto response = http_.send(request);
    if (!response.ok()) {
        result.error = response.transport_ok()
            ? "HTTP " + std::to_string(response.status_code)
            : response.error;
        return result;
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("malformed ping response: ") + e.what();
        return result;
    }

    if (!body.is_object() || !body.contains("ok") || !body["ok"].is_boolean()) {
        result.error = "ping response has no ok flag";
        return result;
    }

    if (!body["ok"].get<bool>()) {
        result.error = "instance reports not ok";
        return result;
    }

    if (body.contains("version") && body["version"].is_string()) {
        result.version = body["version"].get<std::string>();
    }

    result.running = true;
    return result;
}

bool InstanceCoordinator::request_shutdown(const RuntimeDescriptor& descriptor) {
    HttpRequest request;
    request.method = "POST";
    request.url = descriptor.base_url() + "/shutdown";
    request.headers["X-Validation-Token"] = descriptor.token;
    request.timeout = options_.shutdown_timeout;

    auto response = http_.send(request);
    if (!response.transport_ok()) {
        spdlog::warn("shutdown request to {} failed: {}", descriptor.base_url(), response.error);
        return false;
    }
    return true;
}

bool InstanceCoordinator::validate_kill_target(const RuntimeDescriptor& descriptor,
                                               std::string& reason) {
    if (descriptor.pid <= 0) {
        reason = "runtime descriptor has no pid";
        return false;
    }

    auto handle = processes_.resolve(descriptor.pid);
    if (!handle || handle->executable_path.empty()) {
        reason = "cannot resolve executable of pid " + std::to_string(descriptor.pid);
        return false;
    }

    if (!is_path_within(options_.install_dir, handle->executable_path)) {
        reason = "pid " + std::to_string(descriptor.pid) + " runs " + handle->executable_path +
                 ", outside " + options_.install_dir;
        return false;
    }

    if (!same_file_name(get_filename(handle->executable_path), options_.app_file_name)) {
        reason = "pid " + std::to_string(descriptor.pid) + " runs " + handle->executable_path +
                 ", not " + options_.app_file_name;
        return false;
    }

    return true;
}

bool InstanceCoordinator::wait_for_exit(const RuntimeDescriptor& descriptor, int polls,
                                        CoordinatorOutcome& outcome) {
    for (int i = 0; i < polls; ++i) {
        sleep_(options_.poll_interval);
        ++outcome.pings;
        if (!ping(descriptor).running) {
            return true;
        }
    }
    return false;
}

CoordinatorOutcome InstanceCoordinator::coordinate(const std::string& target_version) {
    CoordinatorOutcome outcome;

    auto descriptor = read_runtime_descriptor(options_.descriptor_path);
    if (!descriptor) {
        enter(outcome, CoordinatorState::NoRuntime);
        return finish(outcome, CoordinatorDecision::Proceed);
    }
    outcome.descriptor = descriptor;

    enter(outcome, CoordinatorState::CheckRunning);
    ++outcome.pings;
    auto status = ping(*descriptor);
    if (!status.running) {
        spdlog::info("no live instance at {} ({})", descriptor->base_url(), status.error);
        return finish(outcome, CoordinatorDecision::Proceed);
    }
    outcome.running_version = status.version;

    if (target_version.empty() || same_version(status.version, target_version)) {
        enter(outcome, CoordinatorState::Reuse);
        spdlog::info("instance {} already running at {}, reusing it",
                     status.version, descriptor->base_url());
        if (!presenter_.present(*descriptor)) {
            spdlog::warn("could not bring running instance at {} to the front",
                         descriptor->base_url());
        }
        return finish(outcome, CoordinatorDecision::Reuse);
    }

    spdlog::info("retiring running instance {} (target {})", status.version, target_version);

    if (!descriptor->token.empty()) {
        enter(outcome, CoordinatorState::ShutdownRequested);
        ++outcome.shutdown_requests;
        request_shutdown(*descriptor);

        enter(outcome, CoordinatorState::WaitExit);
        if (wait_for_exit(*descriptor, options_.graceful_polls, outcome)) {
            enter(outcome, CoordinatorState::Exited);
            spdlog::info("previous instance exited after shutdown request");
            return finish(outcome, CoordinatorDecision::Proceed);
        }
        spdlog::warn("instance at {} still answering after {} polls",
                     descriptor->base_url(), options_.graceful_polls);
    } else {
        spdlog::warn("runtime descriptor has no token, cannot request a graceful shutdown");
    }

    enter(outcome, CoordinatorState::EscalateKill);
    std::string reason;
    if (!validate_kill_target(*descriptor, reason)) {
        outcome.error = "refusing to terminate: " + reason;
        enter(outcome, CoordinatorState::Blocked);
        spdlog::error("{}", outcome.error);
        return finish(outcome, CoordinatorDecision::Blocked);
    }

    ++outcome.kill_attempts;
    auto killed = processes_.terminate(descriptor->pid);
    if (!killed.ok) {
        spdlog::warn("terminating pid {} failed: {}", descriptor->pid, killed.error);
    }

    enter(outcome, CoordinatorState::WaitExit2);
    if (wait_for_exit(*descriptor, options_.kill_polls, outcome)) {
        enter(outcome, CoordinatorState::Exited);
        spdlog::info("previous instance (pid {}) terminated", descriptor->pid);
        return finish(outcome, CoordinatorDecision::Proceed);
    }

    outcome.error = "the running instance (pid " + std::to_string(descriptor->pid) +
                    ") could not be stopped";
    enter(outcome, CoordinatorState::Blocked);
    spdlog::error("{}", outcome.error);
    return finish(outcome, CoordinatorDecision::Blocked);
}

} // namespace relay
