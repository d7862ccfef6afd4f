#pragma once

/**
 * @file self_update.hpp
 * @brief Replacing the launcher's own binary
 *
 * A running executable cannot reliably overwrite itself, so the update is
 * handed to a short-lived helper script:
 *
 * 1. The new launcher is downloaded, verified and staged as
 *    `<launcher name>.staged` in the install directory.
 * 2. A helper script is written next to it and spawned detached.
 * 3. This process exits. The helper waits for it to disappear, moves the
 *    staged binary over the live one, removes itself and starts the new
 *    launcher with the same arguments and RELAY_HANDOFF=1.
 *
 * A run started with RELAY_HANDOFF set never hands off again, so a launcher
 * that keeps failing to replace itself still starts the application.
 */

#include "relay/launcher.hpp"
#include "relay/manifest.hpp"
#include "relay/transfer.hpp"

#include <string>
#include <vector>

namespace relay {

constexpr const char* kHandoffEnvironmentVariable = "RELAY_HANDOFF";
constexpr const char* kStagedSuffix = ".staged";

enum class HandoffStatus {
    Disabled,       // turned off, or no launcher_url/launcher_sha256 in the manifest
    Relaunched,     // this run was started by a helper; never hand off twice
    UpToDate,       // running binary already matches launcher_sha256
    Failed,         // something went wrong; continue with the current binary
    Started         // helper spawned; the caller must exit now
};

struct HandoffOptions {
    bool enabled = true;
    bool relaunched = false;                // RELAY_HANDOFF was set for this run
    std::string install_dir;
    std::string launcher_path;              // live binary to replace
    std::vector<std::string> arguments;     // forwarded to the new launcher
    ProcessId parent_pid = 0;
    int wait_seconds = 10;
};

struct HandoffResult {
    HandoffStatus status = HandoffStatus::Disabled;
    std::string error;
    std::string staged_path;
    std::string script_path;

    bool handoff_started() const { return status == HandoffStatus::Started; }
};

/// Everything the helper script needs to know
struct HandoffScript {
    ProcessId parent_pid = 0;
    int wait_seconds = 10;
    std::string staged_path;
    std::string target_path;
    std::string temp_path;                  // sibling of target_path
    std::vector<std::string> arguments;
};

// Script file extension for this platform (".sh" or ".cmd")
const char* handoff_script_extension();

// POSIX sh or Windows cmd text, depending on the build platform
std::string render_handoff_script(const HandoffScript& script);

HandoffResult try_update_self(const RemoteManifest& manifest,
                              const HandoffOptions& options,
                              Downloader& downloader,
                              Spawner& spawner);

const char* handoff_status_name(HandoffStatus status);

} // namespace relay
