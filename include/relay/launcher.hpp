#pragma once

#include "relay/platform.hpp"

#include <string>
#include <vector>

namespace relay {

// ============================================================================
// Spawning
// ============================================================================

/**
 * Starts detached processes. The launcher and the self-update handoff go
 * through this so tests can observe what would have been started.
 */
class Spawner {
public:
    virtual ~Spawner() = default;
    virtual SpawnResult spawn(const SpawnRequest& request) = 0;
};

/// Spawner backed by spawn_detached()
class DetachedSpawner : public Spawner {
public:
    SpawnResult spawn(const SpawnRequest& request) override;
};

// ============================================================================
// Process Launcher
// ============================================================================

struct LaunchResult {
    bool ok = false;
    std::string error;
    ProcessId pid = 0;
};

/**
 * @brief Start the managed application and return without waiting for it
 *
 * @param exe_path Binary to start; must exist
 * @param args Arguments forwarded verbatim (argv[1..])
 * @param cwd Working directory of the child
 */
LaunchResult launch_process(const std::string& exe_path,
                            const std::vector<std::string>& args,
                            const std::string& cwd,
                            Spawner& spawner);

LaunchResult launch_process(const std::string& exe_path,
                            const std::vector<std::string>& args,
                            const std::string& cwd);

} // namespace relay
