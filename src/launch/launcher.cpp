#include "relay/launcher.hpp"

#include <spdlog/spdlog.h>

namespace relay {

SpawnResult DetachedSpawner::spawn(const SpawnRequest& request) {
    return spawn_detached(request);
}

LaunchResult launch_process(const std::string& exe_path,
                            const std::vector<std::string>& args,
                            const std::string& cwd,
                            Spawner& spawner) {
    LaunchResult result;

    if (exe_path.empty()) {
        result.error = "no executable to launch";
        return result;
    }

    if (!is_regular_file(exe_path)) {
        result.error = "executable not found: " + exe_path;
        return result;
    }

    SpawnRequest request;
    request.argv.push_back(exe_path);
    request.argv.insert(request.argv.end(), args.begin(), args.end());
    request.cwd = cwd;

    auto spawned = spawner.spawn(request);
    if (!spawned.ok) {
        result.error = "failed to start " + exe_path + ": " + spawned.error;
        return result;
    }

    spdlog::info("started {} (pid {})", exe_path, spawned.pid);
    result.ok = true;
    result.pid = spawned.pid;
    return result;
}

LaunchResult launch_process(const std::string& exe_path,
                            const std::vector<std::string>& args,
                            const std::string& cwd) {
    DetachedSpawner spawner;
    return launch_process(exe_path, args, cwd, spawner);
}

} // namespace relay
