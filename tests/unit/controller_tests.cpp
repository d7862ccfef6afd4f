#include <doctest/doctest.h>
#include <relay/controller.hpp>
#include <relay/install_state.hpp>

#include "test_support.hpp"

using namespace relay;
using namespace relay::testing;

namespace {

// A share with published binaries, an install directory and fakes for
// everything outside the process
struct World {
    TempDir share;
    TempDir install;
    TempDir bin;

    CountingDownloader downloader;
    FakeInstance instance;
    RecordingPresenter presenter;
    RecordingSpawner spawner;
    RecordingNotifier notifier;
    SleepRecorder sleeper;

    LauncherConfig config;
    nlohmann::json manifest;

    World() {
        config = default_launcher_config();
        config.app_title = "Validation Tool";
        config.support_message = "Ask the data team.";
        config.app_exe = "app";
        config.tool_exe = "tool";
        config.install_dir = install.path();
        config.manifest = share.file("latest.json");

        instance.alive = false;
        instance.executable_path = app_path();
        write_text(bin.file("relay-launcher"), "launcher v1");
    }

    std::string app_path() const {
        return join_path(install.path(), executable_file_name("app"));
    }

    std::string tool_path() const {
        return join_path(install.path(), executable_file_name("tool"));
    }

    void publish(const std::string& version) {
        std::string content = "app build " + version;
        write_text(share.file("app-" + version), content);
        manifest["version"] = version;
        manifest["url"] = share.file("app-" + version);
        manifest["sha256"] = sha256_of(content);
        write_manifest();
    }

    void publish_tool(const std::string& content) {
        write_text(share.file("tool-src"), content);
        manifest["pbi_tools_url"] = share.file("tool-src");
        manifest["pbi_tools_sha256"] = sha256_of(content);
        write_manifest();
    }

    void publish_launcher(const std::string& content) {
        write_text(share.file("relay-launcher"), content);
        manifest["launcher_url"] = share.file("relay-launcher");
        manifest["launcher_sha256"] = sha256_of(content);
        write_manifest();
    }

    void write_manifest() { write_text(share.file("latest.json"), manifest.dump(2)); }

    // A previous instance advertising itself in the install directory
    void start_instance(const std::string& version) {
        instance.alive = true;
        instance.version = version;
        write_text(join_path(install.path(), "runtime.json"), runtime_json(8765, "tok", 4242));
    }

    RunOutcome run(const std::vector<std::string>& args = {}) { return run(args, args); }

    RunOutcome run(const std::vector<std::string>& args,
                   const std::vector<std::string>& launcher_args) {
        ControllerServices services{downloader, instance, instance, presenter,
                                    spawner,    notifier, sleeper.function()};
        Controller controller(config, bin.file("relay-launcher"), services);
        return controller.run(args, launcher_args);
    }
};

} // namespace

// ============================================================================
// Install and Launch
// ============================================================================

TEST_CASE("first run installs the application and launches it") {
    World w;
    w.publish("1.2.0");

    auto outcome = w.run({"--report", "Q3 totals.pbix"});

    CHECK(outcome.exit_code == 0);
    CHECK(outcome.stage == RunStage::Done);
    CHECK(outcome.manifest_status == ManifestStatus::Ok);
    REQUIRE(outcome.application.has_value());
    CHECK(outcome.application->downloaded);
    CHECK(read_text(w.app_path()) == "app build 1.2.0");
    CHECK(read_version_marker(join_path(w.install.path(), kVersionMarkerName)) == "1.2.0");

    REQUIRE(w.spawner.requests.size() == 1);
    CHECK(w.spawner.requests[0].argv ==
          std::vector<std::string>{w.app_path(), "--report", "Q3 totals.pbix"});
    CHECK(w.spawner.requests[0].cwd == w.install.path());
    CHECK(outcome.launched_pid == 4242);
    CHECK(w.notifier.messages.empty());
}

TEST_CASE("a second run with an unchanged manifest downloads nothing") {
    World w;
    w.publish("1.2.0");
    REQUIRE(w.run().exit_code == 0);
    REQUIRE(w.downloader.downloads == 1);

    auto outcome = w.run();
    CHECK(outcome.exit_code == 0);
    CHECK(outcome.application->skipped);
    CHECK(w.downloader.downloads == 1);
    CHECK(w.spawner.requests.size() == 2);
}

TEST_CASE("the auxiliary tool is installed alongside the application") {
    World w;
    w.publish("1.0");
    w.publish_tool("tool bytes");

    auto outcome = w.run();
    CHECK(outcome.exit_code == 0);
    REQUIRE(outcome.tool.has_value());
    CHECK(outcome.tool->ok);
    CHECK(read_text(w.tool_path()) == "tool bytes");
}

TEST_CASE("a tampered update keeps the installed build and still launches it") {
    World w;
    w.publish("1.0");
    REQUIRE(w.run().exit_code == 0);

    w.publish("1.1");
    write_text(w.share.file("app-1.1"), "app build 1.1 tampered");

    auto outcome = w.run();
    CHECK(outcome.exit_code == 0);
    CHECK_FALSE(outcome.application->ok);
    CHECK(read_text(w.app_path()) == "app build 1.0");
    CHECK(read_version_marker(join_path(w.install.path(), kVersionMarkerName)) == "1.0");
    CHECK(w.spawner.requests.size() == 2);
    CHECK(w.notifier.messages.empty());
}

TEST_CASE("an unreachable manifest launches what is installed") {
    World w;
    w.publish("1.0");
    REQUIRE(w.run().exit_code == 0);

    w.config.manifest = w.share.file("moved.json");
    auto outcome = w.run();
    CHECK(outcome.exit_code == 0);
    CHECK(outcome.manifest_status == ManifestStatus::Failed);
    CHECK_FALSE(outcome.application.has_value());
    CHECK(w.spawner.requests.size() == 2);
}

TEST_CASE("nothing installed and no manifest reports the support message") {
    World w;
    w.config.manifest = "";

    auto outcome = w.run();
    CHECK(outcome.exit_code == 1);
    CHECK(outcome.stage == RunStage::Launch);
    REQUIRE(w.notifier.messages.size() == 1);
    CHECK(w.notifier.messages[0] == "Validation Tool is not installed. Ask the data team.");
    CHECK(w.spawner.requests.empty());
}

TEST_CASE("a launch failure is reported") {
    World w;
    w.publish("1.0");
    w.spawner.fail = true;

    auto outcome = w.run();
    CHECK(outcome.exit_code == 1);
    CHECK(outcome.stage == RunStage::Launch);
    CHECK(w.notifier.messages.size() == 1);
}

// ============================================================================
// Running Instances
// ============================================================================

TEST_CASE("a running instance of the current version is reused") {
    World w;
    w.publish("1.2.0");
    w.start_instance("1.2");

    auto outcome = w.run();
    CHECK(outcome.exit_code == 0);
    CHECK(outcome.reused());
    CHECK(w.presenter.presented == 1);
    CHECK(w.spawner.requests.empty());
    CHECK(w.downloader.downloads == 0);
}

TEST_CASE("without a manifest the installed version decides about reuse") {
    World w;
    w.publish("1.0");
    REQUIRE(w.run().exit_code == 0);

    w.config.manifest = w.share.file("moved.json");
    w.start_instance("1.0");

    auto outcome = w.run();
    CHECK(outcome.reused());
    CHECK(w.spawner.requests.size() == 1);
}

TEST_CASE("an outdated instance is stopped before the update is installed") {
    World w;
    w.publish("1.0");
    REQUIRE(w.run().exit_code == 0);

    w.publish("1.1");
    w.start_instance("1.0");

    auto outcome = w.run();
    CHECK(outcome.exit_code == 0);
    REQUIRE(outcome.coordination.has_value());
    CHECK(outcome.coordination->final_state == CoordinatorState::Exited);
    CHECK(w.instance.shutdown_requests == 1);
    CHECK(w.instance.kills == 0);
    CHECK(read_text(w.app_path()) == "app build 1.1");
    CHECK(w.spawner.requests.size() == 2);
}

TEST_CASE("an instance that cannot be stopped blocks the run") {
    World w;
    w.publish("1.0");
    REQUIRE(w.run().exit_code == 0);

    w.publish("1.1");
    w.start_instance("1.0");
    w.instance.honors_shutdown = false;
    w.instance.dies_on_kill = false;

    auto outcome = w.run();
    CHECK(outcome.exit_code == 1);
    CHECK(outcome.stage == RunStage::Coordinate);
    CHECK_FALSE(outcome.application.has_value());
    CHECK(read_text(w.app_path()) == "app build 1.0");
    REQUIRE(w.notifier.messages.size() == 1);
    CHECK(w.notifier.messages[0].find("still running") != std::string::npos);
    CHECK(w.spawner.requests.size() == 1);
}

// ============================================================================
// Launcher Handoff
// ============================================================================

TEST_CASE("a newer launcher hands off before anything else happens") {
    World w;
    w.publish("1.0");
    w.publish_launcher("launcher v2");

    auto outcome = w.run({"--report", "x"});
    CHECK(outcome.exit_code == 0);
    CHECK(outcome.handed_off());
    CHECK(outcome.stage == RunStage::Handoff);
    CHECK_FALSE(outcome.coordination.has_value());
    CHECK_FALSE(outcome.application.has_value());
    CHECK_FALSE(path_exists(w.app_path()));

    // Only the helper was started
    REQUIRE(w.spawner.requests.size() == 1);
    CHECK(w.spawner.requests[0].argv.back().find("relay-handoff-") != std::string::npos);
}

#ifndef _WIN32
TEST_CASE("the relaunch replays the launcher's own options") {
    World w;
    w.publish("1.0");
    w.publish_launcher("launcher v2");

    std::vector<std::string> launcher_args{"--relay-install-dir", w.install.path(),
                                           "--relay-log-level", "debug",
                                           "--report", "x"};
    auto outcome = w.run({"--report", "x"}, launcher_args);
    REQUIRE(outcome.handed_off());

    REQUIRE(w.spawner.requests.size() == 1);
    std::string script = read_text(w.spawner.requests[0].argv.back());
    auto relaunch = script.find("RELAY_HANDOFF=1");
    REQUIRE(relaunch != std::string::npos);
    std::string relaunch_line = script.substr(relaunch, script.find('\n', relaunch) - relaunch);

    auto option = relaunch_line.find("--relay-install-dir");
    REQUIRE(option != std::string::npos);
    CHECK(relaunch_line.find(w.install.path(), option) != std::string::npos);
    CHECK(relaunch_line.find("--relay-log-level") != std::string::npos);
    auto forwarded = relaunch_line.find("--report");
    REQUIRE(forwarded != std::string::npos);
    CHECK(forwarded > option);
}
#endif

TEST_CASE("a relaunched launcher continues with the normal run") {
    World w;
    w.publish("1.0");
    w.publish_launcher("launcher v2");
    w.config.relaunched = true;

    auto outcome = w.run();
    CHECK(outcome.exit_code == 0);
    REQUIRE(outcome.handoff.has_value());
    CHECK(*outcome.handoff == HandoffStatus::Relaunched);
    CHECK(outcome.stage == RunStage::Done);
    CHECK(read_text(w.app_path()) == "app build 1.0");
}

TEST_CASE("launcher_exe names the binary that is replaced") {
    World w;
    w.publish("1.0");
    w.publish_launcher("launcher v2");
    w.config.launcher_exe = "other-launcher";

    // No such file beside the running launcher, so nothing is handed off
    auto outcome = w.run();
    REQUIRE(outcome.handoff.has_value());
    CHECK(*outcome.handoff == HandoffStatus::Failed);
    CHECK(w.downloader.per_source.count(w.share.file("relay-launcher")) == 0);
    CHECK(outcome.exit_code == 0);
}

TEST_CASE("run_stage_name names every stage") {
    CHECK(std::string(run_stage_name(RunStage::Handoff)) == "handoff");
    CHECK(std::string(run_stage_name(RunStage::Done)) == "done");
}
