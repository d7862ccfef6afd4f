#include <doctest/doctest.h>
#include <relay/installer.hpp>

#include "test_support.hpp"

#include <algorithm>

using namespace relay;
using namespace relay::testing;

namespace {

// A distribution share with one published build
struct Share {
    TempDir dir;
    RemoteManifest manifest;

    explicit Share(const std::string& version, const std::string& content = "") {
        publish(version, content.empty() ? "app build " + version : content);
    }

    void publish(const std::string& version, const std::string& content) {
        std::string path = dir.file("app-" + version);
        write_text(path, content);
        manifest.version = version;
        manifest.url = path;
        manifest.sha256 = sha256_of(content);
    }
};

} // namespace

// ============================================================================
// Application Install
// ============================================================================

TEST_CASE("install_artifact installs the binary and then the marker") {
    Share share("1.2.0");
    TempDir install;
    auto state = make_installation_state(install.path(), "app", "tool");
    CountingDownloader downloader;

    auto result = install_artifact(application_request(state, share.manifest), downloader);

    CHECK(result.ok);
    CHECK(result.downloaded);
    CHECK(result.stage == InstallStage::Done);
    CHECK(read_text(state.app_path) == "app build 1.2.0");
    CHECK(installed_version(state) == "1.2.0");
    CHECK(result.sha256 == *share.manifest.sha256);
    CHECK(downloader.downloads == 1);
}

TEST_CASE("install_artifact is idempotent") {
    Share share("1.2.0");
    TempDir install;
    auto state = make_installation_state(install.path(), "app", "tool");
    CountingDownloader downloader;

    REQUIRE(install_artifact(application_request(state, share.manifest), downloader).ok);
    REQUIRE(downloader.downloads == 1);

    auto second = install_artifact(application_request(state, share.manifest), downloader);
    CHECK(second.ok);
    CHECK(second.skipped);
    CHECK_FALSE(second.downloaded);
    CHECK(second.stage == InstallStage::UpToDate);
    CHECK(downloader.downloads == 1);
}

TEST_CASE("install_artifact upgrades when the manifest is newer") {
    Share share("1.2");
    TempDir install;
    auto state = make_installation_state(install.path(), "app", "tool");
    CountingDownloader downloader;

    REQUIRE(install_artifact(application_request(state, share.manifest), downloader).ok);

    share.publish("1.10", "app build 1.10");
    auto result = install_artifact(application_request(state, share.manifest), downloader);
    CHECK(result.ok);
    CHECK(result.downloaded);
    CHECK(read_text(state.app_path) == "app build 1.10");
    CHECK(installed_version(state) == "1.10");
}

TEST_CASE("install_artifact keeps a newer local build") {
    Share share("1.0");
    TempDir install;
    auto state = make_installation_state(install.path(), "app", "tool");
    write_text(state.app_path, "local build 2.0");
    REQUIRE(write_version_marker(state.marker_path, "2.0").ok);
    CountingDownloader downloader;

    auto result = install_artifact(application_request(state, share.manifest), downloader);
    CHECK(result.ok);
    CHECK(result.skipped);
    CHECK(downloader.downloads == 0);
    CHECK(read_text(state.app_path) == "local build 2.0");
    CHECK(installed_version(state) == "2.0");
}

TEST_CASE("install_artifact reinstalls when the marker is missing") {
    Share share("1.0");
    TempDir install;
    auto state = make_installation_state(install.path(), "app", "tool");
    write_text(state.app_path, "unknown build");
    CountingDownloader downloader;

    auto result = install_artifact(application_request(state, share.manifest), downloader);
    CHECK(result.ok);
    CHECK(result.downloaded);
    CHECK(read_text(state.app_path) == "app build 1.0");
}

TEST_CASE("install_artifact rejects a tampered download") {
    Share share("1.0");
    TempDir install;
    auto state = make_installation_state(install.path(), "app", "tool");
    CountingDownloader downloader;

    REQUIRE(install_artifact(application_request(state, share.manifest), downloader).ok);

    // New version published, but the bytes on the share do not match its digest
    share.publish("1.1", "app build 1.1");
    write_text(share.manifest.url, "app build 1.1 with a trojan");

    auto result = install_artifact(application_request(state, share.manifest), downloader);
    CHECK_FALSE(result.ok);
    CHECK(result.stage == InstallStage::Verify);
    CHECK(result.error.find("mismatch") != std::string::npos);
    CHECK(read_text(state.app_path) == "app build 1.0");
    CHECK(installed_version(state) == "1.0");
    CHECK(result.available());
}

TEST_CASE("install_artifact without a digest installs unverified") {
    Share share("1.0");
    share.manifest.sha256.reset();
    TempDir install;
    auto state = make_installation_state(install.path(), "app", "tool");
    CountingDownloader downloader;

    auto result = install_artifact(application_request(state, share.manifest), downloader);
    CHECK(result.ok);
    CHECK(result.sha256 == sha256_of("app build 1.0"));
}

TEST_CASE("install_artifact keeps the previous install when the source is unreachable") {
    Share share("1.0");
    TempDir install;
    auto state = make_installation_state(install.path(), "app", "tool");
    CountingDownloader downloader;
    REQUIRE(install_artifact(application_request(state, share.manifest), downloader).ok);

    share.manifest.version = "1.1";
    share.manifest.url = share.dir.file("not-there");

    auto result = install_artifact(application_request(state, share.manifest), downloader);
    CHECK_FALSE(result.ok);
    CHECK(result.stage == InstallStage::Download);
    CHECK(read_text(state.app_path) == "app build 1.0");
    CHECK(installed_version(state) == "1.0");
}

TEST_CASE("install_artifact leaves no temporary files in the install directory") {
    Share share("1.0");
    TempDir install;
    auto state = make_installation_state(install.path(), "app", "tool");
    CountingDownloader downloader;

    REQUIRE(install_artifact(application_request(state, share.manifest), downloader).ok);

    auto entries = list_directory(install.path());
    std::sort(entries.begin(), entries.end());
    CHECK(entries == std::vector<std::string>{executable_file_name("app"), "version.txt"});
}

// ============================================================================
// Old Copies
// ============================================================================

TEST_CASE("find_backup_copies matches versioned and renamed copies only") {
    TempDir dir;
    for (const char* name : {"app", "app-1.0", "app_2", "app.old", "app.bak", "app-beta",
                             "application", "other-1.0", ".app.tmp.1234abcd"}) {
        write_text(dir.file(name), "x");
    }

    auto backups = find_backup_copies(dir.path(), "app");
    std::vector<std::string> names;
    for (const auto& path : backups) names.push_back(get_filename(path));
    std::sort(names.begin(), names.end());

    CHECK(names == std::vector<std::string>{"app-1.0", "app.bak", "app.old", "app_2"});
}

TEST_CASE("find_backup_copies respects the extension") {
    TempDir dir;
    for (const char* name : {"app.exe", "app-1.2.exe", "app-1.2.dll"}) {
        write_text(dir.file(name), "x");
    }

    auto backups = find_backup_copies(dir.path(), "app.exe");
    REQUIRE(backups.size() == 1);
    CHECK(get_filename(backups[0]) == "app-1.2.exe");
}

TEST_CASE("install_artifact removes old copies after a successful install") {
    Share share("2.0");
    TempDir install;
    auto state = make_installation_state(install.path(), "app", "tool");
    std::string old_copy = join_path(install.path(), executable_file_name("app") + ".old");
    write_text(old_copy, "stale");
    CountingDownloader downloader;

    auto result = install_artifact(application_request(state, share.manifest), downloader);
    CHECK(result.ok);
    CHECK_FALSE(path_exists(old_copy));
    CHECK(result.removed_backups == std::vector<std::string>{old_copy});
}

// ============================================================================
// Auxiliary Tool
// ============================================================================

TEST_CASE("tool_request is absent without a tool url") {
    Share share("1.0");
    auto state = make_installation_state("/data/Tool", "app", "tool");
    CHECK_FALSE(tool_request(state, share.manifest).has_value());
}

TEST_CASE("tool install downloads once and then trusts the verified file") {
    Share share("1.0");
    write_text(share.dir.file("tool-src"), "tool bytes");
    share.manifest.pbi_tools_url = share.dir.file("tool-src");
    share.manifest.pbi_tools_sha256 = sha256_of("tool bytes");

    TempDir install;
    auto state = make_installation_state(install.path(), "app", "tool");
    CountingDownloader downloader;

    auto request = tool_request(state, share.manifest);
    REQUIRE(request.has_value());
    CHECK_FALSE(request->version.has_value());

    auto first = install_artifact(*request, downloader);
    CHECK(first.ok);
    CHECK(read_text(state.tool_path) == "tool bytes");
    CHECK_FALSE(path_exists(state.marker_path));

    auto second = install_artifact(*request, downloader);
    CHECK(second.skipped);
    CHECK(downloader.downloads == 1);
}

TEST_CASE("tool install replaces a file that does not match the digest") {
    Share share("1.0");
    write_text(share.dir.file("tool-src"), "tool bytes");
    share.manifest.pbi_tools_url = share.dir.file("tool-src");
    share.manifest.pbi_tools_sha256 = sha256_of("tool bytes");

    TempDir install;
    auto state = make_installation_state(install.path(), "app", "tool");
    write_text(state.tool_path, "corrupted");
    CountingDownloader downloader;

    auto result = install_artifact(*tool_request(state, share.manifest), downloader);
    CHECK(result.ok);
    CHECK(result.downloaded);
    CHECK(read_text(state.tool_path) == "tool bytes");
}

TEST_CASE("install_stage_name names every stage") {
    CHECK(std::string(install_stage_name(InstallStage::UpToDate)) == "up-to-date");
    CHECK(std::string(install_stage_name(InstallStage::Verify)) == "verify");
    CHECK(std::string(install_stage_name(InstallStage::Done)) == "done");
}
