#include <doctest/doctest.h>
#include <relay/launcher.hpp>

#include "test_support.hpp"

#include <chrono>
#include <thread>

using namespace relay;
using namespace relay::testing;

TEST_CASE("launch_process forwards arguments verbatim") {
    TempDir install;
    std::string exe = install.file("app");
    write_text(exe, "binary");
    RecordingSpawner spawner;

    auto result = launch_process(exe, {"--open", "a file.pbix", ""}, install.path(), spawner);
    CHECK(result.ok);
    CHECK(result.pid == 4242);

    REQUIRE(spawner.requests.size() == 1);
    CHECK(spawner.requests[0].argv ==
          std::vector<std::string>{exe, "--open", "a file.pbix", ""});
    CHECK(spawner.requests[0].cwd == install.path());
}

TEST_CASE("launch_process refuses a missing binary") {
    TempDir install;
    RecordingSpawner spawner;

    auto result = launch_process(install.file("app"), {}, install.path(), spawner);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("not found") != std::string::npos);
    CHECK(spawner.requests.empty());

    CHECK_FALSE(launch_process("", {}, install.path(), spawner).ok);
}

TEST_CASE("launch_process reports a spawn failure") {
    TempDir install;
    write_text(install.file("app"), "binary");
    RecordingSpawner spawner;
    spawner.fail = true;

    auto result = launch_process(install.file("app"), {}, install.path(), spawner);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("spawn refused") != std::string::npos);
}

#ifndef _WIN32
TEST_CASE("launch_process starts a detached child in the install directory") {
    TempDir install;
    std::string exe = install.file("app");
    write_text(exe, "#!/bin/sh\nprintf '%s|' \"$(pwd)\" \"$@\" > out.tmp && mv out.tmp out.txt\n");
    REQUIRE(atomic_install_file(exe, install.file("app.run")).ok);

    auto result = launch_process(install.file("app.run"), {"x y"}, install.path());
    REQUIRE(result.ok);

    std::string out = install.file("out.txt");
    for (int i = 0; i < 100 && !path_exists(out); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    REQUIRE(path_exists(out));

    std::string content = read_text(out);
    CHECK(content.size() > 5);
    CHECK(content.compare(content.size() - 5, 5, "|x y|") == 0);
}

TEST_CASE("launch_process reports a file that cannot be executed") {
    TempDir install;
    std::string exe = install.file("app");
    write_text(exe, "not a program");

    auto result = launch_process(exe, {}, install.path());
    CHECK_FALSE(result.ok);
}
#endif
