#include <doctest/doctest.h>
#include <relay/install_state.hpp>

#include "test_support.hpp"

using namespace relay;
using namespace relay::testing;

TEST_CASE("make_installation_state lays out the install directory") {
    auto state = make_installation_state("/data/Tool", "app", "helper");
    CHECK(state.install_dir == "/data/Tool");
    CHECK(state.app_path == join_path("/data/Tool", executable_file_name("app")));
    CHECK(state.tool_path == join_path("/data/Tool", executable_file_name("helper")));
    CHECK(state.marker_path == join_path("/data/Tool", "version.txt"));
}

TEST_CASE("app_available reflects the binary on disk") {
    TempDir temp;
    auto state = make_installation_state(temp.path(), "app", "helper");
    CHECK_FALSE(state.app_available());
    CHECK_FALSE(state.tool_available());

    write_text(state.app_path, "binary");
    CHECK(state.app_available());
}

TEST_CASE("version marker roundtrip trims the stored value") {
    TempDir temp;
    auto state = make_installation_state(temp.path(), "app", "helper");

    CHECK(installed_version(state).empty());
    REQUIRE(write_version_marker(state.marker_path, " 1.4.2\n").ok);
    CHECK(read_text(state.marker_path) == "1.4.2");
    CHECK(installed_version(state) == "1.4.2");
}

TEST_CASE("read_version_marker tolerates whitespace and a byte order mark") {
    TempDir temp;
    write_text(temp.file("version.txt"), "\xEF\xBB\xBF 2.0 \r\n");
    CHECK(read_version_marker(temp.file("version.txt")) == "2.0");
}

TEST_CASE("write_version_marker creates the install directory") {
    TempDir temp;
    std::string marker = temp.file("fresh/install/version.txt");
    CHECK(write_version_marker(marker, "1.0").ok);
    CHECK(read_version_marker(marker) == "1.0");
}
