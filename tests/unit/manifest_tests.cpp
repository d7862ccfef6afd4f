#include <doctest/doctest.h>
#include <relay/manifest.hpp>

#include "test_support.hpp"

using namespace relay;
using namespace relay::testing;

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("parse_manifest reads every field") {
    auto result = parse_manifest(R"({
        "version": "1.4.2",
        "url": "\\\\server\\share\\app-1.4.2.exe",
        "sha256": "ABCDEF",
        "pbi_tools_url": "https://example.com/tool",
        "pbi_tools_sha256": "0011",
        "launcher_url": "file:/srv/launcher",
        "launcher_sha256": "FFEE"
    })");

    REQUIRE(result.ok());
    const auto& m = *result.manifest;
    CHECK(m.version == "1.4.2");
    CHECK(m.url == "\\\\server\\share\\app-1.4.2.exe");
    CHECK(m.sha256 == std::optional<std::string>("abcdef"));
    CHECK(m.pbi_tools_url == std::optional<std::string>("https://example.com/tool"));
    CHECK(m.pbi_tools_sha256 == std::optional<std::string>("0011"));
    CHECK(m.launcher_url == std::optional<std::string>("file:/srv/launcher"));
    CHECK(m.launcher_sha256 == std::optional<std::string>("ffee"));
}

TEST_CASE("parse_manifest trims strings and drops empty optional fields") {
    auto result = parse_manifest(R"({"version": " 2.0 ", "url": " /srv/app ", "sha256": "  ", "pbi_tools_url": ""})");
    REQUIRE(result.ok());
    CHECK(result.manifest->version == "2.0");
    CHECK(result.manifest->url == "/srv/app");
    CHECK_FALSE(result.manifest->sha256.has_value());
    CHECK_FALSE(result.manifest->pbi_tools_url.has_value());
}

TEST_CASE("parse_manifest accepts a numeric version") {
    auto result = parse_manifest(R"({"version": 3, "url": "/srv/app"})");
    REQUIRE(result.ok());
    CHECK(result.manifest->version == "3");
}

TEST_CASE("parse_manifest ignores unknown fields and a byte order mark") {
    auto result = parse_manifest("\xEF\xBB\xBF{\"version\":\"1\",\"url\":\"/a\",\"notes\":[1,2]}");
    CHECK(result.ok());
}

TEST_CASE("parse_manifest without version or url is unavailable, not failed") {
    auto no_url = parse_manifest(R"({"version": "1.0"})");
    CHECK(no_url.status == ManifestStatus::Unavailable);
    CHECK_FALSE(no_url.manifest.has_value());

    auto no_version = parse_manifest(R"({"url": "/srv/app"})");
    CHECK(no_version.status == ManifestStatus::Unavailable);
}

TEST_CASE("parse_manifest rejects malformed documents") {
    CHECK(parse_manifest("{not json").status == ManifestStatus::Failed);
    CHECK(parse_manifest("[1, 2]").status == ManifestStatus::Failed);
    CHECK(parse_manifest("").status == ManifestStatus::Failed);
}

// ============================================================================
// Fetching
// ============================================================================

TEST_CASE("fetch_manifest reads a manifest from a path") {
    TempDir temp;
    write_text(temp.file("latest.json"), R"({"version": "1.1", "url": "/srv/app"})");

    auto result = fetch_manifest(temp.file("latest.json"), std::chrono::seconds(5));
    REQUIRE(result.ok());
    CHECK(result.manifest->version == "1.1");
}

TEST_CASE("fetch_manifest does not apply the timeout to path reads") {
    TempDir temp;
    write_text(temp.file("latest.json"), R"({"version": "1.1", "url": "/srv/app"})");

    CHECK(fetch_manifest(temp.file("latest.json"), std::chrono::milliseconds(0)).ok());
    CHECK(fetch_manifest("file:" + temp.file("latest.json"), std::chrono::milliseconds(0)).ok());
}

TEST_CASE("fetch_manifest fails for missing, empty or unreachable locations") {
    TempDir temp;
    CHECK(fetch_manifest(temp.file("missing.json"), std::chrono::seconds(1)).status ==
          ManifestStatus::Failed);
    CHECK(fetch_manifest("", std::chrono::seconds(1)).status == ManifestStatus::Failed);
    CHECK(fetch_manifest("http://127.0.0.1:1/latest.json", std::chrono::milliseconds(500)).status ==
          ManifestStatus::Failed);
}

TEST_CASE("manifest_status_name names every status") {
    CHECK(std::string(manifest_status_name(ManifestStatus::Ok)) == "ok");
    CHECK(std::string(manifest_status_name(ManifestStatus::Unavailable)) == "unavailable");
    CHECK(std::string(manifest_status_name(ManifestStatus::Failed)) == "failed");
}
