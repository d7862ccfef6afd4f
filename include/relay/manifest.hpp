#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace relay {

// ============================================================================
// Remote Manifest
// ============================================================================
//
// JSON document published next to the distributed binaries:
//
//   {
//     "version": "1.4.2",
//     "url": "\\\\server\\share\\validation-ui-1.4.2.exe",
//     "sha256": "...",
//     "pbi_tools_url": "...",      "pbi_tools_sha256": "...",
//     "launcher_url": "...",       "launcher_sha256": "..."
//   }
//
// Only version and url are needed to describe an update; every other field
// may be absent independently. Unknown fields are ignored.

struct RemoteManifest {
    std::string version;
    std::string url;
    std::optional<std::string> sha256;
    std::optional<std::string> pbi_tools_url;
    std::optional<std::string> pbi_tools_sha256;
    std::optional<std::string> launcher_url;
    std::optional<std::string> launcher_sha256;
};

enum class ManifestStatus {
    Ok,             // manifest describes an available build
    Unavailable,    // document read but has no version/url
    Failed          // unreachable, timed out or malformed
};

struct ManifestFetchResult {
    ManifestStatus status = ManifestStatus::Failed;
    std::optional<RemoteManifest> manifest;
    std::string error;

    bool ok() const { return status == ManifestStatus::Ok; }
};

// Parse a manifest document
ManifestFetchResult parse_manifest(const std::string& json_text);

// Read and parse the manifest at location (path, file: reference or http(s)
// URL). Never throws; failures are reported through the status.
// timeout applies to http(s) locations. Paths, including UNC shares, are read
// with plain file IO and are bounded only by the OS network redirector.
ManifestFetchResult fetch_manifest(const std::string& location,
                                   std::chrono::milliseconds timeout);

const char* manifest_status_name(ManifestStatus status);

} // namespace relay
