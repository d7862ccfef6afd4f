#pragma once

#include "relay/install_state.hpp"
#include "relay/manifest.hpp"
#include "relay/transfer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace relay {

// ============================================================================
// Artifact Installation
// ============================================================================

/**
 * @brief What to install and where
 *
 * version/marker_path are set for the application binary only; the marker is
 * rewritten after a successful install and consulted for idempotence.
 */
struct ArtifactRequest {
    std::string name;                           // for logs
    std::string target_path;
    std::string source;                         // path, file: or http(s) URL
    std::optional<std::string> expected_sha256;
    std::optional<std::string> version;
    std::string marker_path;
};

/// Step an install stopped at (Done on success)
enum class InstallStage {
    UpToDate,
    Download,
    Verify,
    Replace,
    Marker,
    Done
};

struct InstallResult {
    bool ok = false;
    bool skipped = false;           // already up to date, nothing downloaded
    bool downloaded = false;
    InstallStage stage = InstallStage::UpToDate;
    std::string error;
    std::string installed_path;     // always the target path
    std::string sha256;             // digest of the installed bytes, if installed
    std::vector<std::string> removed_backups;

    // A usable binary exists at installed_path (new or previous)
    bool available() const { return is_regular_file(installed_path); }
};

/**
 * @brief Download, verify and atomically install one artifact
 *
 * 1. Skip when already up to date (see is_up_to_date).
 * 2. Download into an isolated temporary directory.
 * 3. Verify the SHA-256 when one is expected.
 * 4. Copy into a sibling temp file and rename it over the target.
 * 5. Rewrite the version marker, then delete old versioned backups.
 *
 * Any failure leaves the previous installation untouched. Never throws.
 */
InstallResult install_artifact(const ArtifactRequest& request, Downloader& downloader);

// True when request needs no download
bool is_up_to_date(const ArtifactRequest& request);

// Files next to file_name in directory that look like kept older copies of
// it: "<stem>[-_.]<...digit...><ext>", "<name>.old", "<name>.bak"
std::vector<std::string> find_backup_copies(const std::string& directory,
                                            const std::string& file_name);

// Request for the application binary described by the manifest
ArtifactRequest application_request(const InstallationState& state,
                                    const RemoteManifest& manifest);

// Request for the auxiliary tool; nullopt when the manifest has no tool url
std::optional<ArtifactRequest> tool_request(const InstallationState& state,
                                            const RemoteManifest& manifest);

const char* install_stage_name(InstallStage stage);

} // namespace relay
