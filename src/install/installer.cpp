#include "relay/installer.hpp"
#include "relay/version.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace relay {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string file_name_key(const std::string& name) {
#ifdef _WIN32
    return lowercase(name);
#else
    return name;
#endif
}

bool has_digit(const std::string& s) {
    return std::any_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool is_backup_of(const std::string& candidate, const std::string& file_name) {
    std::string entry = file_name_key(candidate);
    std::string name = file_name_key(file_name);

    if (entry == name) return false;
    if (entry == name + ".old" || entry == name + ".bak") return true;

    std::filesystem::path p(name);
    std::string stem = p.stem().string();
    std::string ext = p.extension().string();
    if (stem.empty()) return false;

    if (entry.size() <= stem.size() + 1 + ext.size()) return false;
    if (entry.compare(0, stem.size(), stem) != 0) return false;
    if (!ext.empty() && entry.compare(entry.size() - ext.size(), ext.size(), ext) != 0) return false;

    char separator = entry[stem.size()];
    if (separator != '-' && separator != '_' && separator != '.') return false;

    std::string middle = entry.substr(stem.size() + 1, entry.size() - stem.size() - 1 - ext.size());
    return has_digit(middle);
}

} // namespace

const char* install_stage_name(InstallStage stage) {
    switch (stage) {
        case InstallStage::UpToDate: return "up-to-date";
        case InstallStage::Download: return "download";
        case InstallStage::Verify: return "verify";
        case InstallStage::Replace: return "replace";
        case InstallStage::Marker: return "marker";
        case InstallStage::Done: return "done";
    }
    return "unknown";
}

std::vector<std::string> find_backup_copies(const std::string& directory,
                                            const std::string& file_name) {
    std::vector<std::string> backups;
    for (const auto& entry : list_directory(directory)) {
        if (is_backup_of(entry, file_name)) {
            std::string path = join_path(directory, entry);
            if (is_regular_file(path)) {
                backups.push_back(path);
            }
        }
    }
    std::sort(backups.begin(), backups.end());
    return backups;
}

bool is_up_to_date(const ArtifactRequest& request) {
    if (!is_regular_file(request.target_path)) {
        return false;
    }

    if (request.version && !request.marker_path.empty()) {
        std::string local = read_version_marker(request.marker_path);
        if (local.empty()) return false;
        // A newer local build is kept rather than downgraded
        return !is_newer(*request.version, local);
    }

    if (request.expected_sha256) {
        auto hash = compute_sha256_file(request.target_path);
        return hash.ok && hash.hex_digest == normalize_sha256(*request.expected_sha256);
    }

    return true;
}

InstallResult install_artifact(const ArtifactRequest& request, Downloader& downloader) {
    InstallResult result;
    result.installed_path = request.target_path;

    // 1. Idempotence
    if (is_up_to_date(request)) {
        spdlog::debug("{} is up to date at {}", request.name, request.target_path);
        result.ok = true;
        result.skipped = true;
        result.stage = InstallStage::UpToDate;
        return result;
    }

    // 2. Download into an isolated location
    result.stage = InstallStage::Download;
    auto download = downloader.download(request.source);
    if (!download.ok) {
        result.error = download.error;
        spdlog::warn("{}: download from {} failed: {}", request.name, request.source, result.error);
        return result;
    }
    result.downloaded = true;
    DownloadArtifact artifact = std::move(download.artifact);

    // 3. Integrity
    result.stage = InstallStage::Verify;
    std::string digest = artifact.sha256();
    if (digest.empty()) {
        auto hash = compute_sha256_file(artifact.path());
        if (!hash.ok) {
            result.error = hash.error;
            spdlog::warn("{}: {}", request.name, result.error);
            return result;
        }
        digest = hash.hex_digest;
    }
    if (request.expected_sha256) {
        std::string expected = normalize_sha256(*request.expected_sha256);
        if (digest != expected) {
            result.error = "SHA-256 mismatch: expected " + expected + ", got " + digest;
            spdlog::warn("{}: rejected download from {}: {}", request.name, request.source, result.error);
            return result;
        }
    }

    // 4. Atomic replace
    result.stage = InstallStage::Replace;
    std::string target_dir = get_parent_directory(request.target_path);
    if (!target_dir.empty()) {
        auto dir = atomic_create_directory(target_dir);
        if (!dir.ok) {
            result.error = "failed to create " + target_dir + ": " + dir.error;
            spdlog::warn("{}: {}", request.name, result.error);
            return result;
        }
    }

    auto replaced = atomic_install_file(artifact.path(), request.target_path);
    if (!replaced.ok) {
        result.error = replaced.error;
        spdlog::warn("{}: install failed: {}", request.name, result.error);
        return result;
    }
    artifact.discard();
    result.sha256 = digest;

    // 5. Version marker, then old copies
    if (request.version && !request.marker_path.empty()) {
        result.stage = InstallStage::Marker;
        auto marker = write_version_marker(request.marker_path, *request.version);
        if (!marker.ok) {
            // A stale marker would describe a binary that is no longer there
            remove_file(request.marker_path);
            result.error = "failed to write version marker: " + marker.error;
            spdlog::warn("{}: {}", request.name, result.error);
            return result;
        }
    }

    for (const auto& backup : find_backup_copies(target_dir, get_filename(request.target_path))) {
        if (remove_file(backup)) {
            result.removed_backups.push_back(backup);
        } else {
            spdlog::warn("{}: could not delete old copy {}", request.name, backup);
        }
    }

    spdlog::info("installed {} {} at {}", request.name,
                 request.version ? *request.version : digest.substr(0, 12),
                 request.target_path);

    result.stage = InstallStage::Done;
    result.ok = true;
    return result;
}

ArtifactRequest application_request(const InstallationState& state,
                                    const RemoteManifest& manifest) {
    ArtifactRequest request;
    request.name = "application";
    request.target_path = state.app_path;
    request.source = manifest.url;
    request.expected_sha256 = manifest.sha256;
    request.version = manifest.version;
    request.marker_path = state.marker_path;
    return request;
}

std::optional<ArtifactRequest> tool_request(const InstallationState& state,
                                            const RemoteManifest& manifest) {
    if (!manifest.pbi_tools_url) {
        return std::nullopt;
    }
    ArtifactRequest request;
    request.name = "auxiliary tool";
    request.target_path = state.tool_path;
    request.source = *manifest.pbi_tools_url;
    request.expected_sha256 = manifest.pbi_tools_sha256;
    return request;
}

} // namespace relay
