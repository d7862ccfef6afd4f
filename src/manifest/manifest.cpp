#include "relay/manifest.hpp"
#include "relay/transfer.hpp"

#include <cctype>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace relay {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Non-empty trimmed string value, or nullopt
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        auto value = trim(j[key].get<std::string>());
        if (!value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> get_digest(const nlohmann::json& j, const std::string& key) {
    auto value = get_string(j, key);
    if (value) {
        return normalize_sha256(*value);
    }
    return std::nullopt;
}

// Publishers sometimes write "version": 2 or 2.1
std::optional<std::string> get_version(const nlohmann::json& j) {
    if (!j.contains("version")) return std::nullopt;
    const auto& v = j["version"];
    if (v.is_string()) return get_string(j, "version");
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number()) return trim(v.dump());
    return std::nullopt;
}

} // namespace

const char* manifest_status_name(ManifestStatus status) {
    switch (status) {
        case ManifestStatus::Ok: return "ok";
        case ManifestStatus::Unavailable: return "unavailable";
        case ManifestStatus::Failed: return "failed";
    }
    return "unknown";
}

ManifestFetchResult parse_manifest(const std::string& json_text) {
    ManifestFetchResult result;

    // Editors on Windows like to prepend a UTF-8 byte order mark
    static const std::string bom = "\xEF\xBB\xBF";
    bool has_bom = json_text.compare(0, bom.size(), bom) == 0;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(has_bom ? json_text.substr(bom.size()) : json_text);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("malformed manifest: ") + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = "manifest must be a JSON object";
        return result;
    }

    auto version = get_version(j);
    auto url = get_string(j, "url");
    if (!version || !url) {
        result.status = ManifestStatus::Unavailable;
        result.error = !version ? "manifest has no version" : "manifest has no url";
        return result;
    }

    RemoteManifest manifest;
    manifest.version = *version;
    manifest.url = *url;
    manifest.sha256 = get_digest(j, "sha256");
    manifest.pbi_tools_url = get_string(j, "pbi_tools_url");
    manifest.pbi_tools_sha256 = get_digest(j, "pbi_tools_sha256");
    manifest.launcher_url = get_string(j, "launcher_url");
    manifest.launcher_sha256 = get_digest(j, "launcher_sha256");

    result.manifest = std::move(manifest);
    result.status = ManifestStatus::Ok;
    return result;
}

ManifestFetchResult fetch_manifest(const std::string& location,
                                   std::chrono::milliseconds timeout) {
    if (trim(location).empty()) {
        ManifestFetchResult result;
        result.error = "no manifest location configured";
        return result;
    }

    auto fetched = fetch_source(location, timeout);
    if (!fetched.ok) {
        ManifestFetchResult result;
        result.error = fetched.error;
        return result;
    }

    auto result = parse_manifest(std::string(fetched.data.begin(), fetched.data.end()));
    if (result.ok()) {
        spdlog::debug("manifest {} advertises version {}", location, result.manifest->version);
    }
    return result;
}

} // namespace relay
