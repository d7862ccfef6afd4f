#pragma once

#include "relay/platform.hpp"

#include <string>

namespace relay {

// ============================================================================
// Installation State
// ============================================================================
//
// The install directory is the only state relay keeps between runs:
//
//   <install_dir>/
//     <app binary>        managed application
//     <tool binary>       auxiliary tool
//     version.txt         version of the installed application binary
//     runtime.json        written by a running application instance
//     relay.log           launcher log
//
// The version marker is only ever written right after the application binary
// it describes was atomically installed.

constexpr const char* kVersionMarkerName = "version.txt";

struct InstallationState {
    std::string install_dir;
    std::string app_path;
    std::string tool_path;
    std::string marker_path;

    bool app_available() const { return is_regular_file(app_path); }
    bool tool_available() const { return is_regular_file(tool_path); }
};

// Describe the layout of install_dir. Binary names get the platform
// executable suffix.
InstallationState make_installation_state(const std::string& install_dir,
                                          const std::string& app_name,
                                          const std::string& tool_name);

// Trimmed content of a version marker; empty if missing or unreadable
std::string read_version_marker(const std::string& marker_path);

// Atomically replace the version marker
AtomicWriteResult write_version_marker(const std::string& marker_path,
                                       const std::string& version);

// Version of the installed application binary, empty if unknown
inline std::string installed_version(const InstallationState& state) {
    return read_version_marker(state.marker_path);
}

} // namespace relay
