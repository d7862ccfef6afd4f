#include "relay/install_state.hpp"

#include <cctype>

namespace relay {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

InstallationState make_installation_state(const std::string& install_dir,
                                          const std::string& app_name,
                                          const std::string& tool_name) {
    InstallationState state;
    state.install_dir = install_dir;
    state.app_path = join_path(install_dir, executable_file_name(app_name));
    state.tool_path = join_path(install_dir, executable_file_name(tool_name));
    state.marker_path = join_path(install_dir, kVersionMarkerName);
    return state;
}

std::string read_version_marker(const std::string& marker_path) {
    auto content = read_file(marker_path);
    if (!content) {
        return "";
    }
    std::string version = trim(*content);
    if (version.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        version = trim(version.substr(3));
    }
    return version;
}

AtomicWriteResult write_version_marker(const std::string& marker_path,
                                       const std::string& version) {
    std::string dir = get_parent_directory(marker_path);
    if (!dir.empty() && !create_directories(dir)) {
        AtomicWriteResult result;
        result.error = "failed to create " + dir;
        return result;
    }
    return atomic_write_file(marker_path, trim(version));
}

} // namespace relay
