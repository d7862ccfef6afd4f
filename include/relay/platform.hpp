#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace relay {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

Platform get_current_platform();

// Append the platform executable suffix (".exe" on Windows) unless present
std::string executable_file_name(const std::string& base_name);

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// Copy source_path into a sibling temp file next to target_path, fsync it,
// optionally mark it executable, then rename it over target_path.
// target_path is never observable in a partially written state.
AtomicWriteResult atomic_install_file(const std::string& source_path,
                                      const std::string& target_path,
                                      bool executable = true);

// Create a directory (and parents) with fsync on the parent
AtomicWriteResult atomic_create_directory(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Check if a path exists
bool path_exists(const std::string& path);

// Check if a path is a regular file
bool is_regular_file(const std::string& path);

// List directory entries (file names only)
std::vector<std::string> list_directory(const std::string& path);

// Create parent directories recursively
bool create_directories(const std::string& path);

// Remove a directory recursively
bool remove_directory(const std::string& path);

// Remove a file
bool remove_file(const std::string& path);

// Read a whole file; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// True if candidate resolves to a location inside directory.
// Both paths are canonicalized (symlinks and ".." resolved) before comparison.
bool is_path_within(const std::string& directory, const std::string& candidate);

// Compare two file names the way the host file system does
// (case-insensitive on Windows)
bool same_file_name(const std::string& a, const std::string& b);

// Unique suffix for temporary files
std::string make_random_suffix(size_t length = 8);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Generate a UUID string
std::string generate_uuid();

// ============================================================================
// Processes
// ============================================================================

using ProcessId = std::int64_t;

// A pid together with the executable backing it
struct ProcessHandle {
    ProcessId pid = 0;
    std::string executable_path;
};

ProcessId current_process_id();

// Absolute path of the running executable, empty if it cannot be determined
std::string current_executable_path();

// Resolve the executable of a live process. nullopt if the process does not
// exist or its image cannot be inspected.
std::optional<ProcessHandle> resolve_process(ProcessId pid);

struct TerminateResult {
    bool ok = false;
    std::string error;
};

// Forcibly terminate a process (SIGKILL / TerminateProcess)
TerminateResult terminate_process(ProcessId pid);

struct SpawnRequest {
    std::vector<std::string> argv;      // argv[0] is the program path
    std::string cwd;                    // empty: inherit
    std::vector<std::pair<std::string, std::string>> extra_environment;
};

struct SpawnResult {
    bool ok = false;
    std::string error;
    ProcessId pid = 0;
};

// Start a process fully detached from this one: it survives our exit, is not
// waited for, and does not share our session or console.
SpawnResult spawn_detached(const SpawnRequest& request);

// Open a URL with the desktop's default handler
bool open_url(const std::string& url);

// Blocking modal error message (MessageBox on Windows, stderr elsewhere)
void show_error_dialog(const std::string& title, const std::string& message);

} // namespace relay
