#include "relay/self_update.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace relay {

namespace {

// ============================================================================
// Script Quoting
// ============================================================================

#ifdef _WIN32

// "..." with embedded quotes doubled and % escaped for cmd.exe
std::string cmd_quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') {
            out += "\"\"";
        } else if (c == '%') {
            out += "%%";
        } else {
            out += c;
        }
    }
    out += "\"";
    return out;
}

#else

// '...' with embedded single quotes closed, escaped and reopened
std::string sh_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

#endif

void discard_handoff_files(const HandoffResult& result) {
    if (!result.script_path.empty()) remove_file(result.script_path);
    if (!result.staged_path.empty()) remove_file(result.staged_path);
}

} // namespace

const char* handoff_status_name(HandoffStatus status) {
    switch (status) {
        case HandoffStatus::Disabled: return "disabled";
        case HandoffStatus::Relaunched: return "relaunched";
        case HandoffStatus::UpToDate: return "up-to-date";
        case HandoffStatus::Failed: return "failed";
        case HandoffStatus::Started: return "started";
    }
    return "unknown";
}

const char* handoff_script_extension() {
#ifdef _WIN32
    return ".cmd";
#else
    return ".sh";
#endif
}

// ============================================================================
// Helper Script
// ============================================================================

#ifdef _WIN32

std::string render_handoff_script(const HandoffScript& script) {
    std::string pid = std::to_string(script.parent_pid);
    std::ostringstream out;
    out << "@echo off\r\n"
        << "setlocal\r\n"
        << "set /a tries=0\r\n"
        << ":wait\r\n"
        << "tasklist /FI \"PID eq " << pid << "\" /NH 2>NUL | find \" " << pid << " \" >NUL\r\n"
        << "if errorlevel 1 goto replace\r\n"
        << "set /a tries+=1\r\n"
        << "if %tries% GEQ " << script.wait_seconds << " goto replace\r\n"
        << "timeout /t 1 /nobreak >NUL\r\n"
        << "goto wait\r\n"
        << ":replace\r\n"
        << "copy /Y " << cmd_quote(script.staged_path) << " " << cmd_quote(script.temp_path)
        << " >NUL && move /Y " << cmd_quote(script.temp_path) << " " << cmd_quote(script.target_path)
        << " >NUL\r\n"
        << "if errorlevel 1 del /F /Q " << cmd_quote(script.temp_path) << " >NUL 2>&1\r\n"
        << "del /F /Q " << cmd_quote(script.staged_path) << " >NUL 2>&1\r\n"
        << "set \"" << kHandoffEnvironmentVariable << "=1\"\r\n"
        << "start \"\" " << cmd_quote(script.target_path);
    for (const auto& arg : script.arguments) {
        out << " " << cmd_quote(arg);
    }
    out << "\r\n"
        << "(goto) 2>NUL & del \"%~f0\"\r\n";
    return out.str();
}

#else

std::string render_handoff_script(const HandoffScript& script) {
    // Five probes per second
    int probes = script.wait_seconds * 5;

    std::ostringstream out;
    out << "#!/bin/sh\n"
        << "pid=" << script.parent_pid << "\n"
        << "staged=" << sh_quote(script.staged_path) << "\n"
        << "target=" << sh_quote(script.target_path) << "\n"
        << "tmp=" << sh_quote(script.temp_path) << "\n"
        << "i=0\n"
        << "while kill -0 \"$pid\" 2>/dev/null; do\n"
        << "  i=$((i + 1))\n"
        << "  [ \"$i\" -ge " << probes << " ] && break\n"
        << "  sleep 0.2\n"
        << "done\n"
        << "if cp \"$staged\" \"$tmp\" && chmod 755 \"$tmp\" && mv -f \"$tmp\" \"$target\"; then\n"
        << "  :\n"
        << "else\n"
        << "  rm -f \"$tmp\"\n"
        << "fi\n"
        << "rm -f \"$staged\" \"$0\"\n"
        << kHandoffEnvironmentVariable << "=1 exec \"$target\"";
    for (const auto& arg : script.arguments) {
        out << " " << sh_quote(arg);
    }
    out << "\n";
    return out.str();
}

#endif

// ============================================================================
// Handoff
// ============================================================================

HandoffResult try_update_self(const RemoteManifest& manifest,
                              const HandoffOptions& options,
                              Downloader& downloader,
                              Spawner& spawner) {
    HandoffResult result;

    if (!options.enabled || !manifest.launcher_url || !manifest.launcher_sha256) {
        result.status = HandoffStatus::Disabled;
        return result;
    }

    if (options.relaunched) {
        spdlog::debug("started by a launcher handoff, not updating the launcher again");
        result.status = HandoffStatus::Relaunched;
        return result;
    }

    result.status = HandoffStatus::Failed;

    if (options.launcher_path.empty()) {
        result.error = "cannot determine the launcher's own path";
        spdlog::warn("launcher update: {}", result.error);
        return result;
    }

    std::string expected = normalize_sha256(*manifest.launcher_sha256);
    auto current = compute_sha256_file(options.launcher_path);
    if (current.ok && current.hex_digest == expected) {
        result.status = HandoffStatus::UpToDate;
        return result;
    }
    if (!current.ok) {
        // Nothing to replace; the helper would create a stray binary
        result.error = "cannot hash " + options.launcher_path + ": " + current.error;
        spdlog::warn("launcher update: {}", result.error);
        return result;
    }

    auto download = downloader.download(*manifest.launcher_url);
    if (!download.ok) {
        result.error = download.error;
        spdlog::warn("launcher update: download from {} failed: {}", *manifest.launcher_url,
                     result.error);
        return result;
    }
    DownloadArtifact artifact = std::move(download.artifact);

    auto verified = verify_sha256_file(artifact.path(), expected);
    if (!verified.ok) {
        result.error = verified.error;
        spdlog::warn("launcher update: rejected download from {}: {}", *manifest.launcher_url,
                     result.error);
        return result;
    }

    auto dir = atomic_create_directory(options.install_dir);
    if (!dir.ok) {
        result.error = "failed to create " + options.install_dir + ": " + dir.error;
        spdlog::warn("launcher update: {}", result.error);
        return result;
    }

    std::string launcher_name = get_filename(options.launcher_path);
    std::string staged = join_path(options.install_dir, launcher_name + kStagedSuffix);
    auto staged_write = atomic_install_file(artifact.path(), staged);
    if (!staged_write.ok) {
        result.error = "failed to stage new launcher: " + staged_write.error;
        spdlog::warn("launcher update: {}", result.error);
        return result;
    }
    artifact.discard();
    result.staged_path = staged;

    HandoffScript script;
    script.parent_pid = options.parent_pid;
    script.wait_seconds = options.wait_seconds;
    script.staged_path = staged;
    script.target_path = options.launcher_path;
    script.temp_path = join_path(get_parent_directory(options.launcher_path),
                                 "." + launcher_name + ".tmp." + make_random_suffix());
    script.arguments = options.arguments;

    std::string script_path = join_path(options.install_dir,
                                        "relay-handoff-" + generate_uuid() +
                                            handoff_script_extension());
    auto script_write = atomic_write_file(script_path, render_handoff_script(script));
    if (!script_write.ok) {
        result.error = "failed to write handoff script: " + script_write.error;
        spdlog::warn("launcher update: {}", result.error);
        discard_handoff_files(result);
        result.staged_path.clear();
        return result;
    }
    result.script_path = script_path;

    SpawnRequest request;
#ifdef _WIN32
    request.argv = {"cmd.exe", "/c", script_path};
#else
    request.argv = {"/bin/sh", script_path};
#endif
    request.cwd = options.install_dir;

    auto spawned = spawner.spawn(request);
    if (!spawned.ok) {
        result.error = "failed to start handoff helper: " + spawned.error;
        spdlog::warn("launcher update: {}", result.error);
        discard_handoff_files(result);
        result.staged_path.clear();
        result.script_path.clear();
        return result;
    }

    spdlog::info("handing off to updated launcher (helper pid {})", spawned.pid);
    result.status = HandoffStatus::Started;
    return result;
}

} // namespace relay
