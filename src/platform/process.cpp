#include "relay/platform.hpp"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#else
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#if defined(__APPLE__)
#include <libproc.h>
#include <mach-o/dyld.h>
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif
#endif

namespace relay {

namespace {

#ifndef _WIN32
// Record sent over the status pipe during spawn_detached
struct SpawnMessage {
    int kind;       // 1 = grandchild pid, 2 = errno from exec/chdir
    int value;
};

constexpr int kMessagePid = 1;
constexpr int kMessageErrno = 2;

void send_message(int fd, int kind, int value) {
    SpawnMessage msg{kind, value};
    ssize_t ignored = write(fd, &msg, sizeof(msg));
    (void)ignored;
}

std::string find_in_path(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return program;
    }
    auto path_env = get_env("PATH");
    if (!path_env) return program;

    std::istringstream iss(*path_env);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return program;
}

// Current environment with overrides applied
std::vector<std::string> build_environment(
    const std::vector<std::pair<std::string, std::string>>& extra) {
    std::vector<std::string> env;
    for (char** ep = environ; ep && *ep; ++ep) {
        std::string entry(*ep);
        bool overridden = false;
        for (const auto& [key, value] : extra) {
            if (entry.compare(0, key.size() + 1, key + "=") == 0) {
                overridden = true;
                break;
            }
        }
        if (!overridden) env.push_back(entry);
    }
    for (const auto& [key, value] : extra) {
        env.push_back(key + "=" + value);
    }
    return env;
}
#else
// Quote one argument per the CommandLineToArgvW rules
std::string quote_argument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
        return arg;
    }

    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
        } else if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
            quoted.push_back('"');
            backslashes = 0;
        } else {
            quoted.append(backslashes, '\\');
            quoted.push_back(c);
            backslashes = 0;
        }
    }
    quoted.append(backslashes * 2, '\\');
    quoted.push_back('"');
    return quoted;
}

std::string build_command_line(const std::vector<std::string>& argv) {
    std::string cmd;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) cmd += " ";
        cmd += quote_argument(argv[i]);
    }
    return cmd;
}

std::string build_environment_block(
    const std::vector<std::pair<std::string, std::string>>& extra) {
    std::string block;
    char* environ_block = GetEnvironmentStringsA();
    if (environ_block) {
        const char* p = environ_block;
        while (*p) {
            std::string entry(p);
            p += entry.size() + 1;
            bool overridden = false;
            for (const auto& [key, value] : extra) {
                if (_strnicmp(entry.c_str(), (key + "=").c_str(), key.size() + 1) == 0) {
                    overridden = true;
                    break;
                }
            }
            if (!overridden) {
                block += entry;
                block += '\0';
            }
        }
        FreeEnvironmentStringsA(environ_block);
    }
    for (const auto& [key, value] : extra) {
        block += key + "=" + value;
        block += '\0';
    }
    block += '\0';
    return block;
}
#endif

} // namespace

ProcessId current_process_id() {
#ifdef _WIN32
    return static_cast<ProcessId>(GetCurrentProcessId());
#else
    return static_cast<ProcessId>(getpid());
#endif
}

std::string current_executable_path() {
#if defined(_WIN32)
    char buffer[MAX_PATH * 4];
    DWORD len = GetModuleFileNameA(nullptr, buffer, static_cast<DWORD>(sizeof(buffer)));
    if (len == 0 || len >= sizeof(buffer)) return "";
    return std::string(buffer, len);
#elif defined(__APPLE__)
    char buffer[PATH_MAX];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) != 0) return "";
    char resolved[PATH_MAX];
    if (!realpath(buffer, resolved)) return buffer;
    return resolved;
#else
    char buffer[4096];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len <= 0) return "";
    return std::string(buffer, static_cast<size_t>(len));
#endif
}

std::optional<ProcessHandle> resolve_process(ProcessId pid) {
    if (pid <= 0) return std::nullopt;

    ProcessHandle handle;
    handle.pid = pid;

#if defined(_WIN32)
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (process == nullptr) return std::nullopt;

    char buffer[MAX_PATH * 4];
    DWORD size = static_cast<DWORD>(sizeof(buffer));
    BOOL ok = QueryFullProcessImageNameA(process, 0, buffer, &size);
    CloseHandle(process);
    if (!ok) return std::nullopt;
    handle.executable_path.assign(buffer, size);
#elif defined(__APPLE__)
    char buffer[PROC_PIDPATHINFO_MAXSIZE];
    int len = proc_pidpath(static_cast<int>(pid), buffer, sizeof(buffer));
    if (len <= 0) return std::nullopt;
    handle.executable_path.assign(buffer, static_cast<size_t>(len));
#else
    std::string link = "/proc/" + std::to_string(pid) + "/exe";
    char buffer[4096];
    ssize_t len = readlink(link.c_str(), buffer, sizeof(buffer) - 1);
    if (len <= 0) return std::nullopt;
    handle.executable_path.assign(buffer, static_cast<size_t>(len));

    // The image was replaced on disk after the process started
    const std::string deleted = " (deleted)";
    if (handle.executable_path.size() > deleted.size() &&
        handle.executable_path.compare(handle.executable_path.size() - deleted.size(),
                                       deleted.size(), deleted) == 0) {
        handle.executable_path.resize(handle.executable_path.size() - deleted.size());
    }
#endif

    return handle;
}

TerminateResult terminate_process(ProcessId pid) {
    TerminateResult result;

    if (pid <= 0) {
        result.error = "invalid pid " + std::to_string(pid);
        return result;
    }

#ifdef _WIN32
    HANDLE handle = OpenProcess(PROCESS_TERMINATE, FALSE, static_cast<DWORD>(pid));
    if (handle == nullptr) {
        result.error = "OpenProcess failed: " + std::to_string(GetLastError());
        return result;
    }
    BOOL ok = TerminateProcess(handle, 1);
    DWORD err = GetLastError();
    CloseHandle(handle);
    if (!ok) {
        result.error = "TerminateProcess failed: " + std::to_string(err);
        return result;
    }
#else
    if (kill(static_cast<pid_t>(pid), SIGKILL) != 0) {
        result.error = "kill failed: " + std::string(strerror(errno));
        return result;
    }
#endif

    result.ok = true;
    return result;
}

SpawnResult spawn_detached(const SpawnRequest& request) {
    SpawnResult result;

    if (request.argv.empty() || request.argv[0].empty()) {
        result.error = "no program to spawn";
        return result;
    }

#ifdef _WIN32
    std::string cmd_line = build_command_line(request.argv);
    std::string env_block;
    if (!request.extra_environment.empty()) {
        env_block = build_environment_block(request.extra_environment);
    }

    STARTUPINFOA si = {0};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {0};

    BOOL success = CreateProcessA(
        nullptr,
        const_cast<char*>(cmd_line.c_str()),
        nullptr,
        nullptr,
        FALSE,
        DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP,
        env_block.empty() ? nullptr : const_cast<char*>(env_block.c_str()),
        request.cwd.empty() ? nullptr : request.cwd.c_str(),
        &si,
        &pi);

    if (!success) {
        result.error = "CreateProcess failed: " + std::to_string(GetLastError());
        return result;
    }

    result.pid = static_cast<ProcessId>(pi.dwProcessId);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
    result.ok = true;
#else
    // Everything the child needs is prepared before fork()
    std::string program = find_in_path(request.argv[0]);

    std::vector<std::string> argv_strings = request.argv;
    std::vector<char*> argv;
    for (auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    auto env_strings = build_environment(request.extra_environment);
    std::vector<char*> envp;
    for (auto& s : env_strings) {
        envp.push_back(const_cast<char*>(s.c_str()));
    }
    envp.push_back(nullptr);

    int status_pipe[2];
    if (pipe(status_pipe) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    fcntl(status_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t child = fork();
    if (child == -1) {
        close(status_pipe[0]);
        close(status_pipe[1]);
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (child == 0) {
        // Intermediate child: new session, fork the real process, exit so
        // the grandchild is reparented to init and never becomes our zombie
        close(status_pipe[0]);
        setsid();

        pid_t grandchild = fork();
        if (grandchild == -1) {
            send_message(status_pipe[1], kMessageErrno, errno);
            _exit(1);
        }

        if (grandchild == 0) {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }

            if (!request.cwd.empty() && chdir(request.cwd.c_str()) != 0) {
                send_message(status_pipe[1], kMessageErrno, errno);
                _exit(127);
            }

            execve(program.c_str(), argv.data(), envp.data());

            send_message(status_pipe[1], kMessageErrno, errno);
            _exit(127);
        }

        send_message(status_pipe[1], kMessagePid, static_cast<int>(grandchild));
        _exit(0);
    }

    close(status_pipe[1]);

    int wait_status = 0;
    while (waitpid(child, &wait_status, 0) == -1 && errno == EINTR) {
    }

    // EOF arrives once the grandchild has exec'd (close-on-exec) or exited
    int exec_errno = 0;
    SpawnMessage msg;
    for (;;) {
        ssize_t n = read(status_pipe[0], &msg, sizeof(msg));
        if (n < 0 && errno == EINTR) continue;
        if (n != static_cast<ssize_t>(sizeof(msg))) break;
        if (msg.kind == kMessagePid) {
            result.pid = static_cast<ProcessId>(msg.value);
        } else if (msg.kind == kMessageErrno) {
            exec_errno = msg.value;
        }
    }
    close(status_pipe[0]);

    if (exec_errno != 0) {
        result.error = "failed to start " + request.argv[0] + ": " + std::string(strerror(exec_errno));
        return result;
    }

    if (result.pid == 0) {
        result.error = "failed to start " + request.argv[0];
        return result;
    }

    result.ok = true;
#endif

    return result;
}

bool open_url(const std::string& url) {
#if defined(_WIN32)
    auto rc = reinterpret_cast<INT_PTR>(
        ShellExecuteA(nullptr, "open", url.c_str(), nullptr, nullptr, SW_SHOWNORMAL));
    return rc > 32;
#elif defined(__APPLE__)
    SpawnRequest request;
    request.argv = {"open", url};
    return spawn_detached(request).ok;
#else
    SpawnRequest request;
    request.argv = {"xdg-open", url};
    return spawn_detached(request).ok;
#endif
}

void show_error_dialog(const std::string& title, const std::string& message) {
#ifdef _WIN32
    MessageBoxA(nullptr, message.c_str(), title.c_str(), MB_OK | MB_ICONERROR | MB_SETFOREGROUND);
#else
    std::cerr << title << ": " << message << std::endl;
#endif
}

} // namespace relay
