#include "relay/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace relay {

namespace fs = std::filesystem;

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

std::string executable_file_name(const std::string& base_name) {
    if (get_current_platform() != Platform::Windows) {
        return base_name;
    }
    std::string lower = base_name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower.size() >= 4 && lower.compare(lower.size() - 4, 4, ".exe") == 0) {
        return base_name;
    }
    return base_name + ".exe";
}

namespace {

#ifndef _WIN32
// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

bool write_all(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t written = write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        size -= static_cast<size_t>(written);
    }
    return true;
}
#endif

// Generate a temporary filename
std::string make_temp_filename(const std::string& base) {
    return base + ".tmp." + make_random_suffix();
}

// Hidden sibling so concurrent readers listing the directory never mistake
// an in-flight install for an artifact
std::string make_install_temp_filename(const std::string& target_path) {
    return join_path(get_parent_directory(target_path),
                     "." + get_filename(target_path) + ".tmp." + make_random_suffix());
}

} // namespace

std::string make_random_suffix(size_t length) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    static const char hex_chars[] = "0123456789abcdef";
    std::string suffix;
    suffix.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }
    return suffix;
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    return atomic_write_file(path, std::vector<uint8_t>(content.begin(), content.end()));
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content) {
    AtomicWriteResult result;
    std::string temp_path = make_temp_filename(path);

#ifdef _WIN32
    std::ofstream temp_file(temp_path, std::ios::binary);
    if (!temp_file) {
        result.error = "failed to create temp file: " + temp_path;
        return result;
    }

    temp_file.write(reinterpret_cast<const char*>(content.data()),
                    static_cast<std::streamsize>(content.size()));
    temp_file.flush();
    bool written = temp_file.good();
    temp_file.close();

    if (!written) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to write temp file: " + temp_path;
        return result;
    }

    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to rename temp file (error " + std::to_string(GetLastError()) + ")";
        return result;
    }

    result.ok = true;
#else
    // POSIX implementation: temp + fsync(file) + rename + fsync(dir)
    std::string dir_path = get_parent_directory(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!write_all(fd, reinterpret_cast<const char*>(content.data()), content.size())) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to write content";
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
#endif

    return result;
}

AtomicWriteResult atomic_install_file(const std::string& source_path,
                                      const std::string& target_path,
                                      bool executable) {
    AtomicWriteResult result;
    std::string temp_path = make_install_temp_filename(target_path);

#ifdef _WIN32
    (void)executable;

    if (!CopyFileA(source_path.c_str(), temp_path.c_str(), TRUE)) {
        result.error = "failed to copy into temp file (error " + std::to_string(GetLastError()) + ")";
        return result;
    }

    // Replacing a running image fails here, leaving the old binary in place
    if (!MoveFileExA(temp_path.c_str(), target_path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DWORD err = GetLastError();
        DeleteFileA(temp_path.c_str());
        result.error = "failed to replace " + target_path + " (error " + std::to_string(err) + ")";
        return result;
    }

    result.ok = true;
#else
    std::ifstream source(source_path, std::ios::binary);
    if (!source) {
        result.error = "failed to open source file: " + source_path;
        return result;
    }

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, executable ? 0755 : 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    char buffer[64 * 1024];
    while (source.read(buffer, sizeof(buffer)) || source.gcount() > 0) {
        if (!write_all(fd, buffer, static_cast<size_t>(source.gcount()))) {
            close(fd);
            unlink(temp_path.c_str());
            result.error = "failed to write temp file: " + std::string(strerror(errno));
            return result;
        }
    }

    if (source.bad()) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to read source file: " + source_path;
        return result;
    }

    // umask may have stripped bits from the open() mode
    if (executable && fchmod(fd, 0755) != 0) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to mark temp file executable: " + std::string(strerror(errno));
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), target_path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename onto " + target_path + ": " + std::string(strerror(errno));
        return result;
    }

    std::string dir_path = get_parent_directory(target_path);
    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
#endif

    return result;
}

AtomicWriteResult atomic_create_directory(const std::string& path) {
    AtomicWriteResult result;

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }

#ifndef _WIN32
    std::string parent = get_parent_directory(path);
    if (!parent.empty()) {
        fsync_directory(parent);
    }
#endif

    result.ok = true;
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (base.empty()) return rel;
    fs::path p(base);
    p /= rel;
    return p.string();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path().filename().string());
    }

    return entries;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_directory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool is_path_within(const std::string& directory, const std::string& candidate) {
    std::error_code ec;
    fs::path dir = fs::weakly_canonical(directory, ec);
    if (ec) return false;
    fs::path path = fs::weakly_canonical(candidate, ec);
    if (ec) return false;

    auto path_it = path.begin();
    for (auto dir_it = dir.begin(); dir_it != dir.end(); ++dir_it) {
        // Trailing separator yields an empty final element
        if (dir_it->empty()) continue;
        if (path_it == path.end()) return false;
#ifdef _WIN32
        if (!same_file_name(dir_it->string(), path_it->string())) return false;
#else
        if (*dir_it != *path_it) return false;
#endif
        ++path_it;
    }
    return path_it != path.end() && !path_it->empty();
}

bool same_file_name(const std::string& a, const std::string& b) {
#ifdef _WIN32
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
#else
    return a == b;
#endif
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace relay
