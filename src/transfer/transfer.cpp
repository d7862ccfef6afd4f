#include "relay/transfer.hpp"
#include "relay/platform.hpp"

#include "curl_support.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace relay {

// ============================================================================
// Reference Parsing
// ============================================================================

namespace {

bool starts_with_nocase(const std::string& s, const char* prefix) {
    size_t len = std::strlen(prefix);
    if (s.size() < len) return false;
    for (size_t i = 0; i < len; ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
    }
    return true;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

SourceReference parse_source_reference(const std::string& source) {
    SourceReference result;
    std::string reference = trim(source);

    if (reference.empty()) {
        result.error = "empty source";
        return result;
    }

    if (starts_with_nocase(reference, "http://") || starts_with_nocase(reference, "https://")) {
        result.type = SourceType::Http;
        result.path_or_url = reference;
        return result;
    }

    if (starts_with_nocase(reference, "file://")) {
        result.path_or_url = reference.substr(7);
#ifdef _WIN32
        // file:///C:/dir -> C:/dir
        if (result.path_or_url.size() > 2 && result.path_or_url[0] == '/' &&
            result.path_or_url[2] == ':') {
            result.path_or_url.erase(0, 1);
        }
#endif
    } else if (starts_with_nocase(reference, "file:")) {
        result.path_or_url = reference.substr(5);
    } else if (reference.find("://") != std::string::npos) {
        result.error = "unsupported source scheme: " + reference;
        return result;
    } else {
        result.path_or_url = reference;
    }

    if (result.path_or_url.empty()) {
        result.error = "empty file path";
        return result;
    }

    result.type = SourceType::File;
    return result;
}

// ============================================================================
// SHA-256 Implementation (using OpenSSL EVP API)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

bool finish_digest(EvpMdCtx& ctx, HashResult& result) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return false;
    }

    result.hex_digest = bytes_to_hex(hash, hash_len);
    result.ok = true;
    return true;
}

} // namespace

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    HashResult result;

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    finish_digest(ctx, result);
    return result;
}

HashResult compute_sha256_file(const std::string& file_path) {
    HashResult result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + file_path;
        return result;
    }

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    char buffer[64 * 1024];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            result.error = "EVP_DigestUpdate failed";
            return result;
        }
    }

    if (file.bad()) {
        result.error = "failed to read file: " + file_path;
        return result;
    }

    finish_digest(ctx, result);
    return result;
}

std::string normalize_sha256(const std::string& digest) {
    std::string normalized = trim(digest);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return normalized;
}

Sha256VerifyResult verify_sha256_file(const std::string& file_path,
                                      const std::string& expected_hex) {
    Sha256VerifyResult result;
    result.expected_digest = normalize_sha256(expected_hex);

    auto hash_result = compute_sha256_file(file_path);
    if (!hash_result.ok) {
        result.error = hash_result.error;
        return result;
    }

    result.actual_digest = hash_result.hex_digest;

    if (result.actual_digest != result.expected_digest) {
        result.error = "SHA-256 mismatch: expected " + result.expected_digest +
                       ", got " + result.actual_digest;
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// HTTP Fetching with libcurl
// ============================================================================

namespace {

size_t write_to_buffer(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(userdata);
    size_t total = size * nmemb;
    buffer->insert(buffer->end(), ptr, ptr + total);
    return total;
}

size_t write_to_stream(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::ofstream*>(userdata);
    size_t total = size * nmemb;
    out->write(ptr, static_cast<std::streamsize>(total));
    // Returning short makes curl abort with CURLE_WRITE_ERROR
    return out->good() ? total : 0;
}

struct HttpTransfer {
    bool ok = false;
    std::string error;
    long http_status = 0;
};

HttpTransfer perform_get(const std::string& url, std::chrono::milliseconds timeout,
                         curl_write_callback callback, void* userdata) {
    HttpTransfer result;

    detail::ensure_curl_initialized();

    detail::CurlHandle curl;
    if (!curl) {
        result.error = "failed to initialize CURL";
        return result;
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, userdata);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "relay-launcher/" RELAY_VERSION);

    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        result.error = std::string("HTTP request failed: ") +
                       (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return result;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);

    if (result.http_status < 200 || result.http_status >= 300) {
        result.error = "HTTP " + std::to_string(result.http_status);
        return result;
    }

    result.ok = true;
    return result;
}

// Name for the downloaded copy: the source's own file name when it has one
std::string artifact_file_name(const SourceReference& ref) {
    std::string name;
    if (ref.type == SourceType::Http) {
        std::string url = ref.path_or_url;
        auto cut = url.find_first_of("?#");
        if (cut != std::string::npos) url.resize(cut);
        auto slash = url.find_last_of('/');
        auto scheme = url.find("://");
        if (slash != std::string::npos && (scheme == std::string::npos || slash > scheme + 2)) {
            name = url.substr(slash + 1);
        }
    } else {
        std::string portable = ref.path_or_url;
        std::replace(portable.begin(), portable.end(), '\\', '/');
        name = get_filename(portable);
    }
    if (name.empty() || name == "." || name == "..") {
        name = "download.bin";
    }
    return name;
}

} // namespace

FetchResult fetch_source(const std::string& source, std::chrono::milliseconds timeout) {
    FetchResult result;

    auto ref = parse_source_reference(source);
    if (ref.type == SourceType::Invalid) {
        result.error = ref.error;
        return result;
    }

    if (ref.type == SourceType::File) {
        auto content = read_file(ref.path_or_url);
        if (!content) {
            result.error = "failed to read " + ref.path_or_url;
            return result;
        }
        result.data.assign(content->begin(), content->end());
        result.ok = true;
        return result;
    }

    std::vector<uint8_t> buffer;
    auto transfer = perform_get(ref.path_or_url, timeout, write_to_buffer, &buffer);
    result.http_status = transfer.http_status;
    if (!transfer.ok) {
        result.error = transfer.error;
        return result;
    }

    result.data = std::move(buffer);
    result.ok = true;
    return result;
}

// ============================================================================
// DownloadArtifact
// ============================================================================

DownloadArtifact::DownloadArtifact(std::string temp_dir, std::string path, std::string sha256)
    : temp_dir_(std::move(temp_dir)), path_(std::move(path)), sha256_(std::move(sha256)) {}

DownloadArtifact::~DownloadArtifact() {
    discard();
}

DownloadArtifact::DownloadArtifact(DownloadArtifact&& other) noexcept
    : temp_dir_(std::move(other.temp_dir_)),
      path_(std::move(other.path_)),
      sha256_(std::move(other.sha256_)) {
    other.temp_dir_.clear();
    other.path_.clear();
    other.sha256_.clear();
}

DownloadArtifact& DownloadArtifact::operator=(DownloadArtifact&& other) noexcept {
    if (this != &other) {
        discard();
        temp_dir_ = std::move(other.temp_dir_);
        path_ = std::move(other.path_);
        sha256_ = std::move(other.sha256_);
        other.temp_dir_.clear();
        other.path_.clear();
        other.sha256_.clear();
    }
    return *this;
}

void DownloadArtifact::release() {
    temp_dir_.clear();
    path_.clear();
    sha256_.clear();
}

void DownloadArtifact::discard() {
    if (!temp_dir_.empty()) {
        remove_directory(temp_dir_);
    }
    temp_dir_.clear();
    path_.clear();
    sha256_.clear();
}

// ============================================================================
// TransferDownloader
// ============================================================================

TransferDownloader::TransferDownloader(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

DownloadResult TransferDownloader::download(const std::string& source) {
    DownloadResult result;

    auto ref = parse_source_reference(source);
    if (ref.type == SourceType::Invalid) {
        result.error = ref.error;
        return result;
    }

    std::error_code ec;
    fs::path temp_root = fs::temp_directory_path(ec);
    if (ec) {
        result.error = "no temporary directory: " + ec.message();
        return result;
    }

    std::string temp_dir = (temp_root / ("relay_update_" + make_random_suffix(12))).string();
    if (!create_directories(temp_dir)) {
        result.error = "failed to create " + temp_dir;
        return result;
    }

    // Owns temp_dir from here on, so every early return cleans up
    DownloadArtifact staging(temp_dir, join_path(temp_dir, artifact_file_name(ref)), "");
    const std::string target = staging.path();

    spdlog::debug("downloading {} -> {}", ref.path_or_url, target);

    if (ref.type == SourceType::File) {
        fs::copy_file(ref.path_or_url, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            result.error = "failed to copy " + ref.path_or_url + ": " + ec.message();
            return result;
        }
    } else {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            result.error = "failed to create " + target;
            return result;
        }
        auto transfer = perform_get(ref.path_or_url, timeout_, write_to_stream, &out);
        out.close();
        if (!transfer.ok) {
            result.error = transfer.error;
            return result;
        }
        if (out.fail()) {
            result.error = "failed to write " + target;
            return result;
        }
    }

    auto hash = compute_sha256_file(target);
    if (!hash.ok) {
        result.error = hash.error;
        return result;
    }

    staging.release();
    result.artifact = DownloadArtifact(temp_dir, target, hash.hex_digest);
    result.ok = true;
    return result;
}

} // namespace relay
