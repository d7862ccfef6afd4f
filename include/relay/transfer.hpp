#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace relay {

// ============================================================================
// Transfer Utilities
// ============================================================================
//
// Everything relay pulls from the distribution point goes through here:
// - Classifying a source string (local/UNC path, file: reference, http(s) URL)
// - Reading small documents (the manifest) into memory
// - Downloading artifacts into an isolated temporary directory
// - SHA-256 computation and verification
//
// Network shares are reached through the file system, URLs through libcurl.

// ============================================================================
// Source References
// ============================================================================

enum class SourceType {
    File,       // plain path, UNC path, file:<path> or file://<path>
    Http,       // http:// or https://
    Invalid
};

struct SourceReference {
    SourceType type = SourceType::Invalid;
    std::string path_or_url;
    std::string error;
};

SourceReference parse_source_reference(const std::string& source);

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

HashResult compute_sha256(const std::vector<uint8_t>& data);
HashResult compute_sha256_file(const std::string& file_path);

// Trim and lowercase a digest taken from an untrusted document
std::string normalize_sha256(const std::string& digest);

struct Sha256VerifyResult {
    bool ok = false;
    std::string error;
    std::string actual_digest;
    std::string expected_digest;
};

Sha256VerifyResult verify_sha256_file(const std::string& file_path,
                                      const std::string& expected_hex);

// ============================================================================
// Reading
// ============================================================================

struct FetchResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
    long http_status = 0;
};

// Read a whole source into memory. The timeout bounds http(s) transfers only;
// filesystem and UNC reads block for as long as the OS takes to fail them.
FetchResult fetch_source(const std::string& source, std::chrono::milliseconds timeout);

// ============================================================================
// Downloads
// ============================================================================

/**
 * @brief A downloaded copy of a remote source
 *
 * Lives in its own uniquely named temporary directory, which is removed when
 * the artifact is destroyed. Move-only: exactly one owner at a time.
 */
class DownloadArtifact {
public:
    DownloadArtifact() = default;
    DownloadArtifact(std::string temp_dir, std::string path, std::string sha256);
    ~DownloadArtifact();

    DownloadArtifact(const DownloadArtifact&) = delete;
    DownloadArtifact& operator=(const DownloadArtifact&) = delete;
    DownloadArtifact(DownloadArtifact&& other) noexcept;
    DownloadArtifact& operator=(DownloadArtifact&& other) noexcept;

    bool empty() const { return path_.empty(); }
    const std::string& path() const { return path_; }
    const std::string& sha256() const { return sha256_; }

    // Delete the temporary copy now
    void discard();

    // Give up ownership without deleting anything
    void release();

private:
    std::string temp_dir_;
    std::string path_;
    std::string sha256_;
};

struct DownloadResult {
    bool ok = false;
    std::string error;
    DownloadArtifact artifact;
};

/**
 * @brief Source of artifact bytes
 *
 * The installer and the launcher handoff only see this interface, so tests
 * can count or fake downloads.
 */
class Downloader {
public:
    virtual ~Downloader() = default;
    virtual DownloadResult download(const std::string& source) = 0;
};

/// Downloader backed by the file system and libcurl
class TransferDownloader : public Downloader {
public:
    explicit TransferDownloader(std::chrono::milliseconds timeout = std::chrono::minutes(5));

    DownloadResult download(const std::string& source) override;

private:
    std::chrono::milliseconds timeout_;
};

} // namespace relay
