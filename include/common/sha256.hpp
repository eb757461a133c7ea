//! # SHA-256 Content Digests
//!
//! Thin wrappers over OpenSSL's EVP digest API. Digests are rendered as
//! `sha256:<64 hex chars>` so that they are self-describing when written to
//! persisted manifests.

#ifndef LSPACK_COMMON_SHA256_HPP
#define LSPACK_COMMON_SHA256_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lspack {

namespace fs = std::filesystem;

/// Incremental SHA-256 hasher.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(std::string_view data);
    void update(const void* data, size_t size);

    /// Finishes the digest and returns "sha256:<hex>". The hasher cannot be
    /// updated afterwards.
    std::string finish();

private:
    void* ctx_; // EVP_MD_CTX*, kept opaque to avoid leaking OpenSSL headers
};

/// Digest of an in-memory string.
std::string sha256_hex(std::string_view data);

/// Digest of a file's contents, or nullopt if the file cannot be read.
std::optional<std::string> sha256_file(const fs::path& path);

} // namespace lspack

#endif // LSPACK_COMMON_SHA256_HPP
