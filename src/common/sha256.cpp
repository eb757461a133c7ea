#include "common/sha256.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

#include <openssl/evp.h>

namespace lspack {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr);
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
}

void Sha256::update(std::string_view data) {
    update(data.data(), data.size());
}

void Sha256::update(const void* data, size_t size) {
    if (size == 0)
        return;
    EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, size);
}

std::string Sha256::finish() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), hash, &length);

    std::ostringstream oss;
    oss << "sha256:";
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string sha256_hex(std::string_view data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finish();
}

std::optional<std::string> sha256_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    Sha256 hasher;
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer))) {
        hasher.update(buffer, static_cast<size_t>(file.gcount()));
    }
    if (file.gcount() > 0) {
        hasher.update(buffer, static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        return std::nullopt;
    }

    return hasher.finish();
}

} // namespace lspack
