// checksum.cpp - SHA-256 digests implementation

#include "checksum.hpp"
#include "logger.hpp"

#include <openssl/evp.h>
#include <openssl/err.h>

#include <new>
#include <stdexcept>
#include <vector>

namespace ferry {

Sha256::Sha256()
    : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::bad_alloc();
    }
    reset();
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        Logger::error("[Checksum] SHA-256 initialization failed: " +
                      std::to_string(ERR_get_error()));
        throw std::runtime_error("SHA-256 initialization failed");
    }
}

void Sha256::update(const char* data, size_t length) {
    if (length == 0) return;
    if (EVP_DigestUpdate(ctx_, data, length) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256::finish() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0f]);
    }

    reset();
    return out;
}

std::string sha256_file(FileSystemOps& fs, const std::string& path, std::error_code& ec,
                        size_t buffer_size) {
    auto reader = fs.open_read(path, ec);
    if (!reader) return "";

    Sha256 hasher;
    std::vector<char> buffer(buffer_size);
    for (;;) {
        size_t n = reader->read(buffer.data(), buffer.size(), ec);
        if (ec) return "";
        if (n == 0) break;
        hasher.update(buffer.data(), n);
    }
    return hasher.finish();
}

} // namespace ferry
