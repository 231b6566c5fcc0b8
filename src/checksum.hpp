// checksum.hpp - SHA-256 digests using OpenSSL EVP
// Used to verify destination files against their source after a copy

#pragma once

#include <cstddef>
#include <string>
#include <system_error>

#include "file_system.hpp"

#include <openssl/evp.h>

namespace ferry {

class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const char* data, size_t length);

    // Lowercase hex digest; the hasher is reset afterwards
    std::string finish();

private:
    void reset();

    EVP_MD_CTX* ctx_;
};

// Streams a file through Sha256. Returns an empty string and sets ec on failure.
std::string sha256_file(FileSystemOps& fs, const std::string& path, std::error_code& ec,
                        size_t buffer_size = 64 * 1024);

} // namespace ferry
