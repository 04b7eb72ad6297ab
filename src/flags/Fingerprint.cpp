#include "flags/Fingerprint.hpp"

#include <openssl/evp.h>

#include <array>
#include <stdexcept>

namespace flags {

std::string sha256_hex(const std::string& data) {
    std::array<unsigned char, 32> digest{};

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");

    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, digest.data(), &len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("OpenSSL: EVP sha256 digest failed");
    }
    EVP_MD_CTX_free(ctx);

    if (len != digest.size()) throw std::runtime_error("OpenSSL: unexpected SHA-256 digest length");

    const char* hex = "0123456789abcdef";
    std::string out(digest.size() * 2, '0');
    for (size_t i = 0; i < digest.size(); ++i) {
        out[2 * i]     = hex[digest[i] >> 4];
        out[2 * i + 1] = hex[digest[i] & 0xF];
    }
    return out;
}

std::string fingerprint(const std::string& canonical, size_t length) {
    return sha256_hex(canonical).substr(0, length);
}

}  // namespace flags
