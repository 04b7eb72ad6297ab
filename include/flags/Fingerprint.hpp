#pragma once
#include <cstddef>
#include <string>

namespace flags {

// Lowercase hex SHA-256 of the bytes. Throws std::runtime_error if OpenSSL fails.
std::string sha256_hex(const std::string& data);

// Leading `length` hex digits of sha256_hex (the whole digest if length >= 64).
std::string fingerprint(const std::string& canonical, size_t length = 8);

}  // namespace flags
