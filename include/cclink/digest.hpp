#pragma once

/**
 * @file digest.hpp
 * @brief Small OpenSSL-backed helpers: SHA-1/MD5 digests, hex and base64 text.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace cclink {
namespace digest {

std::vector<uint8_t> sha1(const std::string& data);
std::vector<uint8_t> md5(const std::string& data);

/// Lowercase hex, two characters per byte.
std::string to_hex(const std::vector<uint8_t>& bytes);

/// Standard base64 with padding.
std::string base64(const std::string& data);
std::string base64(const std::vector<uint8_t>& bytes);

/// URL-safe alphabet ('-', '_'), padding stripped.
std::string base64url_nopad(const std::vector<uint8_t>& bytes);

/// Cryptographically random bytes; falls back to std::random_device if RAND_bytes fails.
std::vector<uint8_t> random_bytes(size_t n);

} // namespace digest
} // namespace cclink
