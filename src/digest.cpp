// ============================================================================
// digest.cpp - implementation for digest.hpp (OpenSSL EVP)
// ============================================================================

#include "cclink/digest.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <random>

namespace cclink {
namespace digest {

// ---------------------------------------------------------------------------
// evp_digest()
// ------------
// One-shot EVP digest. Returns an empty vector if any EVP step fails.
// ---------------------------------------------------------------------------
static std::vector<uint8_t> evp_digest(const EVP_MD* md, const std::string& data) {
  std::vector<uint8_t> out;
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) return out;

  unsigned char buf[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestInit_ex(ctx, md, nullptr) == 1 &&
      EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
      EVP_DigestFinal_ex(ctx, buf, &len) == 1) {
    out.assign(buf, buf + len);
  }
  EVP_MD_CTX_free(ctx);
  return out;
}

std::vector<uint8_t> sha1(const std::string& data) { return evp_digest(EVP_sha1(), data); }
std::vector<uint8_t> md5(const std::string& data)  { return evp_digest(EVP_md5(), data); }

std::string to_hex(const std::vector<uint8_t>& bytes) {
  static const char* digits = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0F]);
  }
  return out;
}

std::string base64(const std::vector<uint8_t>& bytes) {
  if (bytes.empty()) return {};
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                bytes.data(), static_cast<int>(bytes.size()));
  out.resize(n > 0 ? static_cast<size_t>(n) : 0);
  return out;
}

std::string base64(const std::string& data) {
  return base64(std::vector<uint8_t>(data.begin(), data.end()));
}

std::string base64url_nopad(const std::vector<uint8_t>& bytes) {
  std::string out = base64(bytes);
  for (auto& c : out) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  while (!out.empty() && out.back() == '=') out.pop_back();
  return out;
}

std::vector<uint8_t> random_bytes(size_t n) {
  std::vector<uint8_t> out(n);
  if (n == 0) return out;
  if (RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
    std::random_device rd;
    for (auto& b : out) b = static_cast<uint8_t>(rd() & 0xFF);
  }
  return out;
}

} // namespace digest
} // namespace cclink
