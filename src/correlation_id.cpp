// ============================================================================
// correlation_id.cpp - implementation for correlation_id.hpp
// ============================================================================

#include "cclink/correlation_id.hpp"
#include "cclink/digest.hpp"

namespace cclink {

static const char HEX[] = "0123456789abcdef";

CorrelationIdGenerator::CorrelationIdGenerator() {
  const auto b = digest::random_bytes(4);
  token_ = (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16) | (uint32_t(b[2]) << 8) | uint32_t(b[3]);
}

CorrelationIdGenerator::CorrelationIdGenerator(uint32_t token) : token_(token) {}

std::string CorrelationIdGenerator::next() {
  const uint64_t seq = counter_.fetch_add(1) + 1;
  const CorrIdStr s = format(token_, seq);
  return std::string(s.c_str(), s.size());
}

// Manual nibble output, no snprintf: token fixed width, sequence without leading zeros.
CorrIdStr CorrelationIdGenerator::format(uint32_t token, uint64_t seq) {
  CorrIdStr out;
  for (int shift = 28; shift >= 0; shift -= 4) out.push_back(HEX[(token >> shift) & 0xF]);
  out.push_back('-');

  char digits[16];
  int n = 0;
  do {
    digits[n++] = HEX[seq & 0xF];
    seq >>= 4;
  } while (seq != 0 && n < 16);
  while (n > 0) out.push_back(digits[--n]);
  return out;
}

} // namespace cclink
