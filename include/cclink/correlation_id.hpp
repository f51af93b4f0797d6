/**
 * @file correlation_id.hpp
 * @brief Collision-free correlation id allocation for one Client.
 *
 * @details
 * Ids look like `5f3a09c2-1b` : a random 32-bit session token in fixed-width hex,
 * a dash, and a monotonically increasing counter in hex. The token changes per
 * generator (per Client instance), so ids from a previous process run can never
 * match a new request; the counter guarantees uniqueness within the run.
 *
 * Thread safe: `next()` may be called concurrently from any number of callers.
 */

#ifndef CCLINK_CORRELATION_ID_HPP
#define CCLINK_CORRELATION_ID_HPP

#include "etl/string.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace cclink {

/// "xxxxxxxx-" + up to 16 hex digits
using CorrIdStr = etl::string<26>;

class CorrelationIdGenerator {
public:
  CorrelationIdGenerator();                   // random session token
  explicit CorrelationIdGenerator(uint32_t token);

  std::string next();

  uint32_t token() const { return token_; }
  uint64_t issued() const { return counter_.load(); }

  /// Render token/sequence the way next() does.
  static CorrIdStr format(uint32_t token, uint64_t seq);

private:
  uint32_t token_;
  std::atomic<uint64_t> counter_{0};
};

} // namespace cclink

#endif // CCLINK_CORRELATION_ID_HPP
