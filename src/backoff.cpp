// ============================================================================
// backoff.cpp - implementation for backoff.hpp
// ============================================================================

#include "cclink/backoff.hpp"

#include <cmath>

namespace cclink {

std::chrono::milliseconds reconnect_delay(int64_t min_ms, int64_t max_ms, unsigned retry, double factor) {
  if (min_ms <= 0) return std::chrono::milliseconds(0);
  if (retry == 0) retry = 1;

  const double base = static_cast<double>(min_ms) * std::pow(factor, static_cast<double>(retry - 1));
  if (!std::isfinite(base) || base >= static_cast<double>(max_ms)) {
    return std::chrono::milliseconds(max_ms);
  }

  // magnitude of ceil(base): 1..9 -> unit 1, 10..99 -> unit 10, ...
  const int64_t whole = static_cast<int64_t>(std::ceil(base));
  int64_t unit = 1;
  for (int64_t v = whole; v >= 10; v /= 10) unit *= 10;

  const int64_t rounded = static_cast<int64_t>(std::ceil(base / static_cast<double>(unit))) * unit;
  return std::chrono::milliseconds(rounded <= max_ms ? rounded : max_ms);
}

} // namespace cclink
