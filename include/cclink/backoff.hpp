#pragma once

/**
 * @file backoff.hpp
 * @brief Reconnect delay schedule.
 */

#include <chrono>
#include <cstdint>

namespace cclink {

/**
 * @brief Delay before reconnect attempt number @p retry (1-based).
 *
 * @details Geometric progression `min * factor^(retry-1)`, rounded up to the
 * leading decimal digit (1500 -> 2000, 2250 -> 3000, 12001 -> 20000) and capped
 * at @p max_ms. retry 0 is treated as 1. Non-positive @p min_ms yields 0.
 */
std::chrono::milliseconds reconnect_delay(int64_t min_ms, int64_t max_ms, unsigned retry, double factor);

} // namespace cclink
