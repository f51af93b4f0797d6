/**
 * @file correlation_table.hpp
 * @brief In-flight request registry: correlation id -> waiting PendingCall.
 *
 * @details
 * The single synchronized resource shared by the receive loop (resolve path),
 * the timeout sweeper and blocking callers (expire paths), and every caller that
 * issues a request (register path).
 *
 * ## Exactly-once
 * Whoever removes an entry owns its completion. `resolve()`, `expire()` and
 * `take()` all remove under one mutex, so for a given id exactly one of them
 * gets the waiter back; the others see "unmatched"/nothing and must do nothing.
 *
 * ## Ids
 * An id can be present at most once. `register_call()` of a present id returns
 * false and leaves the existing entry untouched; that is a caller bug, since ids
 * come from CorrelationIdGenerator or from a distinct platform task.
 */

#ifndef CCLINK_CORRELATION_TABLE_HPP
#define CCLINK_CORRELATION_TABLE_HPP

#include "cclink/call.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cclink {

enum class Match : uint8_t { Matched = 0, Unmatched };

class CorrelationTable {
public:
  using Clock   = PendingCall::Clock;
  using Waiter  = std::shared_ptr<PendingCall>;

  /// false if @p corr_id is already in flight.
  bool register_call(const std::string& corr_id, Waiter waiter, Clock::time_point deadline);

  /// Remove and hand back the waiter for @p corr_id; Unmatched if unknown or already gone.
  Match resolve(const std::string& corr_id, Waiter& out);

  /// Remove and return every waiter whose deadline is <= @p now.
  std::vector<Waiter> expire(Clock::time_point now);

  /// Remove one entry regardless of deadline (lazy expiry by a blocking caller).
  Waiter take(const std::string& corr_id);

  /// Remove everything (shutdown).
  std::vector<Waiter> drain();

  std::optional<Clock::time_point> next_deadline() const;
  bool contains(const std::string& corr_id) const;
  size_t size() const;

private:
  struct Entry {
    Waiter waiter;
    Clock::time_point deadline;
  };

  mutable std::mutex mu_;
  std::map<std::string, Entry> entries_;
  std::multimap<Clock::time_point, std::string> by_deadline_;

  // caller holds mu_
  void erase_deadline_locked(const std::string& corr_id, Clock::time_point deadline);
};

} // namespace cclink

#endif // CCLINK_CORRELATION_TABLE_HPP
