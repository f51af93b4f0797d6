/**
 * @file call.hpp
 * @brief Pending Call state, its Future handle, and per-call options.
 *
 * @details
 * Every request the Call Bridge issues is represented by one PendingCall shared
 * between three parties:
 *   - the Correlation Table entry (until matched or expired),
 *   - the caller, through a Future (blocking wait or later inspection),
 *   - the dispatch context that runs the user callback.
 *
 * Completion states: Pending -> {Resolved, TimedOut, Failed}, exactly once.
 * `complete()` is first-caller-wins; the Correlation Table already decides the
 * winner between a response and a timeout, and the `claimed_` flag makes any
 * second completion a no-op on top of that.
 *
 * Order inside `complete()`: internal hook (bookkeeping such as the sync record),
 * then result publication and wake-up of blocking waiters. A caller unblocked by
 * wait() therefore always observes the bookkeeping already applied.
 */

#ifndef CCLINK_CALL_HPP
#define CCLINK_CALL_HPP

#include "cclink/message.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cclink {

enum class CallStatus : uint8_t {
  Pending = 0,
  Resolved,   // matched response (any status code)
  TimedOut,   // deadline passed without a response
  Failed,     // never reached the platform: not connected, send error, shutdown, rejected
};

const char* call_status_name(CallStatus s);

struct CallResult {
  CallStatus status{CallStatus::Pending};
  std::optional<Message> message;  // set when Resolved
  std::string error;               // set when Failed

  /// Resolved with a 2xx response.
  bool ok() const { return status == CallStatus::Resolved && message && message->ok(); }
  bool timed_out() const { return status == CallStatus::TimedOut; }
};

/// User completion callback. Bind extra arguments with a lambda capture.
using CallCallback = std::function<void(const CallResult&)>;

struct CallOptions {
  std::chrono::milliseconds timeout{0};  // 0: configured default
  bool block{true};
  CallCallback callback;                 // invoked once from the dispatch context
};

class PendingCall {
public:
  using Clock = std::chrono::steady_clock;
  using Hook  = std::function<void(const CallResult&)>;

  PendingCall(std::string corr_id, Clock::time_point deadline, CallCallback callback = {}, Hook hook = {});

  const std::string& corr_id() const { return corr_id_; }
  Clock::time_point created() const  { return created_; }
  Clock::time_point deadline() const { return deadline_; }
  const CallCallback& callback() const { return callback_; }

  /// true for the single call that completed this PendingCall.
  bool complete(CallResult result);

  bool done() const;
  CallResult result() const;

  /// true if completed by @p until.
  bool wait_until(Clock::time_point until) const;
  void wait() const;

private:
  const std::string corr_id_;
  const Clock::time_point created_;
  const Clock::time_point deadline_;
  const CallCallback callback_;
  const Hook hook_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  bool claimed_{false};
  bool done_{false};
  CallResult result_;
};

/// Caller's handle on a PendingCall. Copyable; all copies observe the same call.
class Future {
public:
  Future() = default;
  explicit Future(std::shared_ptr<PendingCall> call) : call_(std::move(call)) {}

  bool valid() const { return static_cast<bool>(call_); }
  bool done() const { return !call_ || call_->done(); }

  /// Failed for an invalid Future.
  CallStatus status() const { return result().status; }
  CallResult result() const;

  /// Block until completion.
  CallResult wait() const;
  bool wait_for(std::chrono::milliseconds d) const;

  bool ok() const { return result().ok(); }
  std::string corr_id() const { return call_ ? call_->corr_id() : std::string(); }

private:
  std::shared_ptr<PendingCall> call_;
};

} // namespace cclink

#endif // CCLINK_CALL_HPP
