// ============================================================================
// call.cpp - implementation for call.hpp
// ============================================================================

#include "cclink/call.hpp"

#include <utility>

namespace cclink {

const char* call_status_name(CallStatus s) {
  switch (s) {
    case CallStatus::Pending:  return "pending";
    case CallStatus::Resolved: return "resolved";
    case CallStatus::TimedOut: return "timed out";
    case CallStatus::Failed:   return "failed";
  }
  return "unknown";
}

PendingCall::PendingCall(std::string corr_id, Clock::time_point deadline, CallCallback callback, Hook hook)
  : corr_id_(std::move(corr_id)),
    created_(Clock::now()),
    deadline_(deadline),
    callback_(std::move(callback)),
    hook_(std::move(hook)) {}

bool PendingCall::complete(CallResult result) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (claimed_) return false;
    claimed_ = true;
  }

  if (hook_) hook_(result);

  {
    std::lock_guard<std::mutex> lk(mu_);
    result_ = std::move(result);
    done_ = true;
  }
  cv_.notify_all();
  return true;
}

bool PendingCall::done() const {
  std::lock_guard<std::mutex> lk(mu_);
  return done_;
}

CallResult PendingCall::result() const {
  std::lock_guard<std::mutex> lk(mu_);
  return result_;
}

bool PendingCall::wait_until(Clock::time_point until) const {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_until(lk, until, [this] { return done_; });
}

void PendingCall::wait() const {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this] { return done_; });
}

CallResult Future::result() const {
  if (!call_) {
    CallResult r;
    r.status = CallStatus::Failed;
    r.error = "no call";
    return r;
  }
  return call_->result();
}

CallResult Future::wait() const {
  if (call_) call_->wait();
  return result();
}

bool Future::wait_for(std::chrono::milliseconds d) const {
  if (!call_) return true;
  return call_->wait_until(PendingCall::Clock::now() + d);
}

} // namespace cclink
