// ============================================================================
// correlation_table.cpp - implementation for correlation_table.hpp
// ============================================================================

#include "cclink/correlation_table.hpp"

namespace cclink {

bool CorrelationTable::register_call(const std::string& corr_id, Waiter waiter, Clock::time_point deadline) {
  std::lock_guard<std::mutex> lk(mu_);
  auto ins = entries_.emplace(corr_id, Entry{std::move(waiter), deadline});
  if (!ins.second) return false;
  by_deadline_.emplace(deadline, corr_id);
  return true;
}

Match CorrelationTable::resolve(const std::string& corr_id, Waiter& out) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(corr_id);
  if (it == entries_.end()) return Match::Unmatched;
  out = std::move(it->second.waiter);
  erase_deadline_locked(corr_id, it->second.deadline);
  entries_.erase(it);
  return Match::Matched;
}

/*
 * expire()
 * --------
 * POLICY: walk the deadline index from the front; stop at the first entry still
 *         in the future. Cost is O(expired * log n).
 */
std::vector<CorrelationTable::Waiter> CorrelationTable::expire(Clock::time_point now) {
  std::vector<Waiter> out;
  std::lock_guard<std::mutex> lk(mu_);
  auto it = by_deadline_.begin();
  while (it != by_deadline_.end() && it->first <= now) {
    auto e = entries_.find(it->second);
    if (e != entries_.end()) {
      out.push_back(std::move(e->second.waiter));
      entries_.erase(e);
    }
    it = by_deadline_.erase(it);
  }
  return out;
}

CorrelationTable::Waiter CorrelationTable::take(const std::string& corr_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(corr_id);
  if (it == entries_.end()) return nullptr;
  Waiter w = std::move(it->second.waiter);
  erase_deadline_locked(corr_id, it->second.deadline);
  entries_.erase(it);
  return w;
}

std::vector<CorrelationTable::Waiter> CorrelationTable::drain() {
  std::vector<Waiter> out;
  std::lock_guard<std::mutex> lk(mu_);
  out.reserve(entries_.size());
  for (auto& kv : entries_) out.push_back(std::move(kv.second.waiter));
  entries_.clear();
  by_deadline_.clear();
  return out;
}

std::optional<CorrelationTable::Clock::time_point> CorrelationTable::next_deadline() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (by_deadline_.empty()) return std::nullopt;
  return by_deadline_.begin()->first;
}

bool CorrelationTable::contains(const std::string& corr_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.count(corr_id) != 0;
}

size_t CorrelationTable::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

void CorrelationTable::erase_deadline_locked(const std::string& corr_id, Clock::time_point deadline) {
  auto range = by_deadline_.equal_range(deadline);
  for (auto it = range.first; it != range.second; ++it) {
    if (it->second == corr_id) {
      by_deadline_.erase(it);
      return;
    }
  }
}

} // namespace cclink
