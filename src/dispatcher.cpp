// ============================================================================
// dispatcher.cpp - implementation for dispatcher.hpp
// ============================================================================

#include "cclink/dispatcher.hpp"

#include <exception>

namespace cclink {

Dispatcher::Dispatcher(std::string name, int workers)
  : name_(std::move(name)), log_(log::get("dispatch")) {
  if (workers < 1) workers = 1;
  workers_.reserve(static_cast<size_t>(workers));
  for (int i = 0; i < workers; ++i) workers_.emplace_back([this] { run(); });
}

Dispatcher::~Dispatcher() { stop(); }

bool Dispatcher::post(Job job) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_) return false;
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
  return true;
}

void Dispatcher::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_ && workers_.empty()) return;
    stopping_ = true;
  }
  cv_.notify_all();

  const auto self = std::this_thread::get_id();
  for (auto& t : workers_) {
    if (!t.joinable()) continue;
    if (t.get_id() == self) t.detach();  // stop() from inside a job: cannot join ourselves
    else t.join();
  }
  std::lock_guard<std::mutex> lk(mu_);
  workers_.clear();
}

bool Dispatcher::on_worker_thread() const {
  const auto self = std::this_thread::get_id();
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& t : workers_) {
    if (t.get_id() == self) return true;
  }
  return false;
}

size_t Dispatcher::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return jobs_.size();
}

void Dispatcher::run() {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty()) return;  // stopping and drained
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    try {
      job();
    } catch (const std::exception& ex) {
      log_->error("{}: callback threw: {}", name_, ex.what());
    } catch (...) {
      log_->error("{}: callback threw a non-standard exception", name_);
    }
  }
}

} // namespace cclink
