/**
 * @file dispatcher.hpp
 * @brief Worker threads that run user code (call callbacks, connect/disconnect notifications).
 *
 * @details
 * User code never runs on the receive loop or on the supervisor thread; those
 * threads only post() closures here. Jobs run FIFO across `workers` threads, so a
 * blocking callback occupies one worker and the rest keep draining. An exception
 * escaping a job is logged and the worker keeps going.
 *
 * `stop()` runs the jobs already queued, then joins. post() after stop() is refused.
 */

#ifndef CCLINK_DISPATCHER_HPP
#define CCLINK_DISPATCHER_HPP

#include "cclink/logging.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cclink {

class Dispatcher {
public:
  using Job = std::function<void()>;

  Dispatcher(std::string name, int workers);
  ~Dispatcher();

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  /// false once stopped.
  bool post(Job job);
  void stop();

  /// true when called from one of this dispatcher's workers.
  bool on_worker_thread() const;

  size_t pending() const;

private:
  void run();

  std::string name_;
  std::shared_ptr<spdlog::logger> log_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  bool stopping_{false};
  std::vector<std::thread> workers_;
};

} // namespace cclink

#endif // CCLINK_DISPATCHER_HPP
