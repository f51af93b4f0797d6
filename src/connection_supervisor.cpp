// ============================================================================
// connection_supervisor.cpp - implementation for connection_supervisor.hpp
// ============================================================================

#include "cclink/connection_supervisor.hpp"
#include "cclink/backoff.hpp"

namespace cclink {

const char* connection_state_name(ConnectionState s) {
  switch (s) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting:   return "connecting";
    case ConnectionState::Connected:    return "connected";
    case ConnectionState::Reconnecting: return "reconnecting";
  }
  return "unknown";
}

ConnectionSupervisor::ConnectionSupervisor(TransportSession& session, CallBridge& bridge, DeviceSync& sync,
                                           Dispatcher& notifier, const Config& cfg)
  : session_(session),
    bridge_(bridge),
    sync_(sync),
    notifier_(notifier),
    cfg_(cfg.connector),
    creds_(cfg.credentials),
    log_(log::get("supervisor")) {}

ConnectionSupervisor::~ConnectionSupervisor() { shutdown(); }

bool ConnectionSupervisor::start() {
  std::lock_guard<std::mutex> lk(mu_);
  if (thread_.joinable()) return false;
  stop_ = false;
  lost_ = false;
  thread_ = std::thread([this] { run(); });
  return true;
}

void ConnectionSupervisor::shutdown() {
  std::thread t;
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
    t = std::move(thread_);
  }
  cv_.notify_all();
  session_.shutdown();  // interrupts a connect or handshake in progress, refuses new ones
  if (t.joinable()) t.join();
  set_ready(false);
  set_state(ConnectionState::Disconnected);
}

void ConnectionSupervisor::notify_lost(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    lost_ = true;
  }
  log_->debug("lost event: {}", reason);
  cv_.notify_all();
}

bool ConnectionSupervisor::wait_ready(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout, [this] { return ready_.load() || stop_; }) && ready_.load();
}

void ConnectionSupervisor::set_state(ConnectionState s) {
  const ConnectionState prev = state_.exchange(s);
  if (prev == s) return;
  log_->debug("state {} -> {}", connection_state_name(prev), connection_state_name(s));
  if (observer_) observer_(s);
}

void ConnectionSupervisor::set_ready(bool on) {
  bridge_.set_accepting(on);
  {
    std::lock_guard<std::mutex> lk(mu_);
    ready_.store(on);
  }
  cv_.notify_all();
}

bool ConnectionSupervisor::pause(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lk(mu_);
  return !cv_.wait_for(lk, d, [this] { return stop_; });
}

/*
 * run()
 * -----
 * Supervisor thread. One iteration per connection attempt.
 *
 * PHASES: open -> device sync -> post-sync hook -> ready -> wait for loss/stop
 *         -> close -> backoff.
 *
 * NOTE: lost_ is cleared before each open() so a stale event from the previous
 *       session cannot tear down the new one.
 *
 * @par Readiness
 * User traffic is admitted (set_ready) only after the sync pass and the hook
 * finished with the session still up. A loss during sync skips straight to the
 * reconnect path without announcing on_connect.
 *
 * @par Stop
 * shutdown() flips stop_ and closes the session from outside, which unblocks
 * open(), the sync waits and the loss wait below. Every stop_ check here leaves
 * through the common tail so the final state is always Disconnected.
 */
void ConnectionSupervisor::run() {
  unsigned retry = 0;  // consecutive failures, feeds the backoff

  while (true) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (stop_) break;
      lost_ = false;
    }

    set_state(ConnectionState::Connecting);
    attempts_.fetch_add(1);
    const OpenResult r = session_.open(creds_);  // blocks: connect + auth

    if (r == OpenResult::Ok) {
      retry = 0;                                   // backoff restarts after a good session
      set_state(ConnectionState::Connected);

      const auto rep = sync_.run(bridge_, std::chrono::milliseconds(cfg_.sync_timeout_ms),
                                 [this] { return session_.is_open(); });
      if (!rep.aborted && after_sync_) {
        try {
          after_sync_();
        } catch (const std::exception& ex) {
          log_->error("post-sync step failed: {}", ex.what());
        }
      }

      bool lost_during_sync;
      {
        std::lock_guard<std::mutex> lk(mu_);
        lost_during_sync = lost_ || stop_;  // both checked under the same lock
      }
      if (!lost_during_sync) {
        set_ready(true);
        if (on_connect_) notifier_.post(on_connect_);
      }

      {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [this] { return lost_ || stop_; });
      }

      set_ready(false);                  // new calls fail fast from here
      session_.close();                  // in-flight calls run out their deadlines

      {
        std::lock_guard<std::mutex> lk(mu_);
        if (stop_) break;
      }
      log_->warn("disconnected from {}:{}", cfg_.host, cfg_.port);
      if (on_disconnect_) notifier_.post(on_disconnect_);
    } else {
      {
        std::lock_guard<std::mutex> lk(mu_);
        if (stop_) break;  // open() was cut short by shutdown()
      }
      log_->warn("connect attempt failed: {} ({})", open_result_name(r), session_.last_error());
    }

    ++retry;
    set_state(ConnectionState::Reconnecting);
    const auto delay = reconnect_delay(cfg_.reconnect_delay_min_ms, cfg_.reconnect_delay_max_ms,
                                       retry, cfg_.reconnect_delay_factor);
    log_->info("reconnecting in {} ms", delay.count());
    if (!pause(delay)) break;
  }

  session_.close();                      // idempotent
  set_ready(false);
  set_state(ConnectionState::Disconnected);
}

} // namespace cclink
