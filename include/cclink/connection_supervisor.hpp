/**
 * @file connection_supervisor.hpp
 * @brief Connection Supervisor - the only writer of the connection state.
 *
 * @details
 * ```
 *   Disconnected ─start()─► Connecting ──open ok──► Connected
 *                              ▲   │                    │  sync pass, after_sync hook,
 *                              │   │open failed         │  accept traffic, connect callback
 *                              │   ▼                    │
 *                           Reconnecting ◄──────────────┘  connection lost:
 *                           (backoff wait)                 stop traffic, disconnect callback
 *
 *   any state ─shutdown()─► Disconnected (final)
 * ```
 * - Every path from Connected to Reconnecting posts the disconnect notification
 *   first.
 * - Notifications run on their own Dispatcher, so a slow user callback delays
 *   neither reconnection nor message processing.
 * - The backoff counter resets after each successful connect; the first retry
 *   after a loss waits the minimum delay.
 * - Reconnect attempts never stop on their own; shutdown() is the only exit.
 */

#ifndef CCLINK_CONNECTION_SUPERVISOR_HPP
#define CCLINK_CONNECTION_SUPERVISOR_HPP

#include "cclink/call_bridge.hpp"
#include "cclink/config.hpp"
#include "cclink/device_sync.hpp"
#include "cclink/dispatcher.hpp"
#include "cclink/transport_session.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace cclink {

enum class ConnectionState : uint8_t {
  Disconnected = 0,
  Connecting,
  Connected,
  Reconnecting,
};

const char* connection_state_name(ConnectionState s);

class ConnectionSupervisor {
public:
  using Notify = std::function<void()>;
  using StateObserver = std::function<void(ConnectionState)>;

  ConnectionSupervisor(TransportSession& session, CallBridge& bridge, DeviceSync& sync,
                       Dispatcher& notifier, const Config& cfg);
  ~ConnectionSupervisor();

  ConnectionSupervisor(const ConnectionSupervisor&) = delete;
  ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

  /// Set before start().
  void on_connect(Notify fn)    { on_connect_ = std::move(fn); }
  void on_disconnect(Notify fn) { on_disconnect_ = std::move(fn); }
  /// Called synchronously on every transition, on the supervisor thread. For diagnostics.
  void observe(StateObserver fn) { observer_ = std::move(fn); }
  /// Runs on the supervisor thread after each complete device sync pass, before
  /// application traffic is accepted. May block (HTTP); shutdown waits for it.
  void after_sync(Notify fn) { after_sync_ = std::move(fn); }

  /// false if already running.
  bool start();
  /// Final: closes the session and joins the supervisor thread.
  void shutdown();

  /// Entry point for TransportSession's LostHandler (receive-loop thread).
  void notify_lost(const std::string& reason);

  ConnectionState state() const { return state_.load(); }

  /// Connected and synchronized: application traffic accepted.
  bool ready() const { return ready_.load(); }
  bool wait_ready(std::chrono::milliseconds timeout) const;

  unsigned attempts() const { return attempts_.load(); }
  Credentials& credentials() { return creds_; }

private:
  void run();
  void set_state(ConnectionState s);
  void set_ready(bool on);
  /// Sleep up to @p d; false when shutdown interrupts.
  bool pause(std::chrono::milliseconds d);

  TransportSession& session_;
  CallBridge& bridge_;
  DeviceSync& sync_;
  Dispatcher& notifier_;
  ConnectorConfig cfg_;
  Credentials creds_;
  std::shared_ptr<spdlog::logger> log_;

  Notify on_connect_;
  Notify on_disconnect_;
  StateObserver observer_;
  Notify after_sync_;

  std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
  std::atomic<bool> ready_{false};
  std::atomic<unsigned> attempts_{0};

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  bool stop_{false};
  bool lost_{false};
  std::thread thread_;
};

} // namespace cclink

#endif // CCLINK_CONNECTION_SUPERVISOR_HPP
