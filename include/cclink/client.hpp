/**
 * @file client.hpp
 * @brief cclink::Client - the root object an application creates once per process.
 *
 * @details
 * Owns and wires the layers:
 * ```
 *   Client
 *    ├─ TransportSession      one connection at a time, receive loop
 *    ├─ CallBridge            correlated calls, task inbox, timeout sweeper
 *    ├─ DeviceSync            per-device registration records
 *    ├─ ConnectionSupervisor  connect / sync / reconnect state machine
 *    └─ Dispatchers           "callbacks" (per-call callbacks), "notify" (connect/disconnect)
 * ```
 * The device manager is supplied by the application and shared with it.
 *
 * With the platform API configured, the hub's device list is reconciled after
 * every synchronization pass (see hub.hpp); name or id changes are saved back
 * to the config file.
 *
 * Only one Client may be alive in a process. When the config was loaded from a
 * file, a lock file next to it extends that rule across processes.
 *
 * Lifecycle:
 * ```
 *   auto c = Client::create(cfg, devices);   // nullptr if another Client exists
 *   c->on_connect(...); c->on_disconnect(...);
 *   c->start();                               // hub prerequisite, then background connect
 *   ...
 *   c->shutdown();                            // or destructor
 * ```
 * @author Leo
 */

#ifndef CCLINK_CLIENT_HPP
#define CCLINK_CLIENT_HPP

#include "cclink/call_bridge.hpp"
#include "cclink/config.hpp"
#include "cclink/connection_supervisor.hpp"
#include "cclink/device_manager.hpp"
#include "cclink/device_sync.hpp"
#include "cclink/dispatcher.hpp"
#include "cclink/hub.hpp"
#include "cclink/instance_lock.hpp"
#include "cclink/transport_session.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace cclink {

class Client {
public:
  using Notify = ConnectionSupervisor::Notify;

  /**
   * @param devices shared with the application; a MemoryDeviceManager is created when null.
   * @param link_factory transport override, mainly for tests.
   * @return nullptr if a Client is already alive here or another process holds the lock.
   */
  static std::unique_ptr<Client> create(Config cfg, std::shared_ptr<DeviceManager> devices = nullptr,
                                        TransportSession::LinkFactory link_factory = transport::make_link);
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  void on_connect(Notify fn)    { supervisor_.on_connect(std::move(fn)); }
  void on_disconnect(Notify fn) { supervisor_.on_disconnect(std::move(fn)); }

  /// false if the hub prerequisite fails or after shutdown().
  bool start();
  void shutdown();

  ConnectionState state() const { return supervisor_.state(); }
  bool ready() const { return supervisor_.ready(); }
  bool wait_ready(std::chrono::milliseconds timeout) const { return supervisor_.wait_ready(timeout); }

  // -------- device lifecycle --------
  DeviceResult add(const Device& dev, const CallOptions& opts = {})         { return bridge_.add(dev, opts); }
  DeviceResult update(const Device& dev, const CallOptions& opts = {})      { return bridge_.update(dev, opts); }
  DeviceResult disconnect(const DeviceRef& ref, const CallOptions& opts = {}) { return bridge_.disconnect(ref, opts); }
  DeviceResult remove(const DeviceRef& ref, const CallOptions& opts = {})   { return bridge_.remove(ref, opts); }

  // -------- messaging --------
  Future event(const DeviceRef& ref, const std::string& service, const std::string& payload,
               const CallOptions& opts = {}) {
    return bridge_.event(ref, service, payload, opts);
  }
  Future response(const Message& task, const std::string& payload, const CallOptions& opts = {}) {
    return bridge_.response(task, payload, opts);
  }
  std::optional<Message> receive() { return bridge_.receive(); }
  std::optional<Message> receive(std::chrono::milliseconds timeout) { return bridge_.receive(timeout); }

  std::optional<SyncRecord> sync_record(const std::string& id) const { return sync_.record(id); }
  uint64_t sync_passes() const { return sync_.passes(); }

  /// Reconcile the hub's device list now. Failed when the API is not configured.
  HubSync sync_hub();

  DeviceManager& devices() { return *devices_; }
  /// Snapshot; hub fields may change while connected.
  Config config() const;

  size_t in_flight() const { return bridge_.in_flight(); }
  unsigned connect_attempts() const { return supervisor_.attempts(); }
  std::thread::id receive_thread_id() const { return session_.receive_thread_id(); }

private:
  Client(Config cfg, std::shared_ptr<DeviceManager> devices, InstanceLock lock,
         TransportSession::LinkFactory link_factory);

  void persist_hub(const char* what);

  std::shared_ptr<DeviceManager> devices_;
  Config cfg_;
  mutable std::mutex hub_mu_;   // cfg_.hub after start(); also serializes sync_hub()
  InstanceLock lock_;
  std::shared_ptr<spdlog::logger> log_;

  TransportSession session_;
  DeviceSync sync_;
  Dispatcher callbacks_;
  Dispatcher notifier_;
  CallBridge bridge_;
  ConnectionSupervisor supervisor_;

  bool started_{false};
  bool shut_down_{false};
};

} // namespace cclink

#endif // CCLINK_CLIENT_HPP
