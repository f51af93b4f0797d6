/**
 * @file call_bridge.hpp
 * @brief Call Bridge - the request/response surface over Transport Session + Correlation Table.
 *
 * @details
 * ## Shape of every call
 * ```
 *   build Message ─► allocate corr_id ─► register waiter (deadline) ─► send
 *        │                                                              │
 *        │                    block=true: wait until response or deadline
 *        └─ block=false: return Future now; callback runs later on the dispatcher
 * ```
 * Completion is decided by the Correlation Table: the receive loop (response),
 * the sweeper thread (deadline, non-blocking calls) or the blocked caller itself
 * (deadline, lazy expiry) removes the entry, and only the remover completes it.
 *
 * ## Gate
 * Application calls are sent only while the supervisor has declared the
 * connection usable (`set_accepting(true)`, i.e. connected and synchronized).
 * Otherwise the network part fails at once with CallStatus::Failed. Calls made by
 * the synchronization pass go through RegistrationChannel and only need an open
 * session.
 *
 * ## Local vs remote
 * add/update/disconnect/remove always apply to the DeviceManager first and report
 * that result in DeviceResult::local; the platform outcome is DeviceResult::remote.
 * A local failure never prevents the remote attempt.
 *
 * ## Unsolicited tasks
 * Platform tasks go to a bounded FIFO drained by receive(). When it is full the
 * incoming task is dropped and logged.
 */

#ifndef CCLINK_CALL_BRIDGE_HPP
#define CCLINK_CALL_BRIDGE_HPP

#include "cclink/call.hpp"
#include "cclink/config.hpp"
#include "cclink/correlation_id.hpp"
#include "cclink/correlation_table.hpp"
#include "cclink/device_manager.hpp"
#include "cclink/device_sync.hpp"
#include "cclink/dispatcher.hpp"
#include "cclink/transport_session.hpp"

#include "etl/deque.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace cclink {

/// Independent local (device manager) and remote (platform) outcomes.
struct DeviceResult {
  LocalStatus local{LocalStatus::Ok};
  Future remote;

  bool local_ok() const { return local == LocalStatus::Ok; }
  /// Completed with a 2xx platform response.
  bool remote_ok() const { return remote.done() && remote.ok(); }
};

class CallBridge : public RegistrationChannel {
public:
  static constexpr size_t TASK_INBOX_CAP = 256;

  CallBridge(TransportSession& session, DeviceManager& devices, DeviceSync& sync,
             Dispatcher& callbacks, const Config& cfg);
  ~CallBridge() override;

  CallBridge(const CallBridge&) = delete;
  CallBridge& operator=(const CallBridge&) = delete;

  void start();
  /// Fail everything in flight, wake receive() callers, stop the sweeper.
  void stop();

  void set_accepting(bool on) { accepting_.store(on); }
  bool accepting() const { return accepting_.load(); }

  /// Receive-loop entry point for every decoded inbound Message.
  void on_inbound(Message&& msg);

  // -------- device lifecycle --------
  DeviceResult add(const Device& dev, const CallOptions& opts);
  DeviceResult update(const Device& dev, const CallOptions& opts);
  DeviceResult disconnect(const DeviceRef& ref, const CallOptions& opts);
  DeviceResult remove(const DeviceRef& ref, const CallOptions& opts);

  // -------- messaging --------
  Future event(const DeviceRef& ref, const std::string& service, const std::string& payload,
               const CallOptions& opts);
  Future response(const Message& task, const std::string& payload, const CallOptions& opts);

  /// Next platform task, FIFO. Blocks; empty only after stop().
  std::optional<Message> receive();
  /// As receive(), empty on timeout.
  std::optional<Message> receive(std::chrono::milliseconds timeout);

  // -------- RegistrationChannel (synchronization pass) --------
  CallResult register_device(const Device& dev, std::chrono::milliseconds timeout) override;
  CallResult update_device(const Device& dev, std::chrono::milliseconds timeout) override;

  std::string wire_id(const std::string& local_id) const;
  std::string local_id(const std::string& wire_id) const;

  size_t in_flight() const { return table_.size(); }
  size_t queued_tasks() const;

private:
  using Clock = PendingCall::Clock;

  Future issue(Message msg, const CallOptions& opts, bool internal, PendingCall::Hook hook = {});
  Future reject(const std::string& reason, const CallOptions& opts);
  void await(const std::shared_ptr<PendingCall>& call);
  void finish(const std::shared_ptr<PendingCall>& call, CallResult result);
  Message device_request(const char* method, const Device& dev) const;
  Message id_request(const char* method, const std::string& id) const;
  std::chrono::milliseconds effective_timeout(const CallOptions& opts) const;

  void sweep_loop();
  void kick_sweeper();

  TransportSession& session_;
  DeviceManager& devices_;
  DeviceSync& sync_;
  Dispatcher& callbacks_;
  const std::chrono::milliseconds default_timeout_;
  const std::string id_prefix_;
  std::shared_ptr<spdlog::logger> log_;

  CorrelationIdGenerator ids_;
  CorrelationTable table_;
  std::atomic<bool> accepting_{false};
  std::atomic<bool> stopped_{false};

  std::mutex sweep_mu_;
  std::condition_variable sweep_cv_;
  bool sweep_stop_{false};
  bool sweep_kick_{false};
  std::thread sweeper_;

  mutable std::mutex inbox_mu_;
  std::condition_variable inbox_cv_;
  etl::deque<Message, TASK_INBOX_CAP> inbox_;
};

} // namespace cclink

#endif // CCLINK_CALL_BRIDGE_HPP
