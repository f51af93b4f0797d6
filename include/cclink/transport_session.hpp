/**
 * @file transport_session.hpp
 * @brief Transport Session - one physical platform connection at a time.
 *
 * @details
 * ## Responsibilities
 * - `open(credentials)`: link connect (TCP, or TLS over TCP), then the auth
 *   handshake: one `request/auth` envelope out, one matching `response` in.
 *   Either stage failing returns a failure code; there is no internal retry.
 * - `send(Message)`: SLIP-framed JSON envelope, serialized across callers.
 * - receive loop: a dedicated thread that decodes frames and hands every inbound
 *   Message to the MessageHandler, in arrival order.
 * - `close()`: idempotent teardown; joins the receive loop, releases the link.
 *   Safe from another thread while open() is connecting or authenticating: the
 *   link is interrupted and open() returns a failure promptly.
 * - `shutdown()`: close() and refuse every later open(). Final.
 *
 * ## Connection-lost contract
 * When the link reports EOF or an error while the session was not being closed
 * locally, the receive loop marks the session dead, calls the LostHandler exactly
 * once, and exits. A local `close()` never produces a lost event. A failed send()
 * interrupts the link so that the receive loop observes the failure and reports it.
 *
 * ## Handlers
 * Both handlers run on the receive-loop thread and must not block; the Call Bridge
 * and Connection Supervisor only enqueue work from them.
 */

#ifndef CCLINK_TRANSPORT_SESSION_HPP
#define CCLINK_TRANSPORT_SESSION_HPP

#include "cclink/config.hpp"
#include "cclink/message.hpp"
#include "cclink/slip.hpp"
#include "cclink/transport/link.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cclink {

enum class OpenResult : uint8_t {
  Ok = 0,
  ConnectFailed,     // link could not be established
  HandshakeFailed,   // link up, but no valid auth response in time
  Rejected,          // platform answered auth with a non-2xx status
};

const char* open_result_name(OpenResult r);

class TransportSession {
public:
  using MessageHandler = std::function<void(Message&&)>;
  using LostHandler    = std::function<void(const std::string& reason)>;
  using LinkFactory    = std::function<std::unique_ptr<transport::ILink>(bool secure)>;

  explicit TransportSession(ConnectorConfig cfg, LinkFactory factory = transport::make_link);
  ~TransportSession();

  TransportSession(const TransportSession&) = delete;
  TransportSession& operator=(const TransportSession&) = delete;

  /// Install before the first open().
  void set_handlers(MessageHandler on_message, LostHandler on_lost);

  OpenResult open(const Credentials& creds);
  bool send(const Message& msg);
  void close();
  void shutdown();

  /// Handshake completed and no loss observed since.
  bool is_open() const { return alive_.load(); }

  std::string last_error() const;

  /// Id of the current receive-loop thread (default id when none).
  std::thread::id receive_thread_id() const;

  /// Opens that completed the handshake so far.
  uint64_t sessions() const { return sessions_.load(); }

private:
  OpenResult connect_and_auth(transport::ILink& link, const Credentials& creds);
  OpenResult handshake(transport::ILink& link, const Credentials& creds);
  void receive_loop();
  void deliver_frame(const std::string& frame);
  void set_error(std::string what);

  static constexpr size_t RX_CHUNK = 4096;
  static constexpr int    RX_POLL_MS = 200;

  ConnectorConfig cfg_;
  LinkFactory factory_;
  MessageHandler on_message_;
  LostHandler on_lost_;
  std::shared_ptr<spdlog::logger> log_;

  std::mutex life_mu_;                     // link_, rx_thread_, opening_
  std::condition_variable life_cv_;        // opening_ cleared
  bool opening_{false};                    // connect/handshake running without life_mu_
  bool shut_down_{false};
  std::unique_ptr<transport::ILink> link_;
  slip::decoder decoder_;
  std::vector<std::string> early_frames_;  // read during handshake, after the auth reply
  std::thread rx_thread_;
  std::atomic<std::thread::id> rx_id_{};

  std::mutex send_mu_;
  std::atomic<bool> stopping_{false};
  std::atomic<bool> alive_{false};
  std::atomic<bool> lost_reported_{false};
  std::atomic<uint64_t> sessions_{0};
  std::atomic<uint64_t> auth_seq_{0};

  mutable std::mutex err_mu_;
  std::string error_;
};

} // namespace cclink

#endif // CCLINK_TRANSPORT_SESSION_HPP
