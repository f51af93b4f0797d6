#pragma once
/**
 * @file fake_platform.hpp
 * @brief Loopback platform for tests: SLIP + JSON envelopes over 127.0.0.1.
 *
 * One client connection at a time; a new connection replaces the old one.
 * Every non-auth message is recorded and, unless held, acknowledged with a
 * response carrying the same corr_id.
 */

#include "cclink/message.hpp"
#include "cclink/slip.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cclink::test {

class FakePlatform {
public:
  enum class Policy { Reply, Hold, Reject };

  FakePlatform();
  ~FakePlatform();

  FakePlatform(const FakePlatform&) = delete;
  FakePlatform& operator=(const FakePlatform&) = delete;

  uint16_t port() const { return port_; }

  void accept_auth(bool yes) { accept_auth_.store(yes); }
  /// Count auth requests but never answer them.
  void hold_auth(bool yes) { hold_auth_.store(yes); }

  /// Key is the request method ("register", ...) or "event" / "response".
  void set_policy(const std::string& key, Policy p);

  /// Every recorded message, oldest first.
  std::vector<Message> received() const;
  std::vector<Message> received(const std::string& key) const;
  size_t count(const std::string& key) const;

  unsigned auths() const { return auths_.load(); }
  unsigned connections() const { return connections_.load(); }
  bool connected() const;

  /// Send a task to the current client. corr_id generated when empty.
  bool push_task(const std::string& device_id, const std::string& service,
                 const std::string& payload, std::string corr_id = {});
  /// Reply to a held message later (e.g. after the client gave up).
  bool reply(const Message& to, int status = 200);
  bool send(const Message& msg);

  /// Close the current client connection from the platform side.
  void drop_connection();

  /// Poll @p pred every few ms until true or timeout.
  static bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout);

private:
  void run();
  void handle(const std::string& frame);
  void close_client_locked();
  static std::string key_of(const Message& m);

  int listen_fd_{-1};
  uint16_t port_{0};
  std::thread thread_;
  std::atomic<bool> stop_{false};
  std::atomic<bool> drop_{false};
  std::atomic<bool> accept_auth_{true};
  std::atomic<bool> hold_auth_{false};
  std::atomic<unsigned> auths_{0};
  std::atomic<unsigned> connections_{0};
  std::atomic<unsigned> task_seq_{0};

  mutable std::mutex io_mu_;   // client_fd_ and writes
  int client_fd_{-1};
  slip::decoder decoder_;

  mutable std::mutex rec_mu_;
  std::vector<Message> received_;
  std::map<std::string, Policy> policy_;
};

} // namespace cclink::test
