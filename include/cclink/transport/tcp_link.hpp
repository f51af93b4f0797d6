#pragma once

/**
 * @file tcp_link.hpp
 * @brief POSIX TCP client link: non-blocking socket driven by poll(2).
 */

#include "cclink/transport/link.hpp"

#include <atomic>
#include <mutex>

namespace cclink::transport {

class TcpLink : public ILink {
public:
  TcpLink() = default;
  ~TcpLink() override { end(); }

  TcpLink(const TcpLink&) = delete;
  TcpLink& operator=(const TcpLink&) = delete;

  bool        begin(const LinkConfig& cfg) override;
  void        end() override;
  void        interrupt() override;
  RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) override;
  TxResult    send(const uint8_t* data, std::size_t len) override;
  const char* name() const override { return "tcp"; }
  std::string last_error() const override;

  int fd() const { return fd_.load(); }
  bool interrupted() const { return interrupted_.load(); }

  /// Wait until fd is readable (POLLIN) or writable (POLLOUT). 1 ready, 0 timeout, -1 error/hangup.
  int wait(short events, int timeout_ms) const;

private:
  static constexpr int CONNECT_SLICE_MS = 50;

  bool connect_one(const void* addr, unsigned addrlen, int family, int timeout_ms);
  void tune(int keepalive_s);
  void set_error(std::string what);

  std::atomic<int> fd_{-1};
  std::atomic<bool> interrupted_{false};
  int send_timeout_ms_{5000};
  mutable std::mutex err_mu_;
  std::string error_;
};

} // namespace cclink::transport
