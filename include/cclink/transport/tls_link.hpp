#pragma once

/**
 * @file tls_link.hpp
 * @brief TLS client link: OpenSSL session over a non-blocking TcpLink.
 *
 * @details
 * TLS 1.2 minimum, SNI always set. With `tls_verify` the peer chain is checked
 * against `ca_file` (or the system trust store) and the certificate must match
 * the host name. One SSL object serves both directions, so every SSL_* call runs
 * under `ssl_mu_`; the socket wait itself happens outside the lock.
 */

#include "cclink/transport/tcp_link.hpp"

#include <openssl/ssl.h>

#include <mutex>

namespace cclink::transport {

class TlsLink : public ILink {
public:
  TlsLink() = default;
  ~TlsLink() override { end(); }

  TlsLink(const TlsLink&) = delete;
  TlsLink& operator=(const TlsLink&) = delete;

  bool        begin(const LinkConfig& cfg) override;
  void        end() override;
  void        interrupt() override { tcp_.interrupt(); }
  RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) override;
  TxResult    send(const uint8_t* data, std::size_t len) override;
  const char* name() const override { return "tls"; }
  std::string last_error() const override;

private:
  bool handshake(int timeout_ms);
  void set_error(std::string what);

  TcpLink tcp_;
  SSL_CTX* ctx_{nullptr};
  SSL* ssl_{nullptr};
  int send_timeout_ms_{5000};
  std::mutex ssl_mu_;
  mutable std::mutex err_mu_;
  std::string error_;
};

} // namespace cclink::transport
