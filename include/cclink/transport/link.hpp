#pragma once

/**
 * @file link.hpp
 * @brief Byte-stream link contract under the Transport Session.
 *
 * @details
 * A link is one connected byte stream to one endpoint: plain TCP (TcpLink) or TLS
 * over TCP (TlsLink). It knows nothing about frames or envelopes.
 *
 * Threading contract (the Transport Session relies on exactly this):
 *   - recv() is called by one thread at a time (the receive loop or the handshake).
 *   - send() is called by one thread at a time (callers serialize on a mutex),
 *     possibly concurrently with recv().
 *   - interrupt() may be called from any thread at any time, including while
 *     begin() is still connecting. It makes a pending begin() fail and a pending or
 *     future recv() return Closed/Error promptly. It is sticky: an interrupted link
 *     stays interrupted until destroyed.
 *   - end() is called once no recv()/send() is running.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace cclink::transport {

enum class TxResult : uint8_t { Ok = 0, Error = 1 };
enum class RxResult : uint8_t { None = 0, Ok = 1, Closed = 2, Error = 3 };  // None: timed out, nothing read

struct LinkConfig {
  std::string host;
  uint16_t    port{0};
  int         connect_timeout_ms{5000};
  int         send_timeout_ms{5000};
  int         keepalive_s{0};      // 0: leave SO_KEEPALIVE off
  bool        tls_verify{true};
  std::string ca_file;             // empty: system trust store
};

class ILink {
public:
  virtual ~ILink() = default;
  virtual bool        begin(const LinkConfig& cfg) = 0;
  virtual void        end() = 0;
  virtual void        interrupt() = 0;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
  virtual const char* name() const = 0;
  virtual std::string last_error() const = 0;
};

/// TlsLink when @p secure, else TcpLink.
std::unique_ptr<ILink> make_link(bool secure);

} // namespace cclink::transport
