// ============================================================================
// tls_link.cpp - implementation for transport/tls_link.hpp
// ============================================================================

#include "cclink/transport/tls_link.hpp"

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <poll.h>

#include <chrono>

namespace cclink::transport {

static std::string ssl_error_text(const char* what) {
  std::string out = what;
  const unsigned long e = ERR_get_error();
  if (e != 0) {
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    out += ": ";
    out += buf;
  }
  ERR_clear_error();
  return out;
}

std::string TlsLink::last_error() const {
  std::lock_guard<std::mutex> lk(err_mu_);
  if (error_.empty()) return tcp_.last_error();
  return error_;
}

void TlsLink::set_error(std::string what) {
  std::lock_guard<std::mutex> lk(err_mu_);
  error_ = std::move(what);
}

bool TlsLink::begin(const LinkConfig& cfg) {
  end();
  set_error({});
  send_timeout_ms_ = cfg.send_timeout_ms;
  if (!tcp_.begin(cfg)) return false;

  ctx_ = SSL_CTX_new(TLS_client_method());
  if (!ctx_) {
    set_error(ssl_error_text("SSL_CTX_new"));
    end();
    return false;
  }
  SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

  if (cfg.tls_verify) {
    SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
    const int loaded = cfg.ca_file.empty()
        ? SSL_CTX_set_default_verify_paths(ctx_)
        : SSL_CTX_load_verify_locations(ctx_, cfg.ca_file.c_str(), nullptr);
    if (loaded != 1) {
      set_error(ssl_error_text("loading trust store"));
      end();
      return false;
    }
  } else {
    SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
  }

  ssl_ = SSL_new(ctx_);
  if (!ssl_ || SSL_set_fd(ssl_, tcp_.fd()) != 1) {
    set_error(ssl_error_text("SSL_new/SSL_set_fd"));
    end();
    return false;
  }
  SSL_set_tlsext_host_name(ssl_, cfg.host.c_str());
  if (cfg.tls_verify) SSL_set1_host(ssl_, cfg.host.c_str());

  if (!handshake(cfg.connect_timeout_ms)) {
    end();
    return false;
  }
  return true;
}

// Non-blocking SSL_connect, waiting on whichever direction OpenSSL asks for.
bool TlsLink::handshake(int timeout_ms) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

  while (true) {
    if (tcp_.interrupted()) {
      set_error("TLS handshake interrupted");
      return false;
    }
    const int rc = SSL_connect(ssl_);
    if (rc == 1) return true;

    const int err = SSL_get_error(ssl_, rc);
    short ev = 0;
    if (err == SSL_ERROR_WANT_READ) ev = POLLIN;
    else if (err == SSL_ERROR_WANT_WRITE) ev = POLLOUT;
    else {
      const long vr = SSL_get_verify_result(ssl_);
      if (vr != X509_V_OK) set_error(std::string("certificate: ") + X509_verify_cert_error_string(vr));
      else set_error(ssl_error_text("SSL_connect"));
      return false;
    }

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
    if (left <= 0 || tcp_.wait(ev, static_cast<int>(left)) <= 0) {
      set_error("TLS handshake timed out");
      return false;
    }
  }
}

void TlsLink::end() {
  {
    std::lock_guard<std::mutex> lk(ssl_mu_);
    if (ssl_) {
      SSL_shutdown(ssl_);  // best effort close_notify on a non-blocking socket
      SSL_free(ssl_);
      ssl_ = nullptr;
    }
    if (ctx_) {
      SSL_CTX_free(ctx_);
      ctx_ = nullptr;
    }
  }
  tcp_.end();
}

RxResult TlsLink::recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) {
  out_len = 0;
  {
    std::lock_guard<std::mutex> lk(ssl_mu_);
    if (!ssl_) return RxResult::Error;
    // decrypted bytes may already be buffered inside OpenSSL; poll would not see them
    if (SSL_pending(ssl_) > 0) {
      const int n = SSL_read(ssl_, out, static_cast<int>(cap));
      if (n > 0) {
        out_len = static_cast<std::size_t>(n);
        return RxResult::Ok;
      }
    }
  }

  const int ready = tcp_.wait(POLLIN, timeout_ms);
  if (ready == 0) return RxResult::None;
  if (ready < 0) return RxResult::Error;

  std::lock_guard<std::mutex> lk(ssl_mu_);
  if (!ssl_) return RxResult::Error;
  const int n = SSL_read(ssl_, out, static_cast<int>(cap));
  if (n > 0) {
    out_len = static_cast<std::size_t>(n);
    return RxResult::Ok;
  }
  switch (SSL_get_error(ssl_, n)) {
    case SSL_ERROR_WANT_READ:
    case SSL_ERROR_WANT_WRITE:
      return RxResult::None;
    case SSL_ERROR_ZERO_RETURN:
      return RxResult::Closed;
    case SSL_ERROR_SYSCALL:
      if (ERR_peek_error() == 0) {
        ERR_clear_error();
        return RxResult::Closed;  // EOF without close_notify
      }
      set_error(ssl_error_text("SSL_read"));
      return RxResult::Error;
    default:
      set_error(ssl_error_text("SSL_read"));
      return RxResult::Error;
  }
}

TxResult TlsLink::send(const uint8_t* data, std::size_t len) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(send_timeout_ms_);

  std::size_t off = 0;
  while (off < len) {
    short ev = 0;
    {
      std::lock_guard<std::mutex> lk(ssl_mu_);
      if (!ssl_) {
        set_error("send: not connected");
        return TxResult::Error;
      }
      const int n = SSL_write(ssl_, data + off, static_cast<int>(len - off));
      if (n > 0) {
        off += static_cast<std::size_t>(n);
        continue;
      }
      const int err = SSL_get_error(ssl_, n);
      if (err == SSL_ERROR_WANT_WRITE) ev = POLLOUT;
      else if (err == SSL_ERROR_WANT_READ) ev = POLLIN;
      else {
        set_error(ssl_error_text("SSL_write"));
        return TxResult::Error;
      }
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
    if (left <= 0 || tcp_.wait(ev, static_cast<int>(left)) <= 0) {
      set_error("send: timed out");
      return TxResult::Error;
    }
  }
  return TxResult::Ok;
}

} // namespace cclink::transport
