// ============================================================================
// tcp_link.cpp - implementation for transport/tcp_link.hpp
// For the threading contract see transport/link.hpp.
// ============================================================================

#include "cclink/transport/tcp_link.hpp"
#include "cclink/transport/tls_link.hpp"

#include <fcntl.h>         // fcntl, O_NONBLOCK
#include <netdb.h>         // getaddrinfo
#include <netinet/in.h>
#include <netinet/tcp.h>   // TCP_NODELAY, TCP_KEEPIDLE
#include <poll.h>          // poll(2) for every timed wait
#include <sys/socket.h>
#include <unistd.h>        // ::read, ::close

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace cclink::transport {

std::unique_ptr<ILink> make_link(bool secure) {
  if (secure) return std::make_unique<TlsLink>();
  return std::make_unique<TcpLink>();
}

std::string TcpLink::last_error() const {
  std::lock_guard<std::mutex> lk(err_mu_);
  return error_;
}

void TcpLink::set_error(std::string what) {
  std::lock_guard<std::mutex> lk(err_mu_);
  error_ = std::move(what);
}

// ---------------------------------------------------------------------------
// begin()
// -------
// Resolve host, try each address until one connects within the timeout.
// The socket stays non-blocking for its whole life; poll() does all waiting.
// ---------------------------------------------------------------------------
bool TcpLink::begin(const LinkConfig& cfg) {
  end();
  send_timeout_ms_ = cfg.send_timeout_ms;

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const std::string port = std::to_string(cfg.port);
  const int gai = ::getaddrinfo(cfg.host.c_str(), port.c_str(), &hints, &res);
  if (gai != 0) {
    set_error("resolve " + cfg.host + ": " + ::gai_strerror(gai));
    return false;
  }

  bool ok = false;
  for (addrinfo* ai = res; ai && !ok; ai = ai->ai_next) {
    ok = connect_one(ai->ai_addr, static_cast<unsigned>(ai->ai_addrlen), ai->ai_family, cfg.connect_timeout_ms);
  }
  ::freeaddrinfo(res);

  if (!ok) return false;
  tune(cfg.keepalive_s);
  return true;
}

bool TcpLink::connect_one(const void* addr, unsigned addrlen, int family, int timeout_ms) {
  using clock = std::chrono::steady_clock;
  if (interrupted_.load()) {
    set_error("connect: interrupted");
    return false;
  }

  int fd = ::socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    set_error(std::string("socket: ") + std::strerror(errno));
    return false;
  }

  int rc = ::connect(fd, static_cast<const sockaddr*>(addr), addrlen);
  if (rc != 0 && errno != EINPROGRESS) {
    set_error(std::string("connect: ") + std::strerror(errno));
    ::close(fd);
    return false;
  }

  if (rc != 0) {
    // no fd_ yet for interrupt() to shut down: poll in slices and check the flag
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    int pr = 0;
    while (pr == 0) {
      if (interrupted_.load()) {
        set_error("connect: interrupted");
        ::close(fd);
        return false;
      }
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
      if (left <= 0) break;
      pollfd pfd{fd, POLLOUT, 0};
      pr = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(left, CONNECT_SLICE_MS)));
      if (pr < 0 && errno == EINTR) pr = 0;
    }
    if (pr <= 0) {
      set_error(pr == 0 ? "connect: timed out" : std::string("connect: ") + std::strerror(errno));
      ::close(fd);
      return false;
    }
    int soerr = 0;
    socklen_t len = sizeof(soerr);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soerr, &len) != 0 || soerr != 0) {
      set_error(std::string("connect: ") + std::strerror(soerr ? soerr : errno));
      ::close(fd);
      return false;
    }
  }

  fd_.store(fd);
  // interrupt() sets the flag before reading fd_: one of us sees the other
  if (interrupted_.load()) {
    set_error("connect: interrupted");
    end();
    return false;
  }
  return true;
}

// Latency over throughput: envelopes are small and request/response shaped.
void TcpLink::tune(int keepalive_s) {
  const int fd = fd_.load();
  int one = 1;
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  if (keepalive_s > 0) {
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one));
    int idle = keepalive_s;
    int intvl = keepalive_s > 3 ? keepalive_s / 3 : 1;
    int cnt = 3;
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
  }
}

void TcpLink::end() {
  const int fd = fd_.exchange(-1);
  if (fd >= 0) ::close(fd);
}

// shutdown(2) wakes a poll() blocked in recv() with POLLIN/POLLHUP -> read() == 0
void TcpLink::interrupt() {
  interrupted_.store(true);
  const int fd = fd_.load();
  if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

int TcpLink::wait(short events, int timeout_ms) const {
  const int fd = fd_.load();
  if (fd < 0) return -1;
  pollfd pfd{fd, events, 0};
  int pr = ::poll(&pfd, 1, timeout_ms);
  if (pr < 0) return errno == EINTR ? 0 : -1;
  if (pr == 0) return 0;
  if (pfd.revents & events) return 1;
  // POLLHUP/POLLERR without the requested event: let the caller's read/write report it
  return (pfd.revents & (POLLHUP | POLLERR)) ? 1 : -1;
}

RxResult TcpLink::recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) {
  out_len = 0;
  const int ready = wait(POLLIN, timeout_ms);
  if (ready == 0) return RxResult::None;
  if (ready < 0) {
    set_error("poll failed");
    return RxResult::Error;
  }

  const ssize_t n = ::recv(fd_.load(), out, cap, 0);
  if (n > 0) {
    out_len = static_cast<std::size_t>(n);
    return RxResult::Ok;
  }
  if (n == 0) return RxResult::Closed;
  if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RxResult::None;
  set_error(std::string("recv: ") + std::strerror(errno));
  return RxResult::Error;
}

// ---------------------------------------------------------------------------
// send()
// ------
// Write the whole buffer. Partial writes and EAGAIN wait on POLLOUT, bounded by
// send_timeout_ms overall. MSG_NOSIGNAL: a dead peer is an Error, not SIGPIPE.
// ---------------------------------------------------------------------------
TxResult TcpLink::send(const uint8_t* data, std::size_t len) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(send_timeout_ms_);

  std::size_t off = 0;
  while (off < len) {
    const int fd = fd_.load();
    if (fd < 0) {
      set_error("send: not connected");
      return TxResult::Error;
    }
    const ssize_t n = ::send(fd, data + off, len - off, MSG_NOSIGNAL);
    if (n > 0) {
      off += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
      if (left <= 0 || wait(POLLOUT, static_cast<int>(left)) <= 0) {
        set_error("send: timed out");
        return TxResult::Error;
      }
      continue;
    }
    set_error(std::string("send: ") + std::strerror(errno));
    return TxResult::Error;
  }
  return TxResult::Ok;
}

} // namespace cclink::transport
