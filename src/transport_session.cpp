// ============================================================================
// transport_session.cpp - implementation for transport_session.hpp
// ============================================================================

#include "cclink/transport_session.hpp"
#include "cclink/codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>

namespace cclink {

const char* open_result_name(OpenResult r) {
  switch (r) {
    case OpenResult::Ok:              return "ok";
    case OpenResult::ConnectFailed:   return "connect failed";
    case OpenResult::HandshakeFailed: return "handshake failed";
    case OpenResult::Rejected:        return "rejected";
  }
  return "unknown";
}

TransportSession::TransportSession(ConnectorConfig cfg, LinkFactory factory)
  : cfg_(std::move(cfg)), factory_(std::move(factory)), log_(log::get("transport")),
    decoder_(slip::DEFAULT_MAX_FRAME) {}

TransportSession::~TransportSession() { close(); }

void TransportSession::set_handlers(MessageHandler on_message, LostHandler on_lost) {
  on_message_ = std::move(on_message);
  on_lost_ = std::move(on_lost);
}

std::string TransportSession::last_error() const {
  std::lock_guard<std::mutex> lk(err_mu_);
  return error_;
}

void TransportSession::set_error(std::string what) {
  std::lock_guard<std::mutex> lk(err_mu_);
  error_ = std::move(what);
}

std::thread::id TransportSession::receive_thread_id() const { return rx_id_.load(); }

/*
 * open()
 * ------
 * PRE:    any state; a previous session is closed first.
 * POLICY: connect -> handshake -> start receive loop. No retry here.
 * OUT:    OpenResult::Ok with the receive loop running, or a failure with the
 *         link released and last_error() describing the stage that failed.
 *
 * @par Locking
 * The link is published under life_mu_ and then driven without it, so close()
 * can interrupt a slow connect or an unanswered auth. opening_ keeps close()
 * from freeing the link until this thread has let go of it.
 */
OpenResult TransportSession::open(const Credentials& creds) {
  close();

  transport::ILink* link = nullptr;
  {
    std::lock_guard<std::mutex> lk(life_mu_);
    if (shut_down_) {
      set_error("session shut down");
      return OpenResult::ConnectFailed;
    }
    stopping_.store(false);
    lost_reported_.store(false);
    decoder_.reset();
    early_frames_.clear();

    link_ = factory_(cfg_.secure());
    if (!link_) {
      set_error("no link for protocol " + cfg_.protocol);
      return OpenResult::ConnectFailed;
    }
    link = link_.get();
    opening_ = true;
  }

  OpenResult r = connect_and_auth(*link, creds);

  std::lock_guard<std::mutex> lk(life_mu_);
  opening_ = false;
  life_cv_.notify_all();

  if (r == OpenResult::Ok && stopping_.load()) {
    set_error("closed while opening");
    r = OpenResult::HandshakeFailed;
  }
  if (r != OpenResult::Ok) {
    link_->end();
    link_.reset();
    return r;
  }

  alive_.store(true);
  sessions_.fetch_add(1);
  rx_thread_ = std::thread([this] { receive_loop(); });
  log_->info("connected to {}:{} over {}", cfg_.host, cfg_.port, link_->name());
  return OpenResult::Ok;
}

// Runs without life_mu_; @p link stays owned by link_ until open() resumes.
OpenResult TransportSession::connect_and_auth(transport::ILink& link, const Credentials& creds) {
  transport::LinkConfig lc;
  lc.host = cfg_.host;
  lc.port = cfg_.port;
  lc.connect_timeout_ms = cfg_.handshake_timeout_ms;
  lc.keepalive_s = cfg_.keepalive_s;
  lc.tls_verify = cfg_.tls_verify;
  lc.ca_file = cfg_.ca_file;

  if (!link.begin(lc)) {
    set_error(link.last_error());
    log_->warn("connect to {}:{} over {} failed: {}", cfg_.host, cfg_.port, link.name(), last_error());
    return OpenResult::ConnectFailed;
  }

  const OpenResult hr = handshake(link, creds);
  if (hr != OpenResult::Ok) {
    log_->warn("handshake with {}:{} failed: {} ({})", cfg_.host, cfg_.port, open_result_name(hr), last_error());
  }
  return hr;
}

/*
 * handshake()
 * -----------
 * Send request/auth, then read frames until the response with our corr_id
 * arrives or handshake_timeout_ms runs out. Other frames that arrive in the
 * same reads are kept for the receive loop. Reads are sliced to RX_POLL_MS so
 * a close() from another thread is seen even if its interrupt raced the poll.
 *
 * @par Results
 *   - Ok               auth response with a 2xx status
 *   - Rejected         auth response with any other status
 *   - HandshakeFailed  send error, peer close, timeout or local close()
 */
OpenResult TransportSession::handshake(transport::ILink& link, const Credentials& creds) {
  using clock = std::chrono::steady_clock;

  Message auth;
  auth.kind = MessageKind::Request;
  auth.method = method::AUTH;
  auth.corr_id = "auth-" + std::to_string(auth_seq_.fetch_add(1) + 1);  // never collides with call ids
  auth.timestamp = now_ms();
  auth.payload = nlohmann::json{
      {"user", creds.user},
      {"password", creds.password},
      {"group_id", creds.group_id},
      {"client_id", creds.client_id},
  }.dump();

  const auto frame = slip::encode(codec::encode(auth));
  if (link.send(frame.data(), frame.size()) != transport::TxResult::Ok) {
    set_error("auth send: " + link.last_error());
    return OpenResult::HandshakeFailed;
  }

  const auto deadline = clock::now() + std::chrono::milliseconds(cfg_.handshake_timeout_ms);
  uint8_t buf[RX_CHUNK];
  std::vector<std::string> frames;  // reused across reads

  while (true) {
    if (stopping_.load()) {
      set_error("closed during handshake");
      return OpenResult::HandshakeFailed;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
    if (left <= 0) {
      set_error("no auth response within " + std::to_string(cfg_.handshake_timeout_ms) + " ms");
      return OpenResult::HandshakeFailed;
    }

    size_t n = 0;
    const int slice = static_cast<int>(std::min<long long>(left, RX_POLL_MS));
    const auto rx = link.recv(buf, sizeof(buf), n, slice);
    if (rx == transport::RxResult::None) continue;  // slice over, re-check stop and deadline
    if (rx != transport::RxResult::Ok) {
      if (stopping_.load()) set_error("closed during handshake");
      else set_error(rx == transport::RxResult::Closed ? "closed by peer during handshake" : link.last_error());
      return OpenResult::HandshakeFailed;
    }

    frames.clear();
    decoder_.feed(buf, n, frames);  // partial frame stays buffered in decoder_
    for (size_t i = 0; i < frames.size(); ++i) {
      auto msg = codec::decode(frames[i]);
      if (!msg || msg->kind != MessageKind::Response || msg->corr_id != auth.corr_id) {
        early_frames_.push_back(std::move(frames[i]));  // platform may push tasks right away
        continue;
      }
      // everything after the auth reply belongs to the session proper
      for (size_t k = i + 1; k < frames.size(); ++k) early_frames_.push_back(std::move(frames[k]));
      if (!msg->ok()) {
        set_error("auth status " + std::to_string(msg->status) + (msg->payload.empty() ? "" : ": " + msg->payload));
        return OpenResult::Rejected;
      }
      return OpenResult::Ok;
    }
  }
}

bool TransportSession::send(const Message& msg) {
  if (!alive_.load()) return false;

  const auto frame = slip::encode(codec::encode(msg));
  std::lock_guard<std::mutex> lk(send_mu_);
  // link_ is only replaced under life_mu_ after the receive loop is joined and
  // alive_ is false; a concurrent close() interrupts but does not free it here.
  std::lock_guard<std::mutex> life(life_mu_);
  if (!link_ || !alive_.load()) return false;
  if (link_->send(frame.data(), frame.size()) != transport::TxResult::Ok) {
    set_error("send: " + link_->last_error());
    log_->warn("send of {} '{}' failed: {}", kind_name(msg.kind), msg.corr_id, last_error());
    link_->interrupt();  // receive loop reports the loss
    return false;
  }
  return true;
}

void TransportSession::close() {
  std::thread rx;
  {
    std::unique_lock<std::mutex> lk(life_mu_);
    stopping_.store(true);
    alive_.store(false);
    if (link_) link_->interrupt();
    // an open() in progress still drives the link; it returns promptly once interrupted
    life_cv_.wait(lk, [this] { return !opening_; });
    rx = std::move(rx_thread_);
  }

  if (rx.joinable()) {
    if (rx.get_id() == std::this_thread::get_id()) rx.detach();
    else rx.join();
  }

  std::lock_guard<std::mutex> lk(life_mu_);
  if (link_) {
    link_->end();
    link_.reset();
    log_->info("connection closed");
  }
  rx_id_.store(std::thread::id());
}

void TransportSession::shutdown() {
  {
    std::lock_guard<std::mutex> lk(life_mu_);
    shut_down_ = true;
  }
  close();
}

void TransportSession::deliver_frame(const std::string& frame) {
  auto msg = codec::decode(frame);
  if (!msg) {
    log_->warn("dropping malformed envelope ({} bytes)", frame.size());
    return;
  }
  if (on_message_) on_message_(std::move(*msg));
}

// ---------------------------------------------------------------------------
// receive_loop()
// --------------
// Runs on its own thread for the life of one session. Short poll timeouts let it
// notice stopping_ even if interrupt() raced with the poll.
//
// Exit paths:
//   - stopping_ set by close()      -> silent return
//   - peer closed / link error      -> on_lost_ exactly once per session
//
// Message handlers run inline on this thread and only hand work off to the
// correlation table or a dispatcher.
// ---------------------------------------------------------------------------
void TransportSession::receive_loop() {
  rx_id_.store(std::this_thread::get_id());  // lets close() detect a self-join

  for (const auto& f : early_frames_) deliver_frame(f);
  early_frames_.clear();

  uint8_t buf[RX_CHUNK];
  std::vector<std::string> frames;
  std::string reason;  // filled only on a loss

  while (!stopping_.load()) {
    size_t n = 0;
    const auto rx = link_->recv(buf, sizeof(buf), n, RX_POLL_MS);
    if (rx == transport::RxResult::None) continue;  // idle slice
    if (rx == transport::RxResult::Closed) {
      reason = "closed by peer";
      break;
    }
    if (rx == transport::RxResult::Error) {
      reason = link_->last_error();
      if (reason.empty()) reason = "link error";
      break;
    }

    frames.clear();
    decoder_.feed(buf, n, frames);
    for (const auto& f : frames) deliver_frame(f);
  }

  alive_.store(false);  // send() refuses from here
  if (stopping_.load()) return;  // local close, not a loss

  set_error(reason);
  if (!lost_reported_.exchange(true)) {
    log_->warn("connection lost: {}", reason);
    if (on_lost_) on_lost_(reason);
  }
}

} // namespace cclink
