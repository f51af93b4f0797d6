// ============================================================================
// call_bridge.cpp - implementation for call_bridge.hpp
// ============================================================================

#include "cclink/call_bridge.hpp"
#include "cclink/codec.hpp"

namespace cclink {

CallBridge::CallBridge(TransportSession& session, DeviceManager& devices, DeviceSync& sync,
                       Dispatcher& callbacks, const Config& cfg)
  : session_(session),
    devices_(devices),
    sync_(sync),
    callbacks_(callbacks),
    default_timeout_(cfg.connector.default_timeout_ms),
    id_prefix_(cfg.device.id_prefix),
    log_(log::get("bridge")) {}

CallBridge::~CallBridge() { stop(); }

void CallBridge::start() {
  std::lock_guard<std::mutex> lk(sweep_mu_);
  if (sweeper_.joinable()) return;
  sweep_stop_ = false;
  stopped_.store(false);
  sweeper_ = std::thread([this] { sweep_loop(); });
}

void CallBridge::stop() {
  stopped_.store(true);  // before drain(); issue() re-checks it after registering
  accepting_.store(false);

  std::thread sweeper;
  {
    std::lock_guard<std::mutex> lk(sweep_mu_);
    sweep_stop_ = true;
    sweeper = std::move(sweeper_);
  }
  sweep_cv_.notify_all();
  if (sweeper.joinable()) sweeper.join();

  for (auto& w : table_.drain()) {
    CallResult r;
    r.status = CallStatus::Failed;
    r.error = "client shut down";
    finish(w, std::move(r));
  }

  {
    // receivers check stopped_ under inbox_mu_; taking it orders the wake-up
    std::lock_guard<std::mutex> lk(inbox_mu_);
  }
  inbox_cv_.notify_all();
}

std::string CallBridge::wire_id(const std::string& local) const {
  if (id_prefix_.empty()) return local;
  return id_prefix_ + "-" + local;
}

std::string CallBridge::local_id(const std::string& wire) const {
  if (id_prefix_.empty()) return wire;
  const std::string head = id_prefix_ + "-";
  if (wire.compare(0, head.size(), head) == 0) return wire.substr(head.size());
  return wire;
}

std::chrono::milliseconds CallBridge::effective_timeout(const CallOptions& opts) const {
  return opts.timeout.count() > 0 ? opts.timeout : default_timeout_;
}

// ---------------------------------------------------------------------------
// finish()
// --------
// Complete @p call once. The user callback, if any, is handed to the dispatcher;
// it never runs on the thread that completed the call.
// ---------------------------------------------------------------------------
void CallBridge::finish(const std::shared_ptr<PendingCall>& call, CallResult result) {
  const CallResult copy = result;
  if (!call->complete(std::move(result))) return;

  log_->debug("call '{}' {}", call->corr_id(), call_status_name(copy.status));
  if (call->callback()) {
    CallCallback cb = call->callback();
    if (!callbacks_.post([cb, copy] { cb(copy); })) {
      log_->error("callback for '{}' dropped: dispatcher stopped", call->corr_id());
    }
  }
}

void CallBridge::await(const std::shared_ptr<PendingCall>& call) {
  if (call->wait_until(call->deadline())) return;

  // deadline passed on our clock; whoever removes the entry decides the outcome
  if (auto w = table_.take(call->corr_id())) {
    CallResult r;
    r.status = CallStatus::TimedOut;
    finish(w, std::move(r));
  }
  call->wait();
}

Future CallBridge::reject(const std::string& reason, const CallOptions& opts) {
  auto call = std::make_shared<PendingCall>(std::string(), Clock::now(), opts.callback);
  CallResult r;
  r.status = CallStatus::Failed;
  r.error = reason;
  finish(call, std::move(r));
  return Future(call);
}

/*
 * issue()
 * -------
 * PRE:    msg fully built except corr_id (allocated here if empty) and timestamp.
 * POLICY: gate -> register -> re-check stop -> send. The waiter is registered
 *         before the send so a fast response can never arrive ahead of its entry.
 * OUT:    Future; already completed when block=true or on an immediate failure.
 *
 * @par Shutdown race
 * A caller can pass the first stopped_ check, lose the CPU, and register after
 * stop() drained the table. The second check after register_call() closes that
 * window: whichever of take() and drain() removes the entry completes it.
 */
Future CallBridge::issue(Message msg, const CallOptions& opts, bool internal, PendingCall::Hook hook) {
  const auto deadline = Clock::now() + effective_timeout(opts);  // steady clock, fixed before any I/O
  if (msg.corr_id.empty()) msg.corr_id = ids_.next();
  msg.timestamp = now_ms();                                        // wall clock, for the platform

  auto call = std::make_shared<PendingCall>(msg.corr_id, deadline, opts.callback, std::move(hook));

  auto fail = [&](const char* why) {
    CallResult r;
    r.status = CallStatus::Failed;
    r.error = why;
    finish(call, std::move(r));
    return Future(call);
  };

  if (stopped_.load()) return fail("client shut down");
  const bool usable = session_.is_open() && (internal || accepting_.load());  // sync traffic skips the gate
  if (!usable) return fail("not connected");

  if (!table_.register_call(msg.corr_id, call, deadline)) {
    log_->error("correlation id '{}' already in flight", msg.corr_id);
    return fail("duplicate correlation id");
  }

  // stop() sets stopped_ before drain(). Seen here -> drain() may have run
  // before our entry existed; take() it back (no-op if drain() got it first).
  if (stopped_.load()) {
    if (auto w = table_.take(msg.corr_id)) {
      CallResult r;
      r.status = CallStatus::Failed;
      r.error = "client shut down";
      finish(w, std::move(r));
    }
    return Future(call);
  }
  kick_sweeper();  // new entry may be the earliest deadline

  if (!session_.send(msg)) {
    if (auto w = table_.take(msg.corr_id)) {  // a response cannot have matched an unsent id
      CallResult r;
      r.status = CallStatus::Failed;
      r.error = "send failed";
      finish(w, std::move(r));
    }
    return Future(call);
  }

  if (opts.block) await(call);  // completes by response, timeout or stop()
  return Future(call);
}

Message CallBridge::device_request(const char* method, const Device& dev) const {
  Message m;
  m.kind = MessageKind::Request;
  m.method = method;
  m.device_id = wire_id(dev.id());
  m.payload = codec::device_payload(dev, m.device_id);
  return m;
}

Message CallBridge::id_request(const char* method, const std::string& id) const {
  Message m;
  m.kind = MessageKind::Request;
  m.method = method;
  m.device_id = wire_id(id);
  return m;
}

// -------- device lifecycle ---------------------------------------------------

DeviceResult CallBridge::add(const Device& dev, const CallOptions& opts) {
  DeviceResult res;
  if (!dev.valid()) {
    res.local = LocalStatus::Invalid;
    res.remote = reject("malformed device", opts);
    return res;
  }

  res.local = devices_.add(dev);
  const std::string id = dev.id();
  const std::string hash = dev.hash();
  res.remote = issue(device_request(method::REGISTER, dev), opts, false,
                     [this, id, hash](const CallResult& r) {
                       if (r.ok()) sync_.mark_registered(id, hash);
                       else sync_.note_failure(id);
                     });
  return res;
}

DeviceResult CallBridge::update(const Device& dev, const CallOptions& opts) {
  DeviceResult res;
  if (!dev.valid()) {
    res.local = LocalStatus::Invalid;
    res.remote = reject("malformed device", opts);
    return res;
  }

  res.local = devices_.update(dev);
  const std::string id = dev.id();
  const std::string hash = dev.hash();
  res.remote = issue(device_request(method::UPDATE, dev), opts, false,
                     [this, id, hash](const CallResult& r) {
                       if (r.ok()) sync_.mark_registered(id, hash);
                     });
  return res;
}

DeviceResult CallBridge::disconnect(const DeviceRef& ref, const CallOptions& opts) {
  DeviceResult res;
  const std::string id = ref.id();
  if (id.empty()) {
    res.local = LocalStatus::Invalid;
    res.remote = reject("empty device id", opts);
    return res;
  }

  res.local = devices_.remove(id);
  res.remote = issue(id_request(method::DISCONNECT, id), opts, false,
                     [this, id](const CallResult& r) {
                       if (r.ok()) sync_.mark_disconnected(id);
                     });
  return res;
}

DeviceResult CallBridge::remove(const DeviceRef& ref, const CallOptions& opts) {
  DeviceResult res;
  const std::string id = ref.id();
  if (id.empty()) {
    res.local = LocalStatus::Invalid;
    res.remote = reject("empty device id", opts);
    return res;
  }

  res.local = devices_.remove(id);
  res.remote = issue(id_request(method::DELETE, id), opts, false,
                     [this, id](const CallResult& r) {
                       if (r.ok()) sync_.forget(id);
                     });
  return res;
}

// -------- messaging ----------------------------------------------------------

Future CallBridge::event(const DeviceRef& ref, const std::string& service, const std::string& payload,
                         const CallOptions& opts) {
  auto dev = ref.resolve(devices_);
  if (!dev) {
    log_->error("event for unknown device '{}'", ref.id());
    return reject("unknown device", opts);
  }
  if (service.empty()) return reject("empty service", opts);

  Message m;
  m.kind = MessageKind::Event;
  m.device_id = wire_id(dev->id());
  m.service = service;
  m.payload = payload;
  return issue(std::move(m), opts, false);
}

Future CallBridge::response(const Message& task, const std::string& payload, const CallOptions& opts) {
  if (task.kind != MessageKind::Task || task.corr_id.empty()) {
    log_->error("response() needs a task received from the platform");
    return reject("not a task", opts);
  }

  Message m;
  m.kind = MessageKind::Response;
  m.corr_id = task.corr_id;
  m.device_id = wire_id(task.device_id);
  m.service = task.service;
  m.status = 200;
  m.payload = payload;
  return issue(std::move(m), opts, false);
}

std::optional<Message> CallBridge::receive() {
  std::unique_lock<std::mutex> lk(inbox_mu_);
  inbox_cv_.wait(lk, [this] { return !inbox_.empty() || stopped_.load(); });
  if (inbox_.empty()) return std::nullopt;
  Message m = std::move(inbox_.front());
  inbox_.pop_front();
  return m;
}

std::optional<Message> CallBridge::receive(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(inbox_mu_);
  if (!inbox_cv_.wait_for(lk, timeout, [this] { return !inbox_.empty() || stopped_.load(); })) {
    return std::nullopt;
  }
  if (inbox_.empty()) return std::nullopt;
  Message m = std::move(inbox_.front());
  inbox_.pop_front();
  return m;
}

size_t CallBridge::queued_tasks() const {
  std::lock_guard<std::mutex> lk(inbox_mu_);
  return inbox_.size();
}

// -------- RegistrationChannel ------------------------------------------------

CallResult CallBridge::register_device(const Device& dev, std::chrono::milliseconds timeout) {
  CallOptions opts;
  opts.timeout = timeout;
  return issue(device_request(method::REGISTER, dev), opts, true).result();
}

CallResult CallBridge::update_device(const Device& dev, std::chrono::milliseconds timeout) {
  CallOptions opts;
  opts.timeout = timeout;
  return issue(device_request(method::UPDATE, dev), opts, true).result();
}

// -------- inbound ------------------------------------------------------------

/*
 * on_inbound()
 * ------------
 * Receive-loop thread. Must not block: resolve is a map removal, callbacks are
 * posted, tasks are queued.
 */
void CallBridge::on_inbound(Message&& msg) {
  switch (msg.kind) {
    case MessageKind::Response: {
      std::shared_ptr<PendingCall> w;
      if (table_.resolve(msg.corr_id, w) == Match::Unmatched) {
        log_->debug("dropping unmatched response '{}' (late or unknown)", msg.corr_id);
        return;
      }
      CallResult r;
      r.status = CallStatus::Resolved;
      r.message = std::move(msg);
      finish(w, std::move(r));
      return;
    }
    case MessageKind::Task: {
      msg.device_id = local_id(msg.device_id);
      {
        std::lock_guard<std::mutex> lk(inbox_mu_);
        if (inbox_.full()) {
          log_->error("task queue full, dropping task '{}' for '{}'", msg.corr_id, msg.device_id);
          return;
        }
        inbox_.push_back(std::move(msg));
      }
      inbox_cv_.notify_one();
      return;
    }
    case MessageKind::Request:
    case MessageKind::Event:
      log_->warn("ignoring unexpected {} '{}' from platform", kind_name(msg.kind), msg.corr_id);
      return;
  }
}

// -------- timeout sweep ------------------------------------------------------

void CallBridge::kick_sweeper() {
  {
    std::lock_guard<std::mutex> lk(sweep_mu_);
    sweep_kick_ = true;
  }
  sweep_cv_.notify_one();
}

// Sleeps until the earliest deadline (or a kick when a new call registers),
// then expires everything due.
void CallBridge::sweep_loop() {
  std::unique_lock<std::mutex> lk(sweep_mu_);
  while (!sweep_stop_) {
    const auto next = table_.next_deadline();
    const auto until = next ? *next : Clock::now() + std::chrono::seconds(1);
    sweep_cv_.wait_until(lk, until, [this] { return sweep_stop_ || sweep_kick_; });
    sweep_kick_ = false;
    if (sweep_stop_) break;

    lk.unlock();
    for (auto& w : table_.expire(Clock::now())) {
      CallResult r;
      r.status = CallStatus::TimedOut;
      finish(w, std::move(r));
    }
    lk.lock();
  }
}

} // namespace cclink
