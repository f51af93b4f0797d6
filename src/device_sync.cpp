// ============================================================================
// device_sync.cpp - implementation for device_sync.hpp
// ============================================================================

#include "cclink/device_sync.hpp"

namespace cclink {

const char* sync_state_name(SyncState s) {
  switch (s) {
    case SyncState::NotRegistered:       return "not-registered";
    case SyncState::Registered:          return "registered";
    case SyncState::DisconnectedPending: return "disconnected-pending";
  }
  return "unknown";
}

DeviceSync::DeviceSync(DeviceManager& devices) : devices_(devices), log_(log::get("sync")) {}

DeviceSync::Action DeviceSync::decide(const std::optional<SyncRecord>& rec, const Device& dev) {
  if (!rec || rec->state != SyncState::Registered) return Action::Register;
  if (rec->hash == dev.hash()) return Action::Skip;
  return Action::Update;
}

/*
 * run()
 * -----
 * PRE:    connection handshake done; channel sends bypass the application gate.
 * POLICY: snapshot the device set once, then one blocking call per device that
 *         needs one. The device is re-read right before deciding so a mutation
 *         made during the pass is synchronized with its latest hash.
 * OUT:    counts per outcome; records updated as results arrive.
 *
 * @par Failures
 * A refused or timed-out call leaves the device NotRegistered and the pass moves
 * on; the next connection retries it. Only a dropped connection aborts the pass.
 */
SyncReport DeviceSync::run(RegistrationChannel& channel, std::chrono::milliseconds per_device_timeout,
                           const std::function<bool()>& still_connected) {
  SyncReport rep;
  const auto snapshot = devices_.devices();  // copies; manager lock not held below
  log_->info("synchronizing {} devices", snapshot.size());

  for (const auto& snap : snapshot) {
    if (still_connected && !still_connected()) {
      rep.aborted = true;  // rest waits for the next connection
      break;
    }

    auto current = devices_.get(snap.id());
    if (!current) continue;  // removed while we were iterating
    const Device& dev = *current;

    const Action act = decide(record(dev.id()), dev);
    if (act == Action::Skip) {
      ++rep.skipped;
      continue;
    }

    const CallResult res = (act == Action::Register)  // blocks up to per_device_timeout
        ? channel.register_device(dev, per_device_timeout)
        : channel.update_device(dev, per_device_timeout);

    if (res.ok()) {
      mark_registered(dev.id(), dev.hash());
      if (act == Action::Register) ++rep.registered;
      else ++rep.updated;
      continue;
    }

    ++rep.failed;
    note_failure(dev.id());  // keeps an existing record as is
    if (res.status == CallStatus::Resolved && res.message) {
      log_->warn("{} of '{}' refused: status {}", act == Action::Register ? "register" : "update",
                 dev.id(), res.message->status);
    } else {
      log_->warn("{} of '{}' {}", act == Action::Register ? "register" : "update",
                 dev.id(), call_status_name(res.status));
    }
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    ++passes_;
  }
  log_->info("sync done: {} registered, {} updated, {} unchanged, {} failed{}",
             rep.registered, rep.updated, rep.skipped, rep.failed, rep.aborted ? " (aborted)" : "");
  return rep;
}

void DeviceSync::mark_registered(const std::string& id, const std::string& hash) {
  std::lock_guard<std::mutex> lk(mu_);
  records_[id] = SyncRecord{SyncState::Registered, hash};
}

void DeviceSync::note_failure(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  records_.emplace(id, SyncRecord{SyncState::NotRegistered, {}});
}

void DeviceSync::mark_disconnected(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  records_[id] = SyncRecord{SyncState::DisconnectedPending, {}};
}

void DeviceSync::forget(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  records_.erase(id);
}

std::optional<SyncRecord> DeviceSync::record(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = records_.find(id);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

std::map<std::string, SyncRecord> DeviceSync::records() const {
  std::lock_guard<std::mutex> lk(mu_);
  return records_;
}

uint64_t DeviceSync::passes() const {
  std::lock_guard<std::mutex> lk(mu_);
  return passes_;
}

} // namespace cclink
