/**
 * @file device_sync.hpp
 * @brief Device Synchronization - reconcile local devices with the platform on every connect.
 *
 * @details
 * ## Record
 * One SyncRecord per device id: the last known remote registration outcome and
 * the device hash that outcome refers to. Records live for the process lifetime,
 * are never persisted, and are updated both by synchronization passes and by
 * live add/update/disconnect/delete results.
 *
 * ## Policy (per device in the local set)
 * | record                         | action   |
 * |--------------------------------|----------|
 * | none / NotRegistered           | register |
 * | DisconnectedPending            | register |
 * | Registered, same hash          | skip     |
 * | Registered, different hash     | update   |
 *
 * Remote devices missing from the local set are left alone: deletion only follows
 * an explicit `remove()`/`disconnect()`. A failed entry is retried on the next
 * pass (next connect), never in a loop.
 */

#ifndef CCLINK_DEVICE_SYNC_HPP
#define CCLINK_DEVICE_SYNC_HPP

#include "cclink/call.hpp"
#include "cclink/device_manager.hpp"
#include "cclink/logging.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace cclink {

enum class SyncState : uint8_t {
  NotRegistered = 0,
  Registered,
  DisconnectedPending,
};

const char* sync_state_name(SyncState s);

struct SyncRecord {
  SyncState state{SyncState::NotRegistered};
  std::string hash;   // hash the platform last accepted (Registered), else empty
};

struct SyncReport {
  size_t registered{0};
  size_t updated{0};
  size_t skipped{0};
  size_t failed{0};
  bool aborted{false};  // connection went away mid-pass
};

/// Remote side of a synchronization pass. Calls block up to @p timeout.
class RegistrationChannel {
public:
  virtual ~RegistrationChannel() = default;
  virtual CallResult register_device(const Device& dev, std::chrono::milliseconds timeout) = 0;
  virtual CallResult update_device(const Device& dev, std::chrono::milliseconds timeout) = 0;
};

class DeviceSync {
public:
  enum class Action : uint8_t { Register = 0, Update, Skip };

  explicit DeviceSync(DeviceManager& devices);

  static Action decide(const std::optional<SyncRecord>& rec, const Device& dev);

  /**
   * @brief One reconciliation pass over `devices.devices()`.
   * @param still_connected checked before each device; a false stops the pass.
   */
  SyncReport run(RegistrationChannel& channel, std::chrono::milliseconds per_device_timeout,
                 const std::function<bool()>& still_connected);

  void mark_registered(const std::string& id, const std::string& hash);
  /// Creates a NotRegistered record if none exists; an existing record is kept.
  void note_failure(const std::string& id);
  void mark_disconnected(const std::string& id);
  void forget(const std::string& id);

  std::optional<SyncRecord> record(const std::string& id) const;
  std::map<std::string, SyncRecord> records() const;
  uint64_t passes() const;

private:
  DeviceManager& devices_;
  std::shared_ptr<spdlog::logger> log_;
  mutable std::mutex mu_;
  std::map<std::string, SyncRecord> records_;
  uint64_t passes_{0};
};

} // namespace cclink

#endif // CCLINK_DEVICE_SYNC_HPP
