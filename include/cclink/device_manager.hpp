/**
 * @file device_manager.hpp
 * @brief Device Manager interface consumed by the runtime, plus DeviceRef.
 *
 * @details
 * The runtime never stores devices itself. It reads and writes them through a
 * DeviceManager supplied by the embedding application. Implementations must make
 * every operation individually atomic and give read-after-write visibility to the
 * calling thread; the Client calls them from application threads and from the
 * synchronization pass concurrently.
 *
 * Shipped backends:
 *   - MemoryDeviceManager  (memory_device_manager.hpp)
 *   - FileDeviceManager    (file_device_manager.hpp), persisted, single owner process
 */

#ifndef CCLINK_DEVICE_MANAGER_HPP
#define CCLINK_DEVICE_MANAGER_HPP

#include "cclink/device.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cclink {

/// Outcome of a device-manager operation.
enum class LocalStatus : uint8_t {
  Ok = 0,
  Exists,      // add: id already present
  NotFound,    // update/remove/get: id unknown
  Invalid,     // malformed device (empty id or type)
  StoreError,  // backend could not persist the change
};

const char* local_status_name(LocalStatus s);

class DeviceManager {
public:
  virtual ~DeviceManager() = default;

  virtual LocalStatus add(const Device& dev) = 0;
  virtual LocalStatus update(const Device& dev) = 0;
  virtual LocalStatus remove(const std::string& id) = 0;
  virtual std::optional<Device> get(const std::string& id) const = 0;
  virtual std::vector<Device> devices() const = 0;
  virtual LocalStatus clear() = 0;
};

/**
 * @brief A device named by id, or given as an instance.
 *
 * Calls that accept "a device or its id" take a DeviceRef; it converts implicitly
 * from `std::string`, `const char*` and `Device`.
 */
class DeviceRef {
public:
  struct ByIdentifier { std::string id; };

  DeviceRef(std::string id) : ref_(ByIdentifier{std::move(id)}) {}
  DeviceRef(const char* id) : ref_(ByIdentifier{id ? id : ""}) {}
  DeviceRef(Device dev) : ref_(std::move(dev)) {}

  bool by_instance() const { return std::holds_alternative<Device>(ref_); }

  const std::string& id() const {
    if (const auto* d = std::get_if<Device>(&ref_)) return d->id();
    return std::get<ByIdentifier>(ref_).id;
  }

  /// The instance if given, else a lookup in @p dm.
  std::optional<Device> resolve(const DeviceManager& dm) const {
    if (const auto* d = std::get_if<Device>(&ref_)) return *d;
    return dm.get(std::get<ByIdentifier>(ref_).id);
  }

private:
  std::variant<ByIdentifier, Device> ref_;
};

} // namespace cclink

#endif // CCLINK_DEVICE_MANAGER_HPP
