#ifndef CCLINK_MEMORY_DEVICE_MANAGER_HPP
#define CCLINK_MEMORY_DEVICE_MANAGER_HPP

#include "cclink/device_manager.hpp"
#include "cclink/logging.hpp"

#include <map>
#include <mutex>

namespace cclink {

/**
 * @brief Map-backed DeviceManager guarded by one mutex.
 *
 * add() of a present id and update()/remove() of an unknown id log a warning
 * and return the matching LocalStatus without touching the map.
 */
class MemoryDeviceManager : public DeviceManager {
public:
  MemoryDeviceManager();

  LocalStatus add(const Device& dev) override;
  LocalStatus update(const Device& dev) override;
  LocalStatus remove(const std::string& id) override;
  std::optional<Device> get(const std::string& id) const override;
  std::vector<Device> devices() const override;
  LocalStatus clear() override;

  size_t size() const;

protected:
  /// Runs under the lock after every successful mutation. Default: nothing to persist.
  virtual LocalStatus persist_locked() { return LocalStatus::Ok; }

  /// Replace the whole map; used by loaders. Caller must not hold the lock.
  void replace_all(std::map<std::string, Device> devices);

  mutable std::mutex mu_;
  std::map<std::string, Device> devices_;
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace cclink

#endif // CCLINK_MEMORY_DEVICE_MANAGER_HPP
