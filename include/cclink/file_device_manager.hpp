#ifndef CCLINK_FILE_DEVICE_MANAGER_HPP
#define CCLINK_FILE_DEVICE_MANAGER_HPP

/**
 * @file file_device_manager.hpp
 * @brief Persisted DeviceManager: JSON file, one owning process.
 *
 * @details
 * The store is a JSON array of device objects (codec::device_to_json) written
 * atomically after every mutation. `open()` takes an exclusive InstanceLock on
 * `<file>.lock`; a second open of the same file, from this or any other process,
 * fails until the first manager is destroyed.
 *
 * Durability is that of rename(2) on the local filesystem; there is no fsync.
 */

#include "cclink/instance_lock.hpp"
#include "cclink/memory_device_manager.hpp"

#include <filesystem>
#include <memory>

namespace cclink {

class FileDeviceManager : public MemoryDeviceManager {
public:
  /// nullptr if the lock is held elsewhere or the existing file is not a valid store.
  static std::unique_ptr<FileDeviceManager> open(const std::filesystem::path& file);

  const std::filesystem::path& file() const { return file_; }

protected:
  LocalStatus persist_locked() override;

private:
  FileDeviceManager(std::filesystem::path file, InstanceLock lock);

  std::filesystem::path file_;
  InstanceLock lock_;
};

} // namespace cclink

#endif // CCLINK_FILE_DEVICE_MANAGER_HPP
