#pragma once

/**
 * @file instance_lock.hpp
 * @brief Single-owner guard: exclusive advisory lock (flock) on a lock file.
 *
 * @details
 * Only one InstanceLock can hold a given path across the whole machine at a time,
 * including two locks in the same process (each opens its own file description).
 * The lock is released when the object is destroyed or the process exits.
 * The lock file itself is left in place; its contents are the holder's pid.
 */

#include <filesystem>
#include <string>

namespace cclink {

class InstanceLock {
public:
  explicit InstanceLock(std::filesystem::path path);
  ~InstanceLock();

  InstanceLock(const InstanceLock&) = delete;
  InstanceLock& operator=(const InstanceLock&) = delete;
  InstanceLock(InstanceLock&& other) noexcept;
  InstanceLock& operator=(InstanceLock&& other) noexcept;

  /// Non-blocking. false if another holder has it or the file cannot be opened.
  bool acquire();
  void release();

  bool held() const { return fd_ >= 0; }
  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  int fd_{-1};
};

} // namespace cclink
