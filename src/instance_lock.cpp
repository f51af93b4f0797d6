// ============================================================================
// instance_lock.cpp - implementation for instance_lock.hpp
// ============================================================================

#include "cclink/instance_lock.hpp"

#include <fcntl.h>      // ::open
#include <sys/file.h>   // ::flock
#include <unistd.h>     // ::close, ::write, ::ftruncate, ::getpid

#include <system_error>
#include <utility>

namespace cclink {

InstanceLock::InstanceLock(std::filesystem::path path) : path_(std::move(path)) {}

InstanceLock::~InstanceLock() { release(); }

InstanceLock::InstanceLock(InstanceLock&& other) noexcept
  : path_(std::move(other.path_)), fd_(other.fd_) {
  other.fd_ = -1;
}

InstanceLock& InstanceLock::operator=(InstanceLock&& other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

// ---------------------------------------------------------------------------
// acquire()
// ---------
// Open (create) the lock file and try LOCK_EX | LOCK_NB. On success the file is
// rewritten with our pid for operators; a failed write does not undo the lock.
// ---------------------------------------------------------------------------
bool InstanceLock::acquire() {
  if (fd_ >= 0) return true;

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) return false;
  }

  int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;

  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    ::close(fd);
    return false;
  }

  const std::string pid = std::to_string(::getpid()) + "\n";
  if (::ftruncate(fd, 0) == 0) {
    const ssize_t n = ::write(fd, pid.data(), pid.size());
    (void)n;  // informational only
  }
  fd_ = fd;
  return true;
}

void InstanceLock::release() {
  if (fd_ < 0) return;
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
}

} // namespace cclink
