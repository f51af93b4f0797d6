// ============================================================================
// file_device_manager.cpp - implementation for file_device_manager.hpp
// ============================================================================

#include "cclink/file_device_manager.hpp"
#include "cclink/codec.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using nlohmann::json;

namespace cclink {

FileDeviceManager::FileDeviceManager(fs::path file, InstanceLock lock)
  : file_(std::move(file)), lock_(std::move(lock)) {}

/*
 * open()
 * ------
 * PRE:    none; the file may not exist yet.
 * POLICY: lock first, then read. A missing file is an empty store. Entries that
 *         fail codec::device_from_json are skipped with a warning; a file that is
 *         not a JSON array refuses to open so we never overwrite foreign data.
 * OUT:    owning manager, or nullptr.
 */
std::unique_ptr<FileDeviceManager> FileDeviceManager::open(const fs::path& file) {
  auto lg = log::get("devices");

  fs::path lock_path = file;
  lock_path += ".lock";
  InstanceLock lock(lock_path);
  if (!lock.acquire()) {
    lg->error("device store '{}' is locked by another instance", file.string());
    return nullptr;
  }

  std::map<std::string, Device> loaded;
  std::error_code ec;
  if (fs::exists(file, ec)) {
    std::ifstream in(file);
    if (!in) {
      lg->error("cannot read device store '{}'", file.string());
      return nullptr;
    }
    try {
      json j;
      in >> j;
      if (!j.is_array()) {
        lg->error("device store '{}' is not a JSON array", file.string());
        return nullptr;
      }
      for (const auto& item : j) {
        auto dev = codec::device_from_json(item);
        if (!dev) {
          lg->warn("skipping malformed entry in '{}'", file.string());
          continue;
        }
        loaded.emplace(dev->id(), std::move(*dev));
      }
    } catch (const json::exception& ex) {
      lg->error("malformed device store '{}': {}", file.string(), ex.what());
      return nullptr;
    }
  }

  std::unique_ptr<FileDeviceManager> mgr(new FileDeviceManager(file, std::move(lock)));
  mgr->replace_all(std::move(loaded));
  lg->debug("device store '{}' opened with {} devices", file.string(), mgr->size());
  return mgr;
}

// NOTE: called with mu_ held
LocalStatus FileDeviceManager::persist_locked() {
  json arr = json::array();
  for (const auto& kv : devices_) arr.push_back(codec::device_to_json(kv.second));

  std::error_code ec;
  if (file_.has_parent_path()) fs::create_directories(file_.parent_path(), ec);

  fs::path tmp = file_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      log_->error("cannot write '{}'", tmp.string());
      return LocalStatus::StoreError;
    }
    out << arr.dump(2);
    out.flush();
    if (!out) {
      log_->error("short write to '{}'", tmp.string());
      return LocalStatus::StoreError;
    }
  }
  fs::rename(tmp, file_, ec);
  if (ec) {
    log_->error("cannot replace '{}': {}", file_.string(), ec.message());
    return LocalStatus::StoreError;
  }
  return LocalStatus::Ok;
}

} // namespace cclink
