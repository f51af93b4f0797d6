// ============================================================================
// memory_device_manager.cpp - implementation for memory_device_manager.hpp
// ============================================================================

#include "cclink/memory_device_manager.hpp"

namespace cclink {

const char* local_status_name(LocalStatus s) {
  switch (s) {
    case LocalStatus::Ok:         return "ok";
    case LocalStatus::Exists:     return "exists";
    case LocalStatus::NotFound:   return "not found";
    case LocalStatus::Invalid:    return "invalid";
    case LocalStatus::StoreError: return "store error";
  }
  return "unknown";
}

MemoryDeviceManager::MemoryDeviceManager() : log_(log::get("devices")) {}

LocalStatus MemoryDeviceManager::add(const Device& dev) {
  if (!dev.valid()) return LocalStatus::Invalid;
  std::lock_guard<std::mutex> lk(mu_);
  if (devices_.count(dev.id())) {
    log_->warn("device '{}' already exists", dev.id());
    return LocalStatus::Exists;
  }
  devices_.emplace(dev.id(), dev);
  return persist_locked();
}

LocalStatus MemoryDeviceManager::update(const Device& dev) {
  if (!dev.valid()) return LocalStatus::Invalid;
  std::lock_guard<std::mutex> lk(mu_);
  auto it = devices_.find(dev.id());
  if (it == devices_.end()) {
    log_->warn("device '{}' does not exist", dev.id());
    return LocalStatus::NotFound;
  }
  it->second = dev;
  return persist_locked();
}

LocalStatus MemoryDeviceManager::remove(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  if (devices_.erase(id) == 0) {
    log_->warn("device '{}' does not exist", id);
    return LocalStatus::NotFound;
  }
  return persist_locked();
}

std::optional<Device> MemoryDeviceManager::get(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = devices_.find(id);
  if (it == devices_.end()) return std::nullopt;
  return it->second;
}

std::vector<Device> MemoryDeviceManager::devices() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Device> out;
  out.reserve(devices_.size());
  for (const auto& kv : devices_) out.push_back(kv.second);
  return out;
}

LocalStatus MemoryDeviceManager::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  devices_.clear();
  return persist_locked();
}

size_t MemoryDeviceManager::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return devices_.size();
}

void MemoryDeviceManager::replace_all(std::map<std::string, Device> devices) {
  std::lock_guard<std::mutex> lk(mu_);
  devices_ = std::move(devices);
}

} // namespace cclink
