// ============================================================================
// device.cpp - implementation for device.hpp
// ============================================================================

#include "cclink/device.hpp"
#include "cclink/digest.hpp"

#include <utility>

namespace cclink {

Device::Device() { rehash(); }

Device::Device(std::string id, std::string type, std::string name, TagMap tags)
  : id_(std::move(id)), type_(std::move(type)), name_(std::move(name)), tags_(std::move(tags)) {
  rehash();
}

void Device::set_name(std::string name) {
  name_ = std::move(name);
  rehash();
}

void Device::set_type(std::string type) {
  type_ = std::move(type);
  rehash();
}

bool Device::add_tag(const std::string& tag_id, std::string value) {
  if (tags_.count(tag_id)) return false;
  tags_.emplace(tag_id, std::move(value));
  rehash();
  return true;
}

bool Device::change_tag(const std::string& tag_id, std::string value) {
  auto it = tags_.find(tag_id);
  if (it == tags_.end()) return false;
  it->second = std::move(value);
  rehash();
  return true;
}

bool Device::remove_tag(const std::string& tag_id) {
  if (tags_.erase(tag_id) == 0) return false;
  rehash();
  return true;
}

std::string Device::describe() const {
  return "Device(id='" + id_ + "', type='" + type_ + "', name='" + name_ +
         "', tags=" + std::to_string(tags_.size()) + ")";
}

// ---------------------------------------------------------------------------
// rehash()
// --------
// Canonical form: every field is written as "<len>:<bytes>" so that no two
// distinct attribute sets can serialize to the same text ("ab"+"c" vs "a"+"bc").
// Tags follow in key order (std::map), each as key then value.
// ---------------------------------------------------------------------------
void Device::rehash() {
  std::string canon;
  auto put = [&canon](const std::string& s) {
    canon += std::to_string(s.size());
    canon += ':';
    canon += s;
  };
  put(id_);
  put(type_);
  put(name_);
  canon += 'T';
  canon += std::to_string(tags_.size());
  for (const auto& kv : tags_) {
    put(kv.first);
    put(kv.second);
  }
  hash_ = digest::to_hex(digest::sha1(canon));
}

bool operator==(const Device& a, const Device& b) {
  return a.id() == b.id() && a.type() == b.type() && a.name() == b.name() && a.tags() == b.tags();
}

} // namespace cclink
