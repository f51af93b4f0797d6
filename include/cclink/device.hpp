/**
 * @file device.hpp
 * @brief Device identity record with free-form tags and a change-detecting hash.
 *
 * @details
 * A Device is the unit the runtime keeps in sync with the platform:
 *   - `id`   locally unique and stable; fixed at construction
 *   - `type` platform device type identifier
 *   - `name` human readable, mutable
 *   - tags   ordered map tag-id -> value
 *   - `hash` SHA-1 (lowercase hex) over a canonical serialization of all of the above
 *
 * Every mutator recomputes the hash before returning, so a hash read at any point
 * reflects the attributes at that point. Extra per-application state should be kept
 * next to a Device (composition), not by deriving from it.
 *
 * Device is a plain value type; copies are independent. It is not synchronized;
 * share it across threads only through a DeviceManager.
 */

#ifndef CCLINK_DEVICE_HPP
#define CCLINK_DEVICE_HPP

#include <map>
#include <string>

namespace cclink {

class Device {
public:
  using TagMap = std::map<std::string, std::string>;

  Device();
  Device(std::string id, std::string type, std::string name, TagMap tags = {});

  const std::string& id() const   { return id_; }
  const std::string& type() const { return type_; }
  const std::string& name() const { return name_; }
  const TagMap& tags() const      { return tags_; }
  const std::string& hash() const { return hash_; }

  void set_name(std::string name);
  void set_type(std::string type);

  // -------- tags --------
  /// false if @p tag_id already exists.
  bool add_tag(const std::string& tag_id, std::string value);
  /// false if @p tag_id does not exist.
  bool change_tag(const std::string& tag_id, std::string value);
  /// false if @p tag_id does not exist.
  bool remove_tag(const std::string& tag_id);
  bool has_tag(const std::string& tag_id) const { return tags_.count(tag_id) != 0; }

  /// Non-empty id and type.
  bool valid() const { return !id_.empty() && !type_.empty(); }

  /// "Device(id='..', type='..', name='..', tags=N)" for log lines.
  std::string describe() const;

private:
  void rehash();

  std::string id_;
  std::string type_;
  std::string name_;
  TagMap tags_;
  std::string hash_;
};

bool operator==(const Device& a, const Device& b);
inline bool operator!=(const Device& a, const Device& b) { return !(a == b); }

} // namespace cclink

#endif // CCLINK_DEVICE_HPP
