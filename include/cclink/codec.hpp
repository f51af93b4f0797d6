/**
 * @file codec.hpp
 * @brief JSON envelope codec for cclink messages and device payloads.
 *
 * @details
 *   All conversion between wire text and runtime structures lives here:
 *     - `encode()` turns a Message into the JSON envelope carried by one SLIP frame.
 *     - `decode()` parses an envelope; malformed input yields std::nullopt, never throws.
 *     - `device_payload()` / `device_from_payload()` serialize a Device for
 *       register/update requests and for the persisted device store.
 *
 *   Backed by nlohmann::json. Unknown envelope fields are ignored so the platform
 *   can extend the envelope without breaking older clients.
 */

#ifndef CCLINK_CODEC_HPP
#define CCLINK_CODEC_HPP

#include "cclink/device.hpp"
#include "cclink/message.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace cclink {
namespace codec {

std::string encode(const Message& msg);

std::optional<Message> decode(const std::string& text);

std::optional<MessageKind> kind_from_name(const std::string& name);

/// JSON object for a device. @p wire_id replaces the local id when non-empty.
nlohmann::json device_to_json(const Device& dev, const std::string& wire_id = {});

/// Inverse of device_to_json. Requires "id" and "type"; tags optional.
std::optional<Device> device_from_json(const nlohmann::json& j);

/// Serialized register/update payload.
std::string device_payload(const Device& dev, const std::string& wire_id);

} // namespace codec
} // namespace cclink

#endif // CCLINK_CODEC_HPP
