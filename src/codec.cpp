/**
 * @file codec.cpp
 * @brief Envelope <-> Message conversion on top of nlohmann::json.
 * @details
 *   Every parse path catches nlohmann::json::exception and reports failure as
 *   std::nullopt. A bad frame from the platform costs one log line in the
 *   receive loop, never the connection.
 */

#include "cclink/codec.hpp"

using nlohmann::json;

namespace cclink {
namespace codec {

std::optional<MessageKind> kind_from_name(const std::string& name) {
  if (name == "request")  return MessageKind::Request;
  if (name == "response") return MessageKind::Response;
  if (name == "event")    return MessageKind::Event;
  if (name == "task")     return MessageKind::Task;
  return std::nullopt;
}

/**
 * @brief Serialize a Message into its JSON envelope.
 * @details Empty routing fields are omitted; `status` is written for responses only.
 */
std::string encode(const Message& msg) {
  json j;
  j["corr_id"]      = msg.corr_id;
  j["kind"]         = kind_name(msg.kind);
  if (!msg.method.empty())    j["method"]    = msg.method;
  if (!msg.device_id.empty()) j["device_id"] = msg.device_id;
  if (!msg.service.empty())   j["service"]   = msg.service;
  if (msg.kind == MessageKind::Response) j["status"] = msg.status;
  j["content_type"] = msg.content_type;
  j["payload"]      = msg.payload;
  j["timestamp"]    = msg.timestamp;
  return j.dump();
}

/**
 * @brief Parse one envelope.
 * @return the Message, or std::nullopt when the text is not JSON, is not an
 *         object, lacks a string `corr_id`, or carries an unknown `kind`.
 */
std::optional<Message> decode(const std::string& text) {
  try {
    const json j = json::parse(text);
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("corr_id") || !j["corr_id"].is_string()) return std::nullopt;
    if (!j.contains("kind") || !j["kind"].is_string()) return std::nullopt;

    auto kind = kind_from_name(j["kind"].get<std::string>());
    if (!kind) return std::nullopt;

    Message msg;
    msg.corr_id      = j["corr_id"].get<std::string>();
    msg.kind         = *kind;
    msg.method       = j.value("method", "");
    msg.device_id    = j.value("device_id", "");
    msg.service      = j.value("service", "");
    msg.status       = j.value("status", 0);
    msg.content_type = j.value("content_type", CONTENT_TYPE_JSON);
    msg.timestamp    = j.value("timestamp", int64_t{0});

    // payload is normally a string; tolerate structured payloads by re-serializing them
    if (j.contains("payload")) {
      const auto& p = j["payload"];
      msg.payload = p.is_string() ? p.get<std::string>() : p.dump();
    }
    return msg;
  }
  catch (const json::exception&) {
    return std::nullopt;
  }
}

json device_to_json(const Device& dev, const std::string& wire_id) {
  json j;
  j["id"]   = wire_id.empty() ? dev.id() : wire_id;
  j["type"] = dev.type();
  j["name"] = dev.name();
  j["tags"] = json::object();
  for (const auto& kv : dev.tags()) j["tags"][kv.first] = kv.second;
  j["hash"] = dev.hash();
  return j;
}

std::optional<Device> device_from_json(const json& j) {
  try {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("id") || !j["id"].is_string()) return std::nullopt;
    if (!j.contains("type") || !j["type"].is_string()) return std::nullopt;

    Device::TagMap tags;
    if (j.contains("tags") && j["tags"].is_object()) {
      for (auto it = j["tags"].begin(); it != j["tags"].end(); ++it) {
        if (it.value().is_string()) tags.emplace(it.key(), it.value().get<std::string>());
      }
    }
    return Device(j["id"].get<std::string>(), j["type"].get<std::string>(),
                  j.value("name", ""), std::move(tags));
  }
  catch (const json::exception&) {
    return std::nullopt;
  }
}

std::string device_payload(const Device& dev, const std::string& wire_id) {
  return device_to_json(dev, wire_id).dump();
}

} // namespace codec
} // namespace cclink
