/**
 * @file message.hpp
 * @brief cclink Message - one unit of platform communication.
 *
 * A `Message` is what travels inside one SLIP frame: a correlation id, a kind
 * discriminator, routing fields (method, device, service), response metadata
 * (status, content type), an opaque payload string and a creation timestamp.
 *
 * ### Lifetime
 * - Created when the Call Bridge sends, or when the receive loop decodes a frame.
 * - Handed to consumers by value (or `const&`); once delivered it is not modified.
 * - A correlation id is never reused for a different exchange within a session.
 *
 * ### Kinds
 * | kind     | direction          | correlation                                  |
 * |----------|--------------------|----------------------------------------------|
 * | Request  | client -> platform | fresh id, answered by a Response             |
 * | Event    | client -> platform | fresh id, answered by a Response             |
 * | Response | both               | echoes the id of the message it answers      |
 * | Task     | platform -> client | platform id, answered by our Response        |
 *
 * @author Leo
 */

#ifndef CCLINK_MESSAGE_HPP
#define CCLINK_MESSAGE_HPP

#include <cstdint>
#include <string>

namespace cclink {

enum class MessageKind : uint8_t {
  Request = 0,
  Response,
  Event,
  Task,
};

/// Request methods understood by the platform.
namespace method {
static constexpr const char* AUTH       = "auth";
static constexpr const char* REGISTER   = "register";
static constexpr const char* UPDATE     = "update";
static constexpr const char* DISCONNECT = "disconnect";
static constexpr const char* DELETE     = "delete";
} // namespace method

static constexpr const char* CONTENT_TYPE_JSON = "application/json";

struct Message {
  std::string corr_id;
  MessageKind kind{MessageKind::Request};
  std::string method;       // requests only
  std::string device_id;    // wire (prefixed) or local id, depending on the side of the bridge
  std::string service;
  int         status{0};    // responses only
  std::string content_type{CONTENT_TYPE_JSON};
  std::string payload;
  int64_t     timestamp{0}; // ms since epoch

  /// 2xx response.
  bool ok() const { return kind == MessageKind::Response && status >= 200 && status < 300; }
};

/// Current wall clock in milliseconds since epoch, used for `Message::timestamp`.
int64_t now_ms();

const char* kind_name(MessageKind k);

} // namespace cclink

#endif // CCLINK_MESSAGE_HPP
