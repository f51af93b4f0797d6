// ============================================================================
// message.cpp - implementation for message.hpp
// ============================================================================

#include "cclink/message.hpp"

#include <chrono>

namespace cclink {

int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

const char* kind_name(MessageKind k) {
  switch (k) {
    case MessageKind::Request:  return "request";
    case MessageKind::Response: return "response";
    case MessageKind::Event:    return "event";
    case MessageKind::Task:     return "task";
  }
  return "unknown";
}

} // namespace cclink
