// Repository: KitchenSync
// Component: Protocol Messages Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/protocol/Messages.hpp"

namespace kitchensync::protocol {

MessageType TypeOf(const Message& message) {
  return static_cast<MessageType>(message.index());
}

const char* MessageTypeName(MessageType type) {
  switch (type) {
    case MessageType::kSync:
      return "sync";
    case MessageType::kStart:
      return "start";
    case MessageType::kStop:
      return "stop";
    case MessageType::kUpdateSchedule:
      return "update_schedule";
    case MessageType::kRegister:
      return "register";
    case MessageType::kHeartbeat:
      return "heartbeat";
    case MessageType::kStatusUpdate:
      return "status_update";
  }
  return "unknown";
}

}  // namespace kitchensync::protocol
