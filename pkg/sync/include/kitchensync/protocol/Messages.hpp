// Repository: KitchenSync
// Component: Protocol Messages
// Purpose: Closed set of wire messages exchanged between leader and collaborators.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_PROTOCOL_MESSAGES_HPP_
#define KITCHENSYNC_PROTOCOL_MESSAGES_HPP_

#include <string>
#include <variant>

#include "kitchensync/cues/Cue.hpp"

namespace kitchensync::protocol {

// Local mirrors of the wire Envelope bodies. Decoding happens once at the
// transport boundary; everything above it switches on MessageType.

struct SyncMessage {
  double time = 0.0;  // leader elapsed seconds
  std::string leader_id;
};

struct StartMessage {
  cues::CueList schedule;
  double start_time = 0.0;  // leader wall clock, seconds since epoch
  bool debug_mode = false;
};

struct StopMessage {};

struct UpdateScheduleMessage {
  cues::CueList schedule;
};

struct RegisterMessage {
  std::string device_id;
  std::string status;
  std::string video_file;
};

struct HeartbeatMessage {
  std::string device_id;
  std::string status;
};

struct StatusUpdateMessage {
  std::string device_id;
  std::string status;
  std::string detail;
};

using Message = std::variant<SyncMessage, StartMessage, StopMessage, UpdateScheduleMessage,
                             RegisterMessage, HeartbeatMessage, StatusUpdateMessage>;

// Order matches the Message alternatives.
enum class MessageType {
  kSync,
  kStart,
  kStop,
  kUpdateSchedule,
  kRegister,
  kHeartbeat,
  kStatusUpdate,
};

MessageType TypeOf(const Message& message);

// Wire name ("sync", "start", ..., "status_update").
const char* MessageTypeName(MessageType type);

}  // namespace kitchensync::protocol

#endif  // KITCHENSYNC_PROTOCOL_MESSAGES_HPP_
