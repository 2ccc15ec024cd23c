// Repository: KitchenSync
// Component: Message Codec
// Purpose: Converts Message <-> wire Envelope (protobuf rendered as JSON text).
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_PROTOCOL_MESSAGE_CODEC_HPP_
#define KITCHENSYNC_PROTOCOL_MESSAGE_CODEC_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "kitchensync/cues/Cue.hpp"
#include "kitchensync/protocol/Messages.hpp"

namespace kitchensync::wire {
class Cue;
class Envelope;
}  // namespace kitchensync::wire

namespace kitchensync::protocol {

inline constexpr uint32_t kSchemaVersion = 1;

struct DecodedMessage {
  Message message;
  uint32_t schema_version = 0;
  double timestamp = 0.0;  // sender wall clock, seconds
};

// MessageCodec is stateless. Encode never fails for well-formed input except
// when the result would not fit in one datagram; Decode returns nullopt for
// anything it cannot turn into a Message: bad JSON, a foreign schema_version,
// no known body, or a non-finite sync or start time.
class MessageCodec {
 public:
  // Encodes `message` stamped with `timestamp`. Returns nullopt if the JSON
  // text exceeds the datagram limit.
  static std::optional<std::string> Encode(const Message& message, double timestamp);

  static std::optional<DecodedMessage> Decode(const std::string& payload);

  // Schedule file form: {"cues": [...]}. Invalid cues are dropped with a
  // warning; malformed JSON yields nullopt.
  static std::optional<cues::CueList> DecodeSchedule(const std::string& json);
  static std::string EncodeSchedule(const cues::CueList& cues);

  // Proto mirror conversions (exposed for the gRPC control surface).
  static void ToProto(const cues::Cue& cue, wire::Cue* out);
  static std::optional<cues::Cue> FromProto(const wire::Cue& cue, std::string* error);
};

}  // namespace kitchensync::protocol

#endif  // KITCHENSYNC_PROTOCOL_MESSAGE_CODEC_HPP_
