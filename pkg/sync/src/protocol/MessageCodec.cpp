// Repository: KitchenSync
// Component: Message Codec Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/protocol/MessageCodec.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <type_traits>

#include "kitchensync/net/DatagramTransport.hpp"
#include "kitchensync/util/Logger.hpp"
#include "kitchensync_wire.pb.h"

namespace kitchensync::protocol {

using util::Logger;

namespace {

google::protobuf::util::JsonPrintOptions PrintOptions() {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.add_whitespace = false;
  return options;
}

google::protobuf::util::JsonParseOptions ParseOptions() {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return options;
}

template <typename RepeatedCues>
cues::CueList CuesFromProto(const RepeatedCues& in, const char* context) {
  cues::CueList out;
  out.reserve(static_cast<size_t>(in.size()));
  for (const auto& proto_cue : in) {
    std::string error;
    auto cue = MessageCodec::FromProto(proto_cue, &error);
    if (!cue) {
      Logger::Warn(std::string("[MessageCodec] Dropping invalid cue in ") + context + ": " +
                   error);
      continue;
    }
    out.push_back(std::move(*cue));
  }
  return out;
}

template <typename RepeatedCues>
void CuesToProto(const cues::CueList& in, RepeatedCues* out) {
  for (const auto& cue : in) {
    MessageCodec::ToProto(cue, out->Add());
  }
}

}  // namespace

void MessageCodec::ToProto(const cues::Cue& cue, wire::Cue* out) {
  out->set_time(cue.time);
  out->set_type(cues::CueTypeName(cue.type));
  out->set_channel(cue.channel);
  out->set_note(cue.note);
  out->set_velocity(cue.velocity);
  out->set_control(cue.control);
  out->set_value(cue.value);
  if (!cue.description.empty()) {
    out->set_description(cue.description);
  }
}

std::optional<cues::Cue> MessageCodec::FromProto(const wire::Cue& in, std::string* error) {
  auto type = cues::ParseCueType(in.type());
  if (!type) {
    if (error) *error = "unknown cue type '" + in.type() + "'";
    return std::nullopt;
  }
  cues::Cue cue;
  cue.time = in.time();
  cue.type = *type;
  cue.channel = in.has_channel() ? in.channel() : 1;
  cue.note = in.note();
  cue.velocity = in.velocity();
  cue.control = in.control();
  cue.value = in.value();
  cue.description = in.description();

  if (auto violation = cues::ValidateCue(cue)) {
    if (error) *error = *violation;
    return std::nullopt;
  }
  return cue;
}

std::optional<std::string> MessageCodec::Encode(const Message& message, double timestamp) {
  wire::Envelope env;
  env.set_schema_version(kSchemaVersion);
  env.set_timestamp(timestamp);

  std::visit(
      [&env](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SyncMessage>) {
          auto* body = env.mutable_sync();
          body->set_time(m.time);
          body->set_leader_id(m.leader_id);
        } else if constexpr (std::is_same_v<T, StartMessage>) {
          auto* body = env.mutable_start();
          CuesToProto(m.schedule, body->mutable_schedule());
          body->set_start_time(m.start_time);
          body->set_debug_mode(m.debug_mode);
        } else if constexpr (std::is_same_v<T, StopMessage>) {
          env.mutable_stop();
        } else if constexpr (std::is_same_v<T, UpdateScheduleMessage>) {
          CuesToProto(m.schedule, env.mutable_update_schedule()->mutable_schedule());
        } else if constexpr (std::is_same_v<T, RegisterMessage>) {
          auto* body = env.mutable_register_();
          body->set_device_id(m.device_id);
          body->set_status(m.status);
          body->set_video_file(m.video_file);
        } else if constexpr (std::is_same_v<T, HeartbeatMessage>) {
          auto* body = env.mutable_heartbeat();
          body->set_device_id(m.device_id);
          body->set_status(m.status);
        } else if constexpr (std::is_same_v<T, StatusUpdateMessage>) {
          auto* body = env.mutable_status_update();
          body->set_device_id(m.device_id);
          body->set_status(m.status);
          body->set_detail(m.detail);
        }
      },
      message);

  std::string json;
  const auto status = google::protobuf::util::MessageToJsonString(env, &json, PrintOptions());
  if (!status.ok()) {
    Logger::Error("[MessageCodec] Encode failed: " + status.ToString());
    return std::nullopt;
  }
  if (json.size() > net::kMaxDatagramBytes) {
    Logger::Warn("[MessageCodec] Encoded " + std::string(MessageTypeName(TypeOf(message))) +
                 " is " + std::to_string(json.size()) + " bytes, exceeds datagram limit");
    return std::nullopt;
  }
  return json;
}

std::optional<DecodedMessage> MessageCodec::Decode(const std::string& payload) {
  wire::Envelope env;
  const auto status = google::protobuf::util::JsonStringToMessage(payload, &env, ParseOptions());
  if (!status.ok()) {
    Logger::Debug("[MessageCodec] Dropping malformed datagram: " + status.ToString());
    return std::nullopt;
  }

  // 0 is an unversioned sender; any other value must match ours.
  if (env.schema_version() != 0 && env.schema_version() != kSchemaVersion) {
    Logger::Debug("[MessageCodec] Dropping envelope with schema_version " +
                  std::to_string(env.schema_version()) + " (expected " +
                  std::to_string(kSchemaVersion) + ")");
    return std::nullopt;
  }

  DecodedMessage out{StopMessage{}, env.schema_version(), env.timestamp()};
  switch (env.body_case()) {
    case wire::Envelope::kSync:
      // The JSON parser accepts "NaN" and "Infinity" for doubles.
      if (!std::isfinite(env.sync().time())) {
        Logger::Debug("[MessageCodec] Dropping sync with non-finite time");
        return std::nullopt;
      }
      out.message = SyncMessage{env.sync().time(), env.sync().leader_id()};
      break;
    case wire::Envelope::kStart: {
      if (!std::isfinite(env.start().start_time())) {
        Logger::Debug("[MessageCodec] Dropping start with non-finite start_time");
        return std::nullopt;
      }
      StartMessage start;
      start.schedule = CuesFromProto(env.start().schedule(), "start");
      start.start_time = env.start().start_time();
      start.debug_mode = env.start().debug_mode();
      out.message = std::move(start);
      break;
    }
    case wire::Envelope::kStop:
      out.message = StopMessage{};
      break;
    case wire::Envelope::kUpdateSchedule:
      out.message =
          UpdateScheduleMessage{CuesFromProto(env.update_schedule().schedule(), "update_schedule")};
      break;
    case wire::Envelope::kRegister:
      out.message = RegisterMessage{env.register_().device_id(), env.register_().status(),
                                    env.register_().video_file()};
      break;
    case wire::Envelope::kHeartbeat:
      out.message = HeartbeatMessage{env.heartbeat().device_id(), env.heartbeat().status()};
      break;
    case wire::Envelope::kStatusUpdate:
      out.message = StatusUpdateMessage{env.status_update().device_id(),
                                        env.status_update().status(),
                                        env.status_update().detail()};
      break;
    case wire::Envelope::BODY_NOT_SET:
    default:
      Logger::Debug("[MessageCodec] Dropping envelope with unknown type");
      return std::nullopt;
  }
  return out;
}

std::optional<cues::CueList> MessageCodec::DecodeSchedule(const std::string& json) {
  wire::Schedule schedule;
  const auto status = google::protobuf::util::JsonStringToMessage(json, &schedule, ParseOptions());
  if (!status.ok()) {
    Logger::Error("[MessageCodec] Schedule parse failed: " + status.ToString());
    return std::nullopt;
  }
  cues::CueList cues = CuesFromProto(schedule.cues(), "schedule");
  cues::SortCues(cues);
  return cues;
}

std::string MessageCodec::EncodeSchedule(const cues::CueList& cues) {
  wire::Schedule schedule;
  CuesToProto(cues, schedule.mutable_cues());
  std::string json;
  const auto status = google::protobuf::util::MessageToJsonString(schedule, &json, PrintOptions());
  if (!status.ok()) {
    Logger::Error("[MessageCodec] Schedule encode failed: " + status.ToString());
    return "{}";
  }
  return json;
}

}  // namespace kitchensync::protocol
