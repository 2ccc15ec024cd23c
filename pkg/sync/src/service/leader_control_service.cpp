// Repository: KitchenSync
// Component: LeaderControl gRPC Service Implementation
// Purpose: Implements the LeaderControl service for operator session control.
// Copyright (c) 2025 RetroVue

#include "leader_control_service.h"

#include <string>
#include <utility>

#include "kitchensync/protocol/MessageCodec.hpp"
#include "kitchensync/util/Logger.hpp"

namespace kitchensync {
namespace control {

using util::Logger;

LeaderControlImpl::LeaderControlImpl(std::shared_ptr<runtime::LeaderNode> leader)
    : leader_(std::move(leader)) {
  Logger::Info("[LeaderControlImpl] Service initialized");
}

LeaderControlImpl::~LeaderControlImpl() = default;

grpc::Status LeaderControlImpl::StartSession(grpc::ServerContext* /*context*/,
                                             const StartSessionRequest* /*request*/,
                                             StartSessionResponse* response)
{
  Logger::Info("[StartSession] Request received");
  auto result = leader_->StartSession();
  response->set_success(result.success);
  response->set_message(result.message);

  if (!result.success) {
    grpc::StatusCode code = grpc::StatusCode::INTERNAL;
    if (result.message.find("already running") != std::string::npos) {
      code = grpc::StatusCode::FAILED_PRECONDITION;
    }
    return grpc::Status(code, result.message);
  }
  return grpc::Status::OK;
}

grpc::Status LeaderControlImpl::StopSession(grpc::ServerContext* /*context*/,
                                            const StopSessionRequest* /*request*/,
                                            StopSessionResponse* response)
{
  Logger::Info("[StopSession] Request received");
  auto result = leader_->StopSession();
  response->set_success(result.success);
  response->set_message(result.message);

  if (!result.success) {
    grpc::StatusCode code = grpc::StatusCode::INTERNAL;
    if (result.message.find("not running") != std::string::npos) {
      code = grpc::StatusCode::FAILED_PRECONDITION;
    }
    return grpc::Status(code, result.message);
  }
  return grpc::Status::OK;
}

grpc::Status LeaderControlImpl::UpdateSchedule(grpc::ServerContext* /*context*/,
                                               const UpdateScheduleRequest* request,
                                               UpdateScheduleResponse* response)
{
  cues::CueList cues;
  uint32_t rejected = 0;
  for (const auto& proto_cue : request->schedule().cues()) {
    std::string error;
    auto cue = protocol::MessageCodec::FromProto(proto_cue, &error);
    if (!cue) {
      ++rejected;
      Logger::Warn("[UpdateSchedule] Rejected cue: " + error);
      continue;
    }
    cues.push_back(std::move(*cue));
  }
  Logger::Info("[UpdateSchedule] Request received: cues=" + std::to_string(cues.size()) +
               ", rejected=" + std::to_string(rejected));

  const auto accepted = static_cast<uint32_t>(cues.size());
  auto result = leader_->UpdateSchedule(std::move(cues));
  response->set_success(result.success);
  response->set_message(result.message);
  response->set_cue_count(accepted);
  response->set_rejected_count(rejected);

  if (!result.success) {
    return grpc::Status(grpc::StatusCode::UNAVAILABLE, result.message);
  }
  return grpc::Status::OK;
}

grpc::Status LeaderControlImpl::GetStatus(grpc::ServerContext* /*context*/,
                                          const GetStatusRequest* /*request*/,
                                          GetStatusResponse* response)
{
  const auto status = leader_->GetStatus();
  response->set_running(status.running);
  response->set_elapsed_time(status.elapsed_s);
  response->set_cue_count(static_cast<uint32_t>(status.cue_count));
  response->set_ticks_sent(status.ticks_sent);
  response->set_online_count(static_cast<uint32_t>(status.online_count));
  for (const auto& [id, view] : status.collaborators) {
    auto* info = response->add_collaborators();
    info->set_id(id);
    info->set_address(view.record.address.ToString());
    info->set_status(view.record.status);
    info->set_media_ref(view.record.media_ref);
    info->set_online(view.online);
    info->set_seconds_since_seen(view.seconds_since_seen);
  }
  response->set_sessions_started(status.session.sessions_started);
  response->set_total_runtime(status.session.total_runtime_s);
  response->set_last_session_duration(status.session.last_session_duration_s);
  return grpc::Status::OK;
}

}  // namespace control
}  // namespace kitchensync
