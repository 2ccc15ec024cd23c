// Repository: KitchenSync
// Component: LeaderControl gRPC Service Implementation
// Purpose: Implements the LeaderControl service for operator session control.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_LEADER_CONTROL_SERVICE_H_
#define KITCHENSYNC_LEADER_CONTROL_SERVICE_H_

#include <memory>

#include <grpcpp/grpcpp.h>

#include "kitchensync/runtime/LeaderNode.hpp"
#include "kitchensync_control.grpc.pb.h"
#include "kitchensync_control.pb.h"

namespace kitchensync {
namespace control {

// LeaderControlImpl implements the gRPC service defined in
// kitchensync_control.proto. This is a thin adapter that delegates to
// LeaderNode.
class LeaderControlImpl final : public LeaderControl::Service {
 public:
  explicit LeaderControlImpl(std::shared_ptr<runtime::LeaderNode> leader);
  ~LeaderControlImpl() override;

  LeaderControlImpl(const LeaderControlImpl&) = delete;
  LeaderControlImpl& operator=(const LeaderControlImpl&) = delete;

  grpc::Status StartSession(grpc::ServerContext* context,
                            const StartSessionRequest* request,
                            StartSessionResponse* response) override;

  grpc::Status StopSession(grpc::ServerContext* context,
                           const StopSessionRequest* request,
                           StopSessionResponse* response) override;

  grpc::Status UpdateSchedule(grpc::ServerContext* context,
                              const UpdateScheduleRequest* request,
                              UpdateScheduleResponse* response) override;

  grpc::Status GetStatus(grpc::ServerContext* context,
                         const GetStatusRequest* request,
                         GetStatusResponse* response) override;

 private:
  std::shared_ptr<runtime::LeaderNode> leader_;
};

}  // namespace control
}  // namespace kitchensync

#endif  // KITCHENSYNC_LEADER_CONTROL_SERVICE_H_
