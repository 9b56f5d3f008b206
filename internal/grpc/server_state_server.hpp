#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "beacon/v1/services.grpc.pb.h"
#include "internal/service/server_state_service.hpp"

namespace beacon::grpc {

class ServerStateServer final : public beacon::v1::ServerStateService::Service {
 public:
  explicit ServerStateServer(std::shared_ptr<beacon::service::ServerStateService> svc);

  ::grpc::Status GetServerState(::grpc::ServerContext*, const beacon::v1::GetServerStateRequest*, beacon::v1::GetServerStateResponse*) override;

 private:
  std::shared_ptr<beacon::service::ServerStateService> service_;
};

} // namespace beacon::grpc
