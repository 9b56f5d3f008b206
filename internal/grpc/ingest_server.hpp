#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "beacon/v1/services.grpc.pb.h"
#include "internal/service/ingest_service.hpp"

namespace beacon::grpc {

class IngestServer final : public beacon::v1::HeartbeatIngestService::Service {
 public:
  explicit IngestServer(std::shared_ptr<beacon::service::IngestService> svc);

  ::grpc::Status SubmitHeartbeat(::grpc::ServerContext*, const beacon::v1::SubmitHeartbeatRequest*,
                                 beacon::v1::SubmitHeartbeatResponse*) override;

 private:
  std::shared_ptr<beacon::service::IngestService> service_;
};

} // namespace beacon::grpc
