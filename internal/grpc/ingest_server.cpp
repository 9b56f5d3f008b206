#include "ingest_server.hpp"

#include "grpc_error.hpp"

namespace beacon::grpc {

IngestServer::IngestServer(std::shared_ptr<beacon::service::IngestService> svc) : service_(std::move(svc)) {
}

::grpc::Status IngestServer::SubmitHeartbeat(::grpc::ServerContext*, const beacon::v1::SubmitHeartbeatRequest* req,
                                             beacon::v1::SubmitHeartbeatResponse* resp) {
  try {
    *resp = service_->SubmitHeartbeat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace beacon::grpc
