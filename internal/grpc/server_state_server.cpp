#include "server_state_server.hpp"

#include "grpc_error.hpp"

namespace beacon::grpc {

ServerStateServer::ServerStateServer(std::shared_ptr<beacon::service::ServerStateService> svc) : service_(std::move(svc)) {
}

::grpc::Status ServerStateServer::GetServerState(::grpc::ServerContext*, const beacon::v1::GetServerStateRequest* req,
                                                 beacon::v1::GetServerStateResponse* resp) {
  try {
    *resp = service_->GetServerState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace beacon::grpc
