#pragma once

#include "beacon/v1.hpp"
#include "internal/db/model/server_record.hpp"
#include "service_context.hpp"

namespace beacon::service {

class ServerStateService {
 public:
  explicit ServerStateService(ServiceContext ctx);

  // Throws util::NotFound for an unregistered server.
  beacon::v1::GetServerStateResponse GetServerState(const beacon::v1::GetServerStateRequest& req);

  // Snapshot plus ranking computed from it.
  static beacon::v1::ServerState ToProto(const beacon::db::model::ServerRecord& record, std::int64_t default_capacity);

 private:
  ServiceContext ctx_;
};

} // namespace beacon::service
