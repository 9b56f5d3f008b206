#pragma once

#include "beacon/v1.hpp"
#include "internal/model/heartbeat.hpp"
#include "service_context.hpp"

namespace beacon::service {

class IngestService {
 public:
  explicit IngestService(ServiceContext ctx);

  // Rejections surface as the typed errors in internal/util/errors.hpp.
  beacon::v1::SubmitHeartbeatResponse SubmitHeartbeat(const beacon::v1::SubmitHeartbeatRequest& req);

  static beacon::model::HeartbeatEnvelope ToEnvelope(const beacon::v1::SubmitHeartbeatRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace beacon::service
