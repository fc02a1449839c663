#pragma once

#include "blegw/v1/ingest_service.pb.h"
#include "internal/core/gateway.hpp"
#include "service_context.hpp"

namespace blegw::service {

class StatusService {
 public:
  explicit StatusService(ServiceContext ctx);

  // Snapshot is taken on the event loop. Throws std::runtime_error if the
  // loop does not answer within the context's status_timeout.
  blegw::v1::StatusResponse Status(const blegw::v1::StatusRequest& req);

 private:
  ServiceContext ctx_;
};

blegw::v1::StatusResponse ToProto(const core::GatewaySnapshot& snapshot);

}
