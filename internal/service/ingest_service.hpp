#pragma once

#include "blegw/v1/ingest_service.pb.h"
#include "internal/model/advertisement.hpp"
#include "service_context.hpp"

namespace blegw::service {

/*
  Hands published advertisements to the scanner source. Validation is left
  to the pipeline so malformed input is counted rather than rejected.
*/
class IngestService {
 public:
  explicit IngestService(ServiceContext ctx);

  // false when the scanner is stopped and the advertisement was dropped
  bool Publish(const blegw::v1::Advertisement& advertisement);

 private:
  ServiceContext ctx_;
};

model::Advertisement FromProto(const blegw::v1::Advertisement& advertisement);

}
