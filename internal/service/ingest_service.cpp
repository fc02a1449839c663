#include "ingest_service.hpp"

#include <utility>

#include "internal/scanner/grpc_advertisement_source.hpp"

namespace blegw::service {

model::Advertisement FromProto(const blegw::v1::Advertisement& advertisement) {
  model::Advertisement result;
  result.address = advertisement.address();
  result.rssi    = advertisement.rssi();
  result.payload = advertisement.payload();
  return result;
}

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

bool IngestService::Publish(const blegw::v1::Advertisement& advertisement) {
  return ctx_.source->Deliver(FromProto(advertisement));
}

} // namespace blegw::service
