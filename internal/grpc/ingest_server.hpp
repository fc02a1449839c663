#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "blegw/v1.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/status_service.hpp"

namespace blegw::grpc {

class IngestServer final : public blegw::v1::AdvertisementIngest::Service {
public:
  IngestServer(std::shared_ptr<blegw::service::IngestService> ingest, std::shared_ptr<blegw::service::StatusService> status);

  ::grpc::Status Publish(::grpc::ServerContext*,
                         ::grpc::ServerReader<blegw::v1::Advertisement>*,
                         blegw::v1::PublishSummary*) override;

  ::grpc::Status Status(::grpc::ServerContext*,
                        const blegw::v1::StatusRequest*,
                        blegw::v1::StatusResponse*) override;

private:
  std::shared_ptr<blegw::service::IngestService> ingest_;
  std::shared_ptr<blegw::service::StatusService> status_;
};

}
