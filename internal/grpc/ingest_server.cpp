#include "ingest_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace blegw::grpc {

IngestServer::IngestServer(std::shared_ptr<blegw::service::IngestService> ingest, std::shared_ptr<blegw::service::StatusService> status)
    : ingest_(std::move(ingest)), status_(std::move(status)) {
}

::grpc::Status IngestServer::Publish(::grpc::ServerContext*, ::grpc::ServerReader<blegw::v1::Advertisement>* reader,
                                     blegw::v1::PublishSummary* resp) {
  try {
    blegw::v1::Advertisement advertisement;
    while (reader->Read(&advertisement)) {
      resp->set_received(resp->received() + 1);
      if (ingest_->Publish(advertisement)) {
        resp->set_accepted(resp->accepted() + 1);
      }
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    BLEGW_LOG_ERROR("RPC failed", {observability::StringField("route", "AdvertisementIngest.Publish"), observability::StringField("error", e.what())});
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::Status(::grpc::ServerContext*, const blegw::v1::StatusRequest* req, blegw::v1::StatusResponse* resp) {
  try {
    *resp = status_->Status(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    BLEGW_LOG_ERROR("RPC failed", {observability::StringField("route", "AdvertisementIngest.Status"), observability::StringField("error", e.what())});
    return ToStatus(e);
  }
}

} // namespace blegw::grpc
