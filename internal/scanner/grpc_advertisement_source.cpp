#include "grpc_advertisement_source.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace blegw::scanner {

GrpcAdvertisementSource::GrpcAdvertisementSource(runtime::Executor executor) : executor_(std::move(executor)) {
}

bool GrpcAdvertisementSource::IsRunning() const {
  std::lock_guard lock(mutex_);
  return running_;
}

void GrpcAdvertisementSource::Start(const ScanOptions& options) {
  std::lock_guard lock(mutex_);
  running_ = true;
  options_ = options;
  BLEGW_LOG_INFO("Scanner started", {observability::BoolField("active", options.active), observability::BoolField("unbounded", !options.duration)});
}

void GrpcAdvertisementSource::Subscribe(AdvertisementHandler handler) {
  std::lock_guard lock(mutex_);
  handlers_.push_back(std::move(handler));
}

bool GrpcAdvertisementSource::Deliver(model::Advertisement advertisement) {
  std::vector<AdvertisementHandler> handlers;
  {
    std::lock_guard lock(mutex_);
    if (!running_) return false;
    handlers = handlers_;
  }

  executor_([handlers = std::move(handlers), advertisement = std::move(advertisement)] {
    for (const auto& handler : handlers) {
      handler(advertisement);
    }
  });
  return true;
}

ScanOptions GrpcAdvertisementSource::options() const {
  std::lock_guard lock(mutex_);
  return options_;
}

} // namespace blegw::scanner
