#pragma once

#include <mutex>
#include <vector>

#include "internal/runtime/executor.hpp"
#include "internal/scanner/advertisement_source.hpp"

namespace blegw::scanner {

/*
  Advertisements pushed by a scanner sidecar over AdvertisementIngest.Publish.

  The sidecar owns the radio; this side only gates delivery. Until Start is
  called published advertisements are discarded. Deliver is called from gRPC
  threads and forwards to the subscribers through the executor.
*/
class GrpcAdvertisementSource final : public AdvertisementSource {
 public:
  explicit GrpcAdvertisementSource(runtime::Executor executor);

  bool IsRunning() const override;
  void Start(const ScanOptions& options) override;
  void Subscribe(AdvertisementHandler handler) override;

  // false when the scan is not running and the advertisement was dropped
  bool Deliver(model::Advertisement advertisement);

  ScanOptions options() const;

 private:
  runtime::Executor executor_;

  mutable std::mutex                mutex_;
  bool                              running_ = false;
  ScanOptions                       options_;
  std::vector<AdvertisementHandler> handlers_;
};

} // namespace blegw::scanner
