#pragma once

#include <chrono>
#include <functional>
#include <optional>

#include "internal/model/advertisement.hpp"

namespace blegw::scanner {

struct ScanOptions {
  bool active = false;
  // nullopt scans until stopped
  std::optional<std::chrono::milliseconds> duration;
};

using AdvertisementHandler = std::function<void(const model::Advertisement&)>;

/*
  Producer of scan results. Handlers are invoked on the gateway event loop,
  in the order the scanner observed the advertisements.
*/
class AdvertisementSource {
 public:
  virtual ~AdvertisementSource() = default;

  virtual bool IsRunning() const                      = 0;
  virtual void Start(const ScanOptions& options)       = 0;
  virtual void Subscribe(AdvertisementHandler handler) = 0;
};

} // namespace blegw::scanner
