#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace blegw::runtime::config {
class RuntimeConfig;
}

namespace blegw::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"ble-gateway"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const blegw::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Pipeline instruments. Without ENABLE_OTEL every call is a no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();

  // outcome is one of the pipeline counter names (filtered, rate_limited, ...)
  void RecordAdvertisement(std::string_view outcome);
  void RecordDelivery(std::string_view outcome, double latency_ms);
  void SetTrackedDevices(std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const blegw::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordAdvertisement(std::string_view) {
}

inline void Metrics::RecordDelivery(std::string_view, double) {
}

inline void Metrics::SetTrackedDevices(std::uint64_t) {
}
#endif

} // namespace blegw::observability
