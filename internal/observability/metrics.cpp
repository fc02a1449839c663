#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define BLEGW_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define BLEGW_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace blegw::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return resource::Resource::Create(attrs);
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> advertisement_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> delivery_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      delivery_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   tracked_devices_gauge;

  std::atomic<std::int64_t> tracked_devices{0};
};

bool InitializeMetrics(const blegw::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == blegw::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms = observability.export_interval_ms() > 0 ? observability.export_interval_ms() : 10000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);

#ifdef BLEGW_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildResource(otlp_config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("ble-gateway", "0.1.0");

  impl_->advertisement_count   = impl_->meter->CreateUInt64Counter("blegw.advertisement.count", "1", "Advertisements by pipeline outcome");
  impl_->delivery_count        = impl_->meter->CreateUInt64Counter("blegw.delivery.count", "1", "Completed deliveries by outcome");
  impl_->delivery_latency_ms   = impl_->meter->CreateDoubleHistogram("blegw.delivery.latency_ms", "ms", "Time from send to completion or watchdog");
  impl_->tracked_devices_gauge = impl_->meter->CreateInt64ObservableGauge("blegw.dedup.tracked_devices", "Devices held by the rate limit store", "1");
  impl_->tracked_devices_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->tracked_devices.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordAdvertisement(std::string_view outcome) {
  if (!impl_ || !impl_->advertisement_count) {
    return;
  }

  const std::string                          outcome_value(outcome);
  const std::initializer_list<AttributePair> attributes = {{"outcome", opentelemetry::nostd::string_view(outcome_value)}};
  AddWithAttributes(impl_->advertisement_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordDelivery(std::string_view outcome, double latency_ms) {
  if (!impl_ || !impl_->delivery_count) {
    return;
  }

  const std::string                          outcome_value(outcome);
  const std::initializer_list<AttributePair> attributes = {{"outcome", opentelemetry::nostd::string_view(outcome_value)}};
  AddWithAttributes(impl_->delivery_count, static_cast<std::uint64_t>(1), attributes);
  if (impl_->delivery_latency_ms) {
    RecordWithAttributes(impl_->delivery_latency_ms, latency_ms, attributes);
  }
}

void Metrics::SetTrackedDevices(std::uint64_t count) {
  if (!impl_) {
    return;
  }
  impl_->tracked_devices.store(static_cast<std::int64_t>(count));
}

} // namespace blegw::observability

#endif
