#include "delivery_slot.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace blegw::delivery {

using blegw::observability::BoolField;
using blegw::observability::IntField;
using blegw::observability::StringField;

const char* OutcomeName(DeliveryOutcome outcome) {
  switch (outcome) {
    case DeliveryOutcome::kSuccess:
      return "delivered";
    case DeliveryOutcome::kTransportError:
      return "transport_error";
    case DeliveryOutcome::kApplicationError:
      return "application_error";
    case DeliveryOutcome::kNoResponse:
      return "no_response";
    case DeliveryOutcome::kWatchdogTimeout:
      return "watchdog_timeout";
  }
  return "unknown";
}

DeliverySlot::DeliverySlot(model::DeliveryState& state, BackoffController& backoff, const model::GatewayIdentity& identity,
                           runtime::TimerService& timers, transport::HttpTransport& transport, DeliveryOptions options,
                           util::UnixClock now, NonceSource nonce)
    : state_(state),
      backoff_(backoff),
      identity_(identity),
      timers_(timers),
      transport_(transport),
      options_(std::move(options)),
      now_(std::move(now)),
      nonce_(std::move(nonce)) {
}

Admission DeliverySlot::TrySend(const std::string& address, std::int32_t rssi, const std::string& payload_hex) {
  if (state_.in_flight) {
    return Admission::kBusy;
  }

  const auto now = now_();
  if (backoff_.IsInCooldown(now)) {
    return Admission::kCoolingDown;
  }

  TelemetryRecord record;
  record.gateway_address = identity_.gateway_address;
  record.device_address  = address;
  record.rssi            = rssi;
  record.timestamp       = now;
  record.nonce           = nonce_();
  record.payload_hex     = payload_hex;

  transport::HttpRequest request;
  request.url     = options_.endpoint_url;
  request.body    = EncodeTelemetry(record);
  request.timeout = options_.http_timeout;

  const auto generation = ++state_.generation;
  state_.in_flight      = true;
  state_.target_address = address;
  started_at_           = std::chrono::steady_clock::now();
  state_.watchdog       = timers_.ScheduleOnce(options_.watchdog_timeout, [this, generation] { OnWatchdog(generation); });

  transport_.Post(request, [this, generation](std::optional<transport::HttpResponse> response, int error_code) {
    OnCompletion(generation, std::move(response), error_code);
  });

  return Admission::kAccepted;
}

bool DeliverySlot::IsCurrent(std::uint64_t generation) const {
  return state_.in_flight && state_.generation == generation;
}

void DeliverySlot::Release() {
  state_.in_flight = false;
  if (state_.watchdog) {
    timers_.Cancel(*state_.watchdog);
    state_.watchdog.reset();
  }
}

void DeliverySlot::OnCompletion(std::uint64_t generation, std::optional<transport::HttpResponse> response, int error_code) {
  if (!IsCurrent(generation)) {
    BLEGW_LOG_DEBUG("Ignoring late HTTP completion", {IntField("generation", static_cast<std::int64_t>(generation)), IntField("error_code", error_code)});
    return;
  }

  Release();

  BLEGW_LOG_DEBUG("HTTP callback", {IntField("error_code", error_code), BoolField("response", response.has_value())});

  if (error_code != transport::kTransportOk) {
    Fail(DeliveryOutcome::kTransportError, util::TransportError("HTTP transport error", error_code));
    return;
  }

  if (!response) {
    Fail(DeliveryOutcome::kNoResponse, util::TransportError("HTTP callback without response object", error_code));
    return;
  }

  BLEGW_LOG_DEBUG("HTTP response", {IntField("status", response->status), StringField("device", state_.target_address), StringField("body", response->body)});

  if (response->status != 200) {
    Fail(DeliveryOutcome::kApplicationError,
         util::ApplicationError("HTTP " + std::to_string(response->status) + ": " + (response->body.empty() ? "no body" : response->body),
                                response->status));
    return;
  }

  backoff_.OnSuccess();
  Report(DeliveryOutcome::kSuccess);
}

void DeliverySlot::OnWatchdog(std::uint64_t generation) {
  if (!IsCurrent(generation)) {
    return;
  }

  // the timer has already fired, nothing left to cancel
  state_.watchdog.reset();
  state_.in_flight = false;

  Fail(DeliveryOutcome::kWatchdogTimeout, util::WatchdogTimeout("HTTP request timed out, releasing delivery slot"));
}

void DeliverySlot::Fail(DeliveryOutcome outcome, const std::exception& error) {
  const auto& device = state_.target_address;
  if (outcome == DeliveryOutcome::kWatchdogTimeout) {
    BLEGW_LOG_WARN(error.what(), {StringField("device", device)});
  } else if (const auto* transport_error = dynamic_cast<const util::TransportError*>(&error)) {
    BLEGW_LOG_ERROR(error.what(), {StringField("device", device), IntField("code", transport_error->code())});
  } else {
    BLEGW_LOG_ERROR(error.what(), {StringField("device", device)});
  }

  backoff_.OnFailure(now_());
  Report(outcome);
}

void DeliverySlot::Report(DeliveryOutcome outcome) {
  const auto latency_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at_).count();
  observability::Metrics::Instance().RecordDelivery(OutcomeName(outcome), latency_ms);

  if (observer_) {
    observer_(outcome);
  }
}

} // namespace blegw::delivery
