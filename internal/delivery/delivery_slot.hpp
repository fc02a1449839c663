#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>

#include "internal/delivery/backoff_controller.hpp"
#include "internal/delivery/telemetry_encoder.hpp"
#include "internal/model/gateway_state.hpp"
#include "internal/runtime/timer_service.hpp"
#include "internal/transport/http_transport.hpp"
#include "internal/util/time.hpp"

namespace blegw::delivery {

struct DeliveryOptions {
  std::string               endpoint_url;
  std::chrono::milliseconds watchdog_timeout{10000};
  std::chrono::seconds      http_timeout{5};
};

enum class Admission : std::uint8_t {
  kAccepted    = 0,
  kBusy        = 1,
  kCoolingDown = 2,
};

enum class DeliveryOutcome : std::uint8_t {
  kSuccess          = 0,
  kTransportError   = 1,
  kApplicationError = 2,
  kNoResponse       = 3,
  kWatchdogTimeout  = 4,
};

const char* OutcomeName(DeliveryOutcome outcome);

using OutcomeObserver = std::function<void(DeliveryOutcome)>;

/*
  Single-slot outbound delivery.

  Idle -> Sending on an accepted TrySend, Sending -> Idle on the transport
  completion or on watchdog expiry, whichever runs first. The loser sees a
  generation that is no longer in flight and does nothing, so each accepted
  send reports exactly one outcome to the backoff controller.

  All methods and callbacks run on the event loop thread. The slot must
  outlive the timer service and transport it was handed.
*/
class DeliverySlot {
 public:
  DeliverySlot(model::DeliveryState& state, BackoffController& backoff, const model::GatewayIdentity& identity,
               runtime::TimerService& timers, transport::HttpTransport& transport, DeliveryOptions options,
               util::UnixClock now = util::UnixNow, NonceSource nonce = RandomNonce);

  DeliverySlot(const DeliverySlot&)            = delete;
  DeliverySlot& operator=(const DeliverySlot&) = delete;

  Admission TrySend(const std::string& address, std::int32_t rssi, const std::string& payload_hex);

  void SetOutcomeObserver(OutcomeObserver observer) {
    observer_ = std::move(observer);
  }

  const DeliveryOptions& options() const {
    return options_;
  }

 private:
  void OnCompletion(std::uint64_t generation, std::optional<transport::HttpResponse> response, int error_code);
  void OnWatchdog(std::uint64_t generation);

  bool IsCurrent(std::uint64_t generation) const;
  void Release();
  void Fail(DeliveryOutcome outcome, const std::exception& error);
  void Report(DeliveryOutcome outcome);

  model::DeliveryState&         state_;
  BackoffController&            backoff_;
  const model::GatewayIdentity& identity_;
  runtime::TimerService&        timers_;
  transport::HttpTransport&     transport_;
  DeliveryOptions               options_;
  util::UnixClock               now_;
  NonceSource                   nonce_;
  OutcomeObserver               observer_;

  std::chrono::steady_clock::time_point started_at_{};
};

} // namespace blegw::delivery
