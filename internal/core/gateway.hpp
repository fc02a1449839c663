#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/dedup/rate_limit_store.hpp"
#include "internal/delivery/backoff_controller.hpp"
#include "internal/delivery/delivery_slot.hpp"
#include "internal/filter/advertisement_filter.hpp"
#include "internal/identity/identity_provider.hpp"
#include "internal/model/advertisement.hpp"
#include "internal/model/gateway_state.hpp"
#include "internal/runtime/timer_service.hpp"
#include "internal/scanner/advertisement_source.hpp"
#include "internal/transport/http_transport.hpp"
#include "internal/util/time.hpp"

namespace blegw::runtime::config {
class RuntimeConfig;
}

namespace blegw::core {

struct GatewayOptions {
  filter::ManufacturerAllowList allow_list;
  std::int64_t                  rate_limit_interval_sec = 5;
  std::size_t                   max_tracked_devices     = 50;
  std::chrono::seconds          cleanup_interval{300};
  delivery::DeliveryOptions     delivery;

  static GatewayOptions FromConfig(const blegw::runtime::config::RuntimeConfig& config);
};

struct PipelineCounters {
  std::uint64_t received         = 0;
  std::uint64_t malformed        = 0;
  std::uint64_t filtered         = 0;
  std::uint64_t rate_limited     = 0;
  std::uint64_t slot_busy        = 0;
  std::uint64_t cooldown         = 0;
  std::uint64_t accepted         = 0;
  std::uint64_t delivered        = 0;
  std::uint64_t failed           = 0;
  std::uint64_t watchdog_expired = 0;
  std::uint64_t evicted          = 0;
};

struct GatewaySnapshot {
  model::DeliveryState   delivery;
  model::BackoffState    backoff;
  model::GatewayIdentity identity;
  bool                   in_cooldown     = false;
  std::size_t            tracked_devices = 0;
  PipelineCounters       counters;
};

/*
  Gateway

  Composition of the forwarding pipeline:

      advertisement -> filter -> rate limit store -> backoff -> delivery slot

  Owns the process-wide DeliveryState, BackoffState and GatewayIdentity and
  hands them by reference to the slot and the backoff controller.

  Every method runs on the event loop thread; the collaborators must deliver
  their callbacks there.
*/
class Gateway {
 public:
  Gateway(GatewayOptions options, scanner::AdvertisementSource& source, transport::HttpTransport& transport,
          runtime::TimerService& timers, identity::IdentityProvider& identity_provider, util::UnixClock now = util::UnixNow,
          delivery::NonceSource nonce = delivery::RandomNonce);

  Gateway(const Gateway&)            = delete;
  Gateway& operator=(const Gateway&) = delete;

  // Resolves identity in the background, makes sure the scanner runs,
  // subscribes, and schedules the periodic cleanup.
  void Start();

  void OnAdvertisement(const model::Advertisement& advertisement);

  // Returns the number of evicted devices.
  std::size_t RunCleanup();

  GatewaySnapshot Snapshot() const;

  const GatewayOptions& options() const {
    return options_;
  }

  const dedup::RateLimitStore& store() const {
    return store_;
  }

 private:
  void OnIdentity(std::optional<std::string> address);
  void OnDeliveryOutcome(delivery::DeliveryOutcome outcome);
  void Count(std::uint64_t& counter, const char* outcome);

  GatewayOptions                options_;
  scanner::AdvertisementSource& source_;
  runtime::TimerService&        timers_;
  identity::IdentityProvider&   identity_provider_;
  util::UnixClock               now_;

  model::DeliveryState   delivery_state_;
  model::BackoffState    backoff_state_;
  model::GatewayIdentity identity_;

  dedup::RateLimitStore       store_;
  delivery::BackoffController backoff_;
  delivery::DeliverySlot      slot_;

  PipelineCounters counters_;
  bool             started_ = false;
};

} // namespace blegw::core
