#include "gateway.hpp"

#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace blegw::core {

using blegw::observability::IntField;
using blegw::observability::StringField;

GatewayOptions GatewayOptions::FromConfig(const blegw::runtime::config::RuntimeConfig& config) {
  const auto& gateway = config.gateway();

  GatewayOptions options;
  for (const auto id : gateway.manufacturer_ids()) {
    options.allow_list.push_back(static_cast<std::uint16_t>(id));
  }
  options.rate_limit_interval_sec   = gateway.rate_limit_interval_sec();
  options.max_tracked_devices       = gateway.max_tracked_devices();
  options.cleanup_interval          = std::chrono::seconds(gateway.cleanup_interval_sec());
  options.delivery.endpoint_url     = gateway.endpoint_url();
  options.delivery.watchdog_timeout = std::chrono::milliseconds(gateway.delivery_timeout_ms());
  options.delivery.http_timeout     = std::chrono::seconds(gateway.http_timeout_sec());
  return options;
}

Gateway::Gateway(GatewayOptions options, scanner::AdvertisementSource& source, transport::HttpTransport& transport,
                 runtime::TimerService& timers, identity::IdentityProvider& identity_provider, util::UnixClock now,
                 delivery::NonceSource nonce)
    : options_(std::move(options)),
      source_(source),
      timers_(timers),
      identity_provider_(identity_provider),
      now_(std::move(now)),
      store_(options_.rate_limit_interval_sec, options_.max_tracked_devices),
      backoff_(backoff_state_),
      slot_(delivery_state_, backoff_, identity_, timers, transport, options_.delivery, now_, std::move(nonce)) {
  slot_.SetOutcomeObserver([this](delivery::DeliveryOutcome outcome) { OnDeliveryOutcome(outcome); });
}

void Gateway::Start() {
  if (started_) return;
  started_ = true;

  BLEGW_LOG_DEBUG("BLE gateway starting");

  identity_provider_.Resolve([this](std::optional<std::string> address) { OnIdentity(std::move(address)); });

  if (!source_.IsRunning()) {
    source_.Start(scanner::ScanOptions{});
  }
  source_.Subscribe([this](const model::Advertisement& advertisement) { OnAdvertisement(advertisement); });

  timers_.ScheduleRepeating(options_.cleanup_interval, [this] { RunCleanup(); });

  BLEGW_LOG_INFO("BLE gateway ready",
                 {StringField("endpoint", options_.delivery.endpoint_url), IntField("allow_list", static_cast<std::int64_t>(options_.allow_list.size())),
                  IntField("rate_limit_sec", options_.rate_limit_interval_sec)});
}

void Gateway::OnIdentity(std::optional<std::string> address) {
  if (!address) {
    BLEGW_LOG_WARN("Gateway address unresolved, using sentinel", {StringField("gw_mac", identity_.gateway_address)});
    return;
  }
  identity_.gateway_address = filter::NormalizeAddress(*address);
  identity_.resolved        = true;
  BLEGW_LOG_INFO("Gateway address resolved", {StringField("gw_mac", identity_.gateway_address)});
}

void Gateway::OnAdvertisement(const model::Advertisement& advertisement) {
  ++counters_.received;

  if (filter::IsMalformed(advertisement)) {
    Count(counters_.malformed, "malformed");
    const util::MalformedAdvertisement error(advertisement.address.empty() ? "Advertisement without address" : "Advertisement without payload");
    BLEGW_LOG_DEBUG(error.what(), {StringField("address", advertisement.address),
                                   IntField("payload_len", static_cast<std::int64_t>(advertisement.payload.size()))});
    return;
  }

  const auto payload_hex = util::ToUpperHex(advertisement.payload);
  if (!filter::QualifiesHex(payload_hex, options_.allow_list)) {
    Count(counters_.filtered, "filtered");
    return;
  }

  const auto address = filter::NormalizeAddress(advertisement.address);
  const auto now     = now_();
  if (!store_.ShouldSend(address, now)) {
    Count(counters_.rate_limited, "rate_limited");
    return;
  }

  // recorded before the send completes; failed sends still count
  store_.Record(address, now);

  BLEGW_LOG_DEBUG("Forwarding advertisement", {StringField("address", address), IntField("rssi", advertisement.rssi),
                                               IntField("len", static_cast<std::int64_t>(advertisement.payload.size()))});

  switch (slot_.TrySend(address, advertisement.rssi, payload_hex)) {
    case delivery::Admission::kAccepted:
      Count(counters_.accepted, "accepted");
      break;
    case delivery::Admission::kBusy:
      Count(counters_.slot_busy, "slot_busy");
      break;
    case delivery::Admission::kCoolingDown:
      Count(counters_.cooldown, "cooldown");
      break;
  }
}

std::size_t Gateway::RunCleanup() {
  const auto removed = store_.Cleanup(now_());
  counters_.evicted += removed;
  observability::Metrics::Instance().SetTrackedDevices(store_.size());

  if (removed > 0) {
    BLEGW_LOG_DEBUG("Cleaned up old entries", {IntField("removed", static_cast<std::int64_t>(removed)),
                                               IntField("tracked", static_cast<std::int64_t>(store_.size()))});
  }
  return removed;
}

GatewaySnapshot Gateway::Snapshot() const {
  GatewaySnapshot snapshot;
  snapshot.delivery        = delivery_state_;
  snapshot.backoff         = backoff_state_;
  snapshot.identity        = identity_;
  snapshot.in_cooldown     = backoff_.IsInCooldown(now_());
  snapshot.tracked_devices = store_.size();
  snapshot.counters        = counters_;
  return snapshot;
}

void Gateway::OnDeliveryOutcome(delivery::DeliveryOutcome outcome) {
  switch (outcome) {
    case delivery::DeliveryOutcome::kSuccess:
      ++counters_.delivered;
      break;
    case delivery::DeliveryOutcome::kWatchdogTimeout:
      ++counters_.watchdog_expired;
      ++counters_.failed;
      break;
    default:
      ++counters_.failed;
      break;
  }
}

void Gateway::Count(std::uint64_t& counter, const char* outcome) {
  ++counter;
  observability::Metrics::Instance().RecordAdvertisement(outcome);
}

} // namespace blegw::core
