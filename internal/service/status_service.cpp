#include "status_service.hpp"

#include <future>
#include <stdexcept>

#include "internal/runtime/event_loop.hpp"
#include "internal/scanner/grpc_advertisement_source.hpp"

namespace blegw::service {

using namespace blegw::v1;

StatusResponse ToProto(const core::GatewaySnapshot& snapshot) {
  StatusResponse resp;
  resp.set_gateway_address(snapshot.identity.gateway_address);
  resp.set_identity_resolved(snapshot.identity.resolved);
  resp.set_tracked_devices(snapshot.tracked_devices);

  auto* delivery = resp.mutable_delivery();
  delivery->set_in_flight(snapshot.delivery.in_flight);
  delivery->set_watchdog_armed(snapshot.delivery.watchdog.has_value());
  delivery->set_target_address(snapshot.delivery.target_address);
  delivery->set_generation(snapshot.delivery.generation);

  auto* backoff = resp.mutable_backoff();
  backoff->set_consecutive_failures(snapshot.backoff.consecutive_failures);
  backoff->set_cooldown_until(snapshot.backoff.cooldown_until);
  backoff->set_in_cooldown(snapshot.in_cooldown);

  const auto& c        = snapshot.counters;
  auto*       counters = resp.mutable_counters();
  counters->set_received(c.received);
  counters->set_malformed(c.malformed);
  counters->set_filtered(c.filtered);
  counters->set_rate_limited(c.rate_limited);
  counters->set_slot_busy(c.slot_busy);
  counters->set_cooldown(c.cooldown);
  counters->set_accepted(c.accepted);
  counters->set_delivered(c.delivered);
  counters->set_failed(c.failed);
  counters->set_watchdog_expired(c.watchdog_expired);
  counters->set_evicted(c.evicted);
  return resp;
}

StatusService::StatusService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatusResponse StatusService::Status(const StatusRequest&) {
  auto gateway  = ctx_.gateway;
  auto snapshot = ctx_.loop->Invoke([gateway] { return gateway->Snapshot(); });

  if (snapshot.wait_for(ctx_.status_timeout) != std::future_status::ready) {
    throw std::runtime_error("Event loop did not answer the status request");
  }

  auto resp = ToProto(snapshot.get());
  resp.set_endpoint_url(gateway->options().delivery.endpoint_url);
  if (ctx_.source) {
    resp.set_scanner_running(ctx_.source->IsRunning());
    resp.set_active_scan(ctx_.source->options().active);
  }
  return resp;
}

} // namespace blegw::service
