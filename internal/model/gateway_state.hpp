#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/runtime/timer_service.hpp"

namespace blegw::model {

inline constexpr const char* kUnresolvedGatewayAddress = "00:00:00:00:00:00";

/*
  Process-wide delivery gate. Owned by the gateway, mutated only by the
  delivery slot on the event loop thread.

  generation counts accepted sends so a completion or watchdog that belongs
  to an earlier send can be recognised and ignored.
*/
struct DeliveryState {
  bool                               in_flight = false;
  std::optional<runtime::TimerHandle> watchdog;
  std::string                        target_address;
  std::uint64_t                      generation = 0;
};

struct BackoffState {
  std::uint32_t consecutive_failures = 0;
  std::int64_t  cooldown_until       = 0;
};

struct GatewayIdentity {
  std::string gateway_address{kUnresolvedGatewayAddress};
  bool        resolved = false;
};

enum class DeliveryPhase : std::uint8_t {
  kIdle    = 0,
  kSending = 1,
};

inline DeliveryPhase PhaseOf(const DeliveryState& state) {
  return state.in_flight ? DeliveryPhase::kSending : DeliveryPhase::kIdle;
}

} // namespace blegw::model
