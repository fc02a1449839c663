#pragma once

#include <cstdint>

#include "internal/model/gateway_state.hpp"

namespace blegw::delivery {

inline constexpr std::uint32_t kToleratedFailures = 3;
inline constexpr std::int64_t  kBackoffStepSec    = 5;
inline constexpr std::int64_t  kMaxBackoffSec     = 60;

/*
  Escalate-on-failure, reset-on-success policy over the shared BackoffState.

  The first kToleratedFailures consecutive failures never start a cooldown.
  After that every failure sets cooldown_until = now + min(60, failures * 5).
*/
class BackoffController {
 public:
  explicit BackoffController(model::BackoffState& state);

  // Returns the cooldown that was applied, in seconds, or 0.
  std::int64_t OnFailure(std::int64_t now);
  void         OnSuccess();

  bool IsInCooldown(std::int64_t now) const;

  std::uint32_t consecutive_failures() const {
    return state_.consecutive_failures;
  }

 private:
  model::BackoffState& state_;
};

} // namespace blegw::delivery
