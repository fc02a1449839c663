#include "backoff_controller.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace blegw::delivery {

using blegw::observability::IntField;

BackoffController::BackoffController(model::BackoffState& state) : state_(state) {
}

std::int64_t BackoffController::OnFailure(std::int64_t now) {
  ++state_.consecutive_failures;
  if (state_.consecutive_failures <= kToleratedFailures) {
    return 0;
  }

  const std::int64_t backoff_sec = std::min<std::int64_t>(kMaxBackoffSec, state_.consecutive_failures * kBackoffStepSec);
  state_.cooldown_until          = now + backoff_sec;

  BLEGW_LOG_WARN("Delivery backoff engaged",
                 {IntField("consecutive_failures", state_.consecutive_failures), IntField("backoff_sec", backoff_sec)});
  return backoff_sec;
}

void BackoffController::OnSuccess() {
  if (state_.consecutive_failures > kToleratedFailures) {
    BLEGW_LOG_INFO("Delivery recovered", {IntField("after_failures", state_.consecutive_failures)});
  }
  state_.consecutive_failures = 0;
  state_.cooldown_until       = 0;
}

bool BackoffController::IsInCooldown(std::int64_t now) const {
  return state_.cooldown_until > now;
}

} // namespace blegw::delivery
