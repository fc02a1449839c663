#include "internal/delivery/delivery_slot.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "test_fakes.hpp"

namespace {

using blegw::delivery::Admission;
using blegw::delivery::DeliveryOutcome;
using blegw::testing::FakeTransport;
using blegw::testing::ManualTimer;

constexpr char kEndpoint[] = "http://collector.local/ble-gw";

/*
  A slot with its shared state, fakes and a hand-driven unix clock.
*/
struct SlotHarness {
  blegw::model::DeliveryState        state;
  blegw::model::BackoffState         backoff_state;
  blegw::model::GatewayIdentity      identity;
  blegw::delivery::BackoffController backoff{backoff_state};
  ManualTimer                        timers;
  FakeTransport                      transport;
  std::int64_t                       now = 1'700'000'000;
  std::vector<DeliveryOutcome>       outcomes;

  blegw::delivery::DeliverySlot slot{state,
                                     backoff,
                                     identity,
                                     timers,
                                     transport,
                                     blegw::delivery::DeliveryOptions{kEndpoint, std::chrono::milliseconds(10000), std::chrono::seconds(5)},
                                     [this] { return now; },
                                     [] { return 4242; }};

  SlotHarness() {
    slot.SetOutcomeObserver([this](DeliveryOutcome outcome) { outcomes.push_back(outcome); });
  }
};

void TestAcceptedSendBuildsRequest() {
  SlotHarness h;
  h.identity.gateway_address = "AA:BB:CC:DD:EE:FF";

  assert(h.slot.TrySend("11:22:33:44:55:66", -60, "02011A") == Admission::kAccepted);
  assert(h.state.in_flight);
  assert(h.state.watchdog.has_value());
  assert(h.state.target_address == "11:22:33:44:55:66");
  assert(h.timers.armed() == 1);

  assert(h.transport.calls.size() == 1);
  const auto& request = h.transport.calls[0].request;
  assert(request.url == kEndpoint);
  assert(request.content_type == "application/json");
  assert(request.timeout == std::chrono::seconds(5));
  assert(request.body ==
         R"({"data":{"coordinates":"","timestamp":1700000000,"nonce":4242,"gw_mac":"AA:BB:CC:DD:EE:FF",)"
         R"("tags":{"11:22:33:44:55:66":{"rssi":-60,"timestamp":1700000000,"data":"02011A"}}}})");
}

void TestSecondSendWhileInFlightIsRejected() {
  SlotHarness h;
  assert(h.slot.TrySend("11:22:33:44:55:66", -60, "02011A") == Admission::kAccepted);
  assert(h.slot.TrySend("22:33:44:55:66:77", -61, "02011B") == Admission::kBusy);
  assert(h.transport.calls.size() == 1);
  assert(h.state.target_address == "11:22:33:44:55:66");
  assert(h.outcomes.empty());
}

void TestSuccessReleasesSlotAndResetsBackoff() {
  SlotHarness h;
  h.backoff_state.consecutive_failures = 2;

  h.slot.TrySend("11:22:33:44:55:66", -60, "02011A");
  h.transport.Respond(0, 200, "ok");

  assert(!h.state.in_flight);
  assert(!h.state.watchdog.has_value());
  assert(h.timers.armed() == 0);
  assert(h.backoff_state.consecutive_failures == 0);
  assert(h.outcomes.size() == 1 && h.outcomes[0] == DeliveryOutcome::kSuccess);

  assert(h.slot.TrySend("22:33:44:55:66:77", -61, "02011B") == Admission::kAccepted);
}

void TestFailedCompletionsCountAsFailures() {
  SlotHarness h;

  h.slot.TrySend("11:22:33:44:55:66", -60, "02011A");
  h.transport.Respond(0, 500, "");
  assert(!h.state.in_flight);

  h.slot.TrySend("11:22:33:44:55:66", -60, "02011A");
  h.transport.Respond(1, 201, "created");

  h.slot.TrySend("11:22:33:44:55:66", -60, "02011A");
  h.transport.FailWith(2, 111);

  h.slot.TrySend("11:22:33:44:55:66", -60, "02011A");
  h.transport.RespondWithoutResponse(3);

  assert(h.backoff_state.consecutive_failures == 4);
  assert(h.outcomes.size() == 4);
  assert(h.outcomes[0] == DeliveryOutcome::kApplicationError);
  assert(h.outcomes[1] == DeliveryOutcome::kApplicationError);
  assert(h.outcomes[2] == DeliveryOutcome::kTransportError);
  assert(h.outcomes[3] == DeliveryOutcome::kNoResponse);
  assert(h.timers.armed() == 0);
}

void TestCooldownRejectsUntilItExpires() {
  SlotHarness h;
  for (int i = 0; i < 4; ++i) {
    assert(h.slot.TrySend("11:22:33:44:55:66", -60, "02011A") == Admission::kAccepted);
    h.transport.FailWith(static_cast<std::size_t>(i), 111);
  }
  assert(h.backoff_state.cooldown_until == h.now + 20);

  assert(h.slot.TrySend("11:22:33:44:55:66", -60, "02011A") == Admission::kCoolingDown);
  assert(h.transport.calls.size() == 4);

  h.now += 19;
  assert(h.slot.TrySend("11:22:33:44:55:66", -60, "02011A") == Admission::kCoolingDown);

  h.now += 1;
  assert(h.slot.TrySend("11:22:33:44:55:66", -60, "02011A") == Admission::kAccepted);
}

void TestWatchdogReleasesStuckSendOnce() {
  SlotHarness h;
  h.slot.TrySend("11:22:33:44:55:66", -60, "02011A");

  h.timers.Advance(std::chrono::milliseconds(9999));
  assert(h.state.in_flight);

  h.timers.Advance(std::chrono::milliseconds(1));
  assert(!h.state.in_flight);
  assert(!h.state.watchdog.has_value());
  assert(h.backoff_state.consecutive_failures == 1);
  assert(h.outcomes.size() == 1 && h.outcomes[0] == DeliveryOutcome::kWatchdogTimeout);

  h.timers.Advance(std::chrono::milliseconds(60000));
  assert(h.outcomes.size() == 1);
  assert(h.backoff_state.consecutive_failures == 1);
}

void TestLateCompletionAfterWatchdogIsIgnored() {
  SlotHarness h;
  h.slot.TrySend("11:22:33:44:55:66", -60, "02011A");
  h.timers.Advance(std::chrono::milliseconds(10000));
  assert(h.outcomes.size() == 1);

  // a newer send is in flight when the stale completion arrives
  assert(h.slot.TrySend("22:33:44:55:66:77", -61, "02011B") == Admission::kAccepted);
  h.transport.Respond(0, 200, "late");

  assert(h.state.in_flight);
  assert(h.state.target_address == "22:33:44:55:66:77");
  assert(h.backoff_state.consecutive_failures == 1);
  assert(h.outcomes.size() == 1);

  h.transport.Respond(1, 200, "ok");
  assert(!h.state.in_flight);
  assert(h.backoff_state.consecutive_failures == 0);
  assert(h.outcomes.size() == 2 && h.outcomes[1] == DeliveryOutcome::kSuccess);
}

void TestLateCompletionOnIdleSlotIsIgnored() {
  SlotHarness h;
  h.slot.TrySend("11:22:33:44:55:66", -60, "02011A");
  h.timers.Advance(std::chrono::milliseconds(10000));

  h.transport.FailWith(0, 111);
  assert(!h.state.in_flight);
  assert(h.backoff_state.consecutive_failures == 1);
  assert(h.outcomes.size() == 1);
}

void TestOutcomeNames() {
  assert(std::string(blegw::delivery::OutcomeName(DeliveryOutcome::kSuccess)) == "delivered");
  assert(std::string(blegw::delivery::OutcomeName(DeliveryOutcome::kWatchdogTimeout)) == "watchdog_timeout");
}

} // namespace

int main() {
  TestAcceptedSendBuildsRequest();
  TestSecondSendWhileInFlightIsRejected();
  TestSuccessReleasesSlotAndResetsBackoff();
  TestFailedCompletionsCountAsFailures();
  TestCooldownRejectsUntilItExpires();
  TestWatchdogReleasesStuckSendOnce();
  TestLateCompletionAfterWatchdogIsIgnored();
  TestLateCompletionOnIdleSlotIsIgnored();
  TestOutcomeNames();

  std::cout << "ble_gateway_unit_delivery_slot: pass\n";
  return 0;
}
