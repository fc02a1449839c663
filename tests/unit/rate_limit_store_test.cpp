#include "internal/dedup/rate_limit_store.hpp"

#include <cassert>
#include <cstdio>
#include <iostream>
#include <string>

namespace {

std::string DeviceAddress(int i) {
  char buf[18];
  std::snprintf(buf, sizeof(buf), "AA:BB:CC:DD:%02X:%02X", (i >> 8) & 0xFF, i & 0xFF);
  return buf;
}

void TestUnknownDeviceIsEligible() {
  blegw::dedup::RateLimitStore store(5, 50);
  assert(store.ShouldSend("AA:BB:CC:DD:EE:FF", 0));
  assert(store.ShouldSend("AA:BB:CC:DD:EE:FF", 1'700'000'000));
}

void TestRateLimitWindow() {
  blegw::dedup::RateLimitStore store(5, 50);
  const std::string            device = "AA:BB:CC:DD:EE:FF";

  assert(store.ShouldSend(device, 0));
  store.Record(device, 0);

  assert(!store.ShouldSend(device, 3));
  assert(!store.ShouldSend(device, 4));
  assert(store.ShouldSend(device, 5));
  assert(store.ShouldSend(device, 6));
  store.Record(device, 6);
  assert(!store.ShouldSend(device, 10));
}

void TestDevicesAreTrackedIndependently() {
  blegw::dedup::RateLimitStore store(5, 50);
  store.Record("AA:AA:AA:AA:AA:AA", 100);
  assert(!store.ShouldSend("AA:AA:AA:AA:AA:AA", 101));
  assert(store.ShouldSend("BB:BB:BB:BB:BB:BB", 101));
}

void TestRecordDoesNotEnforceCapacity() {
  blegw::dedup::RateLimitStore store(5, 2);
  store.Record(DeviceAddress(1), 1);
  store.Record(DeviceAddress(2), 2);
  store.Record(DeviceAddress(3), 3);
  assert(store.size() == 3);
}

void TestCleanupEvictsOldestDownToCapacity() {
  blegw::dedup::RateLimitStore store(5, 50);
  for (int i = 0; i < 60; ++i) {
    store.Record(DeviceAddress(i), 1000 + i);
  }
  assert(store.size() == 60);

  const auto removed = store.Cleanup(2000);
  assert(removed == 10);
  assert(store.size() == 50);

  for (int i = 0; i < 10; ++i) {
    assert(!store.Contains(DeviceAddress(i)));
  }
  for (int i = 10; i < 60; ++i) {
    assert(store.Contains(DeviceAddress(i)));
  }
}

void TestCleanupUnderCapacityIsNoOp() {
  blegw::dedup::RateLimitStore store(5, 50);
  for (int i = 0; i < 20; ++i) {
    store.Record(DeviceAddress(i), 1000);
  }
  assert(store.Cleanup(5000) == 0);
  assert(store.size() == 20);
}

void TestCleanupBreaksTiesByDiscoveryOrder() {
  blegw::dedup::RateLimitStore store(5, 2);
  store.Record("CC:CC:CC:CC:CC:CC", 10);
  store.Record("AA:AA:AA:AA:AA:AA", 10);
  store.Record("BB:BB:BB:BB:BB:BB", 10);

  assert(store.Cleanup(20) == 1);
  assert(!store.Contains("CC:CC:CC:CC:CC:CC"));
  assert(store.Contains("AA:AA:AA:AA:AA:AA"));
  assert(store.Contains("BB:BB:BB:BB:BB:BB"));
}

} // namespace

int main() {
  TestUnknownDeviceIsEligible();
  TestRateLimitWindow();
  TestDevicesAreTrackedIndependently();
  TestRecordDoesNotEnforceCapacity();
  TestCleanupEvictsOldestDownToCapacity();
  TestCleanupUnderCapacityIsNoOp();
  TestCleanupBreaksTiesByDiscoveryOrder();

  std::cout << "ble_gateway_unit_rate_limit_store: pass\n";
  return 0;
}
