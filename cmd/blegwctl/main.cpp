#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "blegw/v1.hpp"
#include "internal/util/hex.hpp"

using namespace blegw::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  blegwctl <addr> status\n"
            << "  blegwctl <addr> publish <device_address> <rssi> <payload_hex> [count] [interval_ms]\n";
}

static void PrintStatus(const StatusResponse& resp) {
  const auto& d = resp.delivery();
  const auto& b = resp.backoff();
  const auto& c = resp.counters();

  std::cout << "gw_mac=" << resp.gateway_address() << (resp.identity_resolved() ? "" : " (unresolved)") << "\n"
            << "endpoint=" << resp.endpoint_url() << "\n"
            << "scanner_running=" << resp.scanner_running() << " active_scan=" << resp.active_scan() << "\n"
            << "tracked_devices=" << resp.tracked_devices() << "\n"
            << "delivery in_flight=" << d.in_flight() << " watchdog_armed=" << d.watchdog_armed() << " target=" << d.target_address()
            << " generation=" << d.generation() << "\n"
            << "backoff consecutive_failures=" << b.consecutive_failures() << " cooldown_until=" << b.cooldown_until()
            << " in_cooldown=" << b.in_cooldown() << "\n"
            << "counters received=" << c.received() << " malformed=" << c.malformed() << " filtered=" << c.filtered()
            << " rate_limited=" << c.rate_limited() << " slot_busy=" << c.slot_busy() << " cooldown=" << c.cooldown()
            << " accepted=" << c.accepted() << " delivered=" << c.delivered() << " failed=" << c.failed()
            << " watchdog_expired=" << c.watchdog_expired() << " evicted=" << c.evicted() << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = AdvertisementIngest::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "status") {
    StatusRequest  req;
    StatusResponse resp;

    auto status = stub->Status(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintStatus(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "publish") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    Advertisement advertisement;
    std::uint64_t count       = 1;
    std::uint64_t interval_ms = 0;
    try {
      advertisement.set_address(argv[3]);
      advertisement.set_rssi(std::stoi(argv[4]));
      advertisement.set_payload(blegw::util::FromHex(argv[5]));
      if (argc >= 7) count = std::stoull(argv[6]);
      if (argc >= 8) interval_ms = std::stoull(argv[7]);
    } catch (const std::exception& e) {
      std::cerr << "invalid argument: " << e.what() << "\n";
      return 1;
    }

    PublishSummary summary;
    auto           writer = stub->Publish(&ctx, &summary);
    for (std::uint64_t i = 0; i < count; ++i) {
      if (!writer->Write(advertisement)) {
        std::cerr << "stream closed after " << i << " advertisements\n";
        break;
      }
      if (interval_ms > 0 && i + 1 < count) {
        std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
      }
    }
    writer->WritesDone();

    auto status = writer->Finish();
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "received=" << summary.received() << " accepted=" << summary.accepted() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
