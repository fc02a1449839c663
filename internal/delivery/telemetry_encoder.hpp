#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace blegw::delivery {

/*
  Everything that goes into one collector POST. One device per request.
*/
struct TelemetryRecord {
  std::string  gateway_address;
  std::string  device_address;
  std::int32_t rssi      = 0;
  std::int64_t timestamp = 0;
  std::int32_t nonce     = 0;
  std::string  payload_hex;
};

using NonceSource = std::function<std::int32_t()>;

// Uniform in [0, 2147483647).
std::int32_t RandomNonce();

// {"data":{"coordinates":"","timestamp":..,"nonce":..,"gw_mac":"..",
//  "tags":{"<device>":{"rssi":..,"timestamp":..,"data":".."}}}}
// Throws std::runtime_error if the message cannot be printed.
std::string EncodeTelemetry(const TelemetryRecord& record);

} // namespace blegw::delivery
