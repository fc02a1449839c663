#include "telemetry_encoder.hpp"

#include <google/protobuf/util/json_util.h>

#include <limits>
#include <random>
#include <stdexcept>

#include "blegw/v1/telemetry.pb.h"

namespace blegw::delivery {

std::int32_t RandomNonce() {
  static thread_local std::mt19937                                rng{std::random_device{}()};
  static thread_local std::uniform_int_distribution<std::int32_t> dist(0, std::numeric_limits<std::int32_t>::max() - 1);
  return dist(rng);
}

std::string EncodeTelemetry(const TelemetryRecord& record) {
  blegw::v1::TelemetryEnvelope envelope;

  auto* data = envelope.mutable_data();
  data->set_coordinates("");
  data->set_timestamp(static_cast<std::uint32_t>(record.timestamp));
  data->set_nonce(record.nonce);
  data->set_gw_mac(record.gateway_address);

  auto& tag = (*data->mutable_tags())[record.device_address];
  tag.set_rssi(record.rssi);
  tag.set_timestamp(static_cast<std::uint32_t>(record.timestamp));
  tag.set_data(record.payload_hex);

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(envelope, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode telemetry: " + std::string(status.message()));
  }
  return json;
}

} // namespace blegw::delivery
