#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace blegw::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace blegw::util;

  if (dynamic_cast<const InvalidConfig*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const MalformedAdvertisement*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace blegw::grpc
