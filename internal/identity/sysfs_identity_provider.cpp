#include "sysfs_identity_provider.hpp"

#include <fstream>
#include <utility>

#include "internal/observability/logging.hpp"

namespace blegw::identity {

SysfsIdentityProvider::SysfsIdentityProvider(runtime::Executor executor, std::string adapter, std::string override_address,
                                             std::filesystem::path sysfs_root)
    : executor_(std::move(executor)),
      adapter_(std::move(adapter)),
      override_address_(std::move(override_address)),
      sysfs_root_(std::move(sysfs_root)) {
}

void SysfsIdentityProvider::Resolve(IdentityCallback callback) {
  executor_([this, callback = std::move(callback)] { callback(ReadAddress()); });
}

std::optional<std::string> SysfsIdentityProvider::ReadAddress() const {
  if (!override_address_.empty()) {
    return override_address_;
  }

  const auto    path = sysfs_root_ / adapter_ / "address";
  std::ifstream in(path);
  std::string   address;
  if (!in || !std::getline(in, address)) {
    BLEGW_LOG_WARN("Cannot read adapter address", {observability::StringField("path", path.string())});
    return std::nullopt;
  }

  while (!address.empty() && (address.back() == '\n' || address.back() == '\r' || address.back() == ' ')) {
    address.pop_back();
  }
  if (address.empty()) {
    return std::nullopt;
  }
  return address;
}

} // namespace blegw::identity
