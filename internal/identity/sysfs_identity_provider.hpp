#pragma once

#include <filesystem>
#include <string>

#include "internal/identity/identity_provider.hpp"
#include "internal/runtime/executor.hpp"

namespace blegw::identity {

/*
  Reads <sysfs_root>/<adapter>/address, e.g. /sys/class/bluetooth/hci0/address.
  A non-empty override short-circuits the lookup.
*/
class SysfsIdentityProvider final : public IdentityProvider {
 public:
  SysfsIdentityProvider(runtime::Executor executor, std::string adapter, std::string override_address = {},
                        std::filesystem::path sysfs_root = "/sys/class/bluetooth");

  void Resolve(IdentityCallback callback) override;

 private:
  std::optional<std::string> ReadAddress() const;

  runtime::Executor     executor_;
  std::string           adapter_;
  std::string           override_address_;
  std::filesystem::path sysfs_root_;
};

} // namespace blegw::identity
