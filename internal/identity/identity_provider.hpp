#pragma once

#include <functional>
#include <optional>
#include <string>

namespace blegw::identity {

// nullopt when the address could not be determined.
using IdentityCallback = std::function<void(std::optional<std::string> address)>;

/*
  Looks up the gateway's own hardware address. Resolve returns immediately;
  the callback runs later on the gateway event loop.
*/
class IdentityProvider {
 public:
  virtual ~IdentityProvider() = default;

  virtual void Resolve(IdentityCallback callback) = 0;
};

} // namespace blegw::identity
