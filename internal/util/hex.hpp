#pragma once

#include <string>
#include <string_view>

namespace blegw::util {

// Uppercase hex, two digits per byte, no separators.
std::string ToUpperHex(std::string_view bytes);

// Accepts either case. Throws std::invalid_argument on odd length or a
// non-hex character.
std::string FromHex(std::string_view hex);

} // namespace blegw::util
