#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/advertisement.hpp"

namespace blegw::filter {

using ManufacturerAllowList = std::vector<std::uint16_t>;

/*
  Stateless admission checks for scan results.

  Manufacturer matching is a substring scan over the uppercase hex payload
  for "FF" followed by the little-endian id. It does not walk the AD
  structures, so an 0xFF byte elsewhere in the payload can produce a match.
*/

// Empty address or empty payload.
bool IsMalformed(const model::Advertisement& advertisement);

bool Qualifies(const model::Advertisement& advertisement, const ManufacturerAllowList& allow_list);

// Same check on an already hex-encoded payload.
bool QualifiesHex(std::string_view payload_hex, const ManufacturerAllowList& allow_list);

// "FF" + low byte + high byte, uppercase.
std::string ManufacturerMarker(std::uint16_t manufacturer_id);

// Upper-cases the address and, when it has no ':' separators, inserts one
// after every two characters.
std::string NormalizeAddress(std::string_view address);

} // namespace blegw::filter
