#include "advertisement_filter.hpp"

#include <cctype>

#include "internal/util/hex.hpp"

namespace blegw::filter {

namespace {
constexpr char kManufacturerDataType[] = "FF";
}

bool IsMalformed(const model::Advertisement& advertisement) {
  return advertisement.address.empty() || advertisement.payload.empty();
}

bool Qualifies(const model::Advertisement& advertisement, const ManufacturerAllowList& allow_list) {
  if (allow_list.empty()) {
    return true;
  }
  return QualifiesHex(util::ToUpperHex(advertisement.payload), allow_list);
}

bool QualifiesHex(std::string_view payload_hex, const ManufacturerAllowList& allow_list) {
  if (allow_list.empty()) {
    return true;
  }

  for (const auto id : allow_list) {
    if (payload_hex.find(ManufacturerMarker(id)) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

std::string ManufacturerMarker(std::uint16_t manufacturer_id) {
  const char le[] = {static_cast<char>(manufacturer_id & 0xFF), static_cast<char>((manufacturer_id >> 8) & 0xFF)};
  return kManufacturerDataType + util::ToUpperHex(std::string_view(le, sizeof(le)));
}

std::string NormalizeAddress(std::string_view address) {
  std::string upper;
  upper.reserve(address.size());
  for (const char c : address) {
    upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }

  if (upper.find(':') != std::string::npos) {
    return upper;
  }

  std::string grouped;
  grouped.reserve(upper.size() + upper.size() / 2);
  for (std::size_t i = 0; i < upper.size(); i += 2) {
    if (i > 0) grouped.push_back(':');
    grouped.append(upper, i, 2);
  }
  return grouped;
}

} // namespace blegw::filter
