#pragma once

#include <cstdint>
#include <string>

namespace blegw::model {

/*
  One scan result as delivered by the scanner.

  payload holds the raw advertising data bytes.
*/
struct Advertisement {
  std::string  address;
  std::int32_t rssi = 0;
  std::string  payload;
};

} // namespace blegw::model
