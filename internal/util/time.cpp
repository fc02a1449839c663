#include "time.hpp"

namespace blegw::util {

TimePoint Now() {
  return Clock::now();
}

std::int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::int64_t UnixNow() {
  return ToUnixSeconds(Now());
}

} // namespace blegw::util
