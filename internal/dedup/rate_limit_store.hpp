#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace blegw::dedup {

/*
  Last-forwarded timestamp per device address.

  The capacity bound is enforced by Cleanup only, so between cleanup passes
  the store may hold more than max_entries devices. Not thread-safe: every
  call happens on the event loop thread.
*/
class RateLimitStore {
 public:
  RateLimitStore(std::int64_t rate_limit_interval_sec, std::size_t max_entries);

  // Unknown addresses are always eligible.
  bool ShouldSend(const std::string& address, std::int64_t now) const;

  void Record(const std::string& address, std::int64_t now);

  // Drops the oldest entries until max_entries remain. Returns how many
  // were removed.
  std::size_t Cleanup(std::int64_t now);

  std::size_t size() const {
    return entries_.size();
  }

  bool Contains(const std::string& address) const {
    return entries_.count(address) != 0;
  }

  std::size_t max_entries() const {
    return max_entries_;
  }

 private:
  struct Entry {
    std::int64_t  last_sent_at = 0;
    std::uint64_t discovered   = 0;
  };

  std::int64_t  rate_limit_interval_sec_;
  std::size_t   max_entries_;
  std::uint64_t next_discovery_ = 0;

  std::unordered_map<std::string, Entry> entries_;
};

} // namespace blegw::dedup
