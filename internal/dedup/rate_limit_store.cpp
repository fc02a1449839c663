#include "rate_limit_store.hpp"

#include <algorithm>
#include <vector>

namespace blegw::dedup {

RateLimitStore::RateLimitStore(std::int64_t rate_limit_interval_sec, std::size_t max_entries)
    : rate_limit_interval_sec_(rate_limit_interval_sec), max_entries_(max_entries) {
}

bool RateLimitStore::ShouldSend(const std::string& address, std::int64_t now) const {
  auto it = entries_.find(address);
  if (it == entries_.end()) {
    return true;
  }
  return now - it->second.last_sent_at >= rate_limit_interval_sec_;
}

void RateLimitStore::Record(const std::string& address, std::int64_t now) {
  auto [it, inserted] = entries_.try_emplace(address);
  if (inserted) {
    it->second.discovered = next_discovery_++;
  }
  it->second.last_sent_at = now;
}

std::size_t RateLimitStore::Cleanup(std::int64_t now) {
  if (entries_.size() <= max_entries_) {
    return 0;
  }

  struct Aged {
    std::int64_t       age;
    std::uint64_t      discovered;
    const std::string* address;
  };

  std::vector<Aged> oldest;
  oldest.reserve(entries_.size());
  for (const auto& [address, entry] : entries_) {
    oldest.push_back({now - entry.last_sent_at, entry.discovered, &address});
  }

  // oldest first; equal ages fall back to discovery order
  std::sort(oldest.begin(), oldest.end(), [](const Aged& a, const Aged& b) {
    if (a.age != b.age) return a.age > b.age;
    return a.discovered < b.discovered;
  });

  const std::size_t to_remove = entries_.size() - max_entries_;

  std::vector<std::string> victims;
  victims.reserve(to_remove);
  for (std::size_t i = 0; i < to_remove; ++i) {
    victims.push_back(*oldest[i].address);
  }
  for (const auto& address : victims) {
    entries_.erase(address);
  }

  return to_remove;
}

} // namespace blegw::dedup
