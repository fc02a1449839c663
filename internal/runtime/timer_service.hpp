#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace blegw::runtime {

using TimerHandle   = std::uint64_t;
using TimerCallback = std::function<void()>;

/*
  One-shot and repeating callbacks.

  Callbacks run on the dispatch thread of the implementation, one at a
  time. Cancelling an unknown or already fired handle is a no-op.
*/
class TimerService {
 public:
  virtual ~TimerService() = default;

  virtual TimerHandle ScheduleOnce(std::chrono::milliseconds delay, TimerCallback callback)       = 0;
  virtual TimerHandle ScheduleRepeating(std::chrono::milliseconds period, TimerCallback callback) = 0;

  virtual void Cancel(TimerHandle handle) = 0;
};

} // namespace blegw::runtime
