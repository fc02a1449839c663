#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "executor.hpp"
#include "timer_service.hpp"

namespace blegw::runtime {

/*
  Single dispatch thread for every gateway callback.

  Posted tasks and due timers run one at a time, to completion, on the loop
  thread. Posted tasks run in submission order. Tasks posted before Start are
  kept and run once the loop starts; tasks posted after Stop are dropped.
*/
class EventLoop final : public TimerService {
 public:
  EventLoop() = default;
  ~EventLoop() override;

  EventLoop(const EventLoop&)            = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  void Start();
  void Stop();

  void Post(Task task);

  // Runs fn on the loop thread and hands back its result. Must not be
  // waited on from the loop thread itself.
  template <typename Fn>
  auto Invoke(Fn fn) -> std::future<decltype(fn())> {
    using Result = decltype(fn());
    auto task    = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    auto future  = task->get_future();
    Post([task] { (*task)(); });
    return future;
  }

  Executor AsExecutor();

  TimerHandle ScheduleOnce(std::chrono::milliseconds delay, TimerCallback callback) override;
  TimerHandle ScheduleRepeating(std::chrono::milliseconds period, TimerCallback callback) override;
  void        Cancel(TimerHandle handle) override;

  bool IsLoopThread() const;

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct Timer {
    TimerCallback             callback;
    std::chrono::milliseconds period{0};
    SteadyClock::time_point   deadline;
  };

  TimerHandle Schedule(std::chrono::milliseconds delay, std::chrono::milliseconds period, TimerCallback callback);
  void        Run();

  // Requires mutex_. Pops the next runnable task, if any.
  bool NextTask(Task& task);

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<Task>        ready_;

  std::unordered_map<TimerHandle, Timer>             timers_;
  std::multimap<SteadyClock::time_point, TimerHandle> deadlines_;
  TimerHandle                                        next_handle_ = 1;

  bool        running_  = false;
  bool        stopping_ = false;
  std::thread thread_;
};

} // namespace blegw::runtime
