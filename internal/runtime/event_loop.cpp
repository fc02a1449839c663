#include "event_loop.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace blegw::runtime {

EventLoop::~EventLoop() {
  Stop();
}

void EventLoop::Start() {
  std::lock_guard lock(mutex_);
  if (running_ || stopping_) return;
  running_ = true;
  thread_  = std::thread(&EventLoop::Run, this);
}

void EventLoop::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable() && std::this_thread::get_id() != thread_.get_id()) {
    thread_.join();
  }
}

void EventLoop::Post(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) return;
    ready_.push_back(std::move(task));
  }
  cv_.notify_one();
}

Executor EventLoop::AsExecutor() {
  return [this](Task task) { Post(std::move(task)); };
}

TimerHandle EventLoop::ScheduleOnce(std::chrono::milliseconds delay, TimerCallback callback) {
  return Schedule(delay, std::chrono::milliseconds(0), std::move(callback));
}

TimerHandle EventLoop::ScheduleRepeating(std::chrono::milliseconds period, TimerCallback callback) {
  return Schedule(period, period, std::move(callback));
}

TimerHandle EventLoop::Schedule(std::chrono::milliseconds delay, std::chrono::milliseconds period, TimerCallback callback) {
  TimerHandle handle;
  {
    std::lock_guard lock(mutex_);
    handle = next_handle_++;

    Timer timer;
    timer.callback = std::move(callback);
    timer.period   = period;
    timer.deadline = SteadyClock::now() + delay;

    deadlines_.emplace(timer.deadline, handle);
    timers_.emplace(handle, std::move(timer));
  }
  cv_.notify_one();
  return handle;
}

void EventLoop::Cancel(TimerHandle handle) {
  std::lock_guard lock(mutex_);

  auto it = timers_.find(handle);
  if (it == timers_.end()) return;

  auto range = deadlines_.equal_range(it->second.deadline);
  for (auto d = range.first; d != range.second; ++d) {
    if (d->second == handle) {
      deadlines_.erase(d);
      break;
    }
  }
  timers_.erase(it);
}

bool EventLoop::IsLoopThread() const {
  return std::this_thread::get_id() == thread_.get_id();
}

bool EventLoop::NextTask(Task& task) {
  if (!ready_.empty()) {
    task = std::move(ready_.front());
    ready_.pop_front();
    return true;
  }

  if (deadlines_.empty() || deadlines_.begin()->first > SteadyClock::now()) {
    return false;
  }

  const auto handle = deadlines_.begin()->second;
  deadlines_.erase(deadlines_.begin());

  auto it = timers_.find(handle);
  if (it == timers_.end()) return false;

  if (it->second.period.count() > 0) {
    it->second.deadline += it->second.period;
    deadlines_.emplace(it->second.deadline, handle);
    task = it->second.callback;
  } else {
    task = std::move(it->second.callback);
    timers_.erase(it);
  }
  return true;
}

void EventLoop::Run() {
  while (true) {
    Task task;
    {
      std::unique_lock lock(mutex_);
      while (!stopping_ && !NextTask(task)) {
        if (deadlines_.empty()) {
          cv_.wait(lock);
        } else {
          cv_.wait_until(lock, deadlines_.begin()->first);
        }
      }
      if (stopping_) break;
    }

    try {
      task();
    } catch (const std::exception& e) {
      BLEGW_LOG_ERROR("Event loop task failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace blegw::runtime
