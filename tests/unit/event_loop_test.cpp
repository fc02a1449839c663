#include "internal/runtime/event_loop.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using blegw::runtime::EventLoop;

void TestPostedTasksRunInOrder() {
  EventLoop loop;

  std::vector<int> order;
  for (int i = 0; i < 5; ++i) {
    loop.Post([&order, i] { order.push_back(i); });
  }
  loop.Start();

  auto done = loop.Invoke([&order] { return order.size(); });
  assert(done.wait_for(2s) == std::future_status::ready);
  assert(done.get() == 5);
  for (int i = 0; i < 5; ++i) {
    assert(order[static_cast<std::size_t>(i)] == i);
  }
  loop.Stop();
}

void TestInvokeRunsOnLoopThread() {
  EventLoop loop;
  loop.Start();

  auto on_loop = loop.Invoke([&loop] { return loop.IsLoopThread(); });
  assert(on_loop.wait_for(2s) == std::future_status::ready);
  assert(on_loop.get());
  assert(!loop.IsLoopThread());
  loop.Stop();
}

void TestOneShotTimerFiresOnce() {
  EventLoop loop;
  loop.Start();

  std::atomic<int>   fired{0};
  std::promise<void> first;
  const auto         start = std::chrono::steady_clock::now();
  loop.ScheduleOnce(30ms, [&] {
    if (fired.fetch_add(1) == 0) first.set_value();
  });

  assert(first.get_future().wait_for(2s) == std::future_status::ready);
  assert(std::chrono::steady_clock::now() - start >= 30ms);
  std::this_thread::sleep_for(100ms);
  assert(fired.load() == 1);
  loop.Stop();
}

void TestCancelledTimerNeverFires() {
  EventLoop loop;
  loop.Start();

  std::atomic<bool> fired{false};
  const auto        handle = loop.ScheduleOnce(50ms, [&] { fired = true; });
  loop.Cancel(handle);
  // unknown handles are ignored
  loop.Cancel(handle);
  loop.Cancel(9999);

  std::this_thread::sleep_for(150ms);
  assert(!fired.load());
  loop.Stop();
}

void TestRepeatingTimerKeepsFiringUntilCancelled() {
  EventLoop loop;
  loop.Start();

  std::atomic<int>   ticks{0};
  std::promise<void> three;
  const auto         handle = loop.ScheduleRepeating(10ms, [&] {
    if (ticks.fetch_add(1) == 2) three.set_value();
  });

  assert(three.get_future().wait_for(2s) == std::future_status::ready);
  loop.Cancel(handle);

  // a tick already dequeued may still run
  std::this_thread::sleep_for(30ms);
  const auto after_cancel = ticks.load();
  std::this_thread::sleep_for(100ms);
  assert(ticks.load() == after_cancel);
  loop.Stop();
}

void TestThrowingTaskDoesNotStopLoop() {
  EventLoop loop;
  loop.Start();

  loop.Post([] { throw std::runtime_error("boom"); });
  auto next = loop.Invoke([] { return 42; });
  assert(next.wait_for(2s) == std::future_status::ready);
  assert(next.get() == 42);
  loop.Stop();
}

void TestPostAfterStopIsDropped() {
  EventLoop loop;
  loop.Start();
  loop.Stop();

  std::atomic<bool> ran{false};
  loop.Post([&] { ran = true; });
  std::this_thread::sleep_for(50ms);
  assert(!ran.load());

  // stopping twice is fine
  loop.Stop();
}

void TestExecutorPostsToLoop() {
  EventLoop loop;
  loop.Start();

  auto               executor = loop.AsExecutor();
  std::promise<bool> result;
  executor([&] { result.set_value(loop.IsLoopThread()); });

  auto future = result.get_future();
  assert(future.wait_for(2s) == std::future_status::ready);
  assert(future.get());
  loop.Stop();
}

} // namespace

int main() {
  TestPostedTasksRunInOrder();
  TestInvokeRunsOnLoopThread();
  TestOneShotTimerFiresOnce();
  TestCancelledTimerNeverFires();
  TestRepeatingTimerKeepsFiringUntilCancelled();
  TestThrowingTaskDoesNotStopLoop();
  TestPostAfterStopIsDropped();
  TestExecutorPostsToLoop();

  std::cout << "ble_gateway_unit_event_loop: pass\n";
  return 0;
}
