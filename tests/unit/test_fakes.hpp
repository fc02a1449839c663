#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/identity/identity_provider.hpp"
#include "internal/runtime/timer_service.hpp"
#include "internal/scanner/advertisement_source.hpp"
#include "internal/transport/http_transport.hpp"

namespace blegw::testing {

/*
  Timer service driven by hand. Advance fires due timers in deadline order
  on the calling thread.
*/
class ManualTimer final : public runtime::TimerService {
 public:
  runtime::TimerHandle ScheduleOnce(std::chrono::milliseconds delay, runtime::TimerCallback callback) override {
    return Add(delay, std::chrono::milliseconds(0), std::move(callback));
  }

  runtime::TimerHandle ScheduleRepeating(std::chrono::milliseconds period, runtime::TimerCallback callback) override {
    return Add(period, period, std::move(callback));
  }

  void Cancel(runtime::TimerHandle handle) override {
    timers_.erase(handle);
  }

  void Advance(std::chrono::milliseconds by) {
    const auto target = now_ + by;
    while (true) {
      auto due = timers_.end();
      for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.deadline <= target && (due == timers_.end() || it->second.deadline < due->second.deadline)) {
          due = it;
        }
      }
      if (due == timers_.end()) break;

      now_          = due->second.deadline;
      auto callback = due->second.callback;
      if (due->second.period.count() > 0) {
        due->second.deadline += due->second.period;
      } else {
        timers_.erase(due);
      }
      callback();
    }
    now_ = target;
  }

  std::size_t armed() const {
    return timers_.size();
  }

 private:
  struct Timer {
    std::chrono::milliseconds deadline;
    std::chrono::milliseconds period;
    runtime::TimerCallback    callback;
  };

  runtime::TimerHandle Add(std::chrono::milliseconds delay, std::chrono::milliseconds period, runtime::TimerCallback callback) {
    const auto handle = next_handle_++;
    timers_.emplace(handle, Timer{now_ + delay, period, std::move(callback)});
    return handle;
  }

  std::chrono::milliseconds             now_{0};
  runtime::TimerHandle                  next_handle_ = 1;
  std::map<runtime::TimerHandle, Timer> timers_;
};

/*
  Keeps every request and its completion; the test decides when and how
  each one completes.
*/
class FakeTransport final : public transport::HttpTransport {
 public:
  struct Call {
    transport::HttpRequest    request;
    transport::HttpCompletion completion;
  };

  void Post(const transport::HttpRequest& request, transport::HttpCompletion completion) override {
    calls.push_back({request, std::move(completion)});
  }

  void Respond(std::size_t index, int status, std::string body = {}) {
    calls.at(index).completion(transport::HttpResponse{status, std::move(body)}, transport::kTransportOk);
  }

  void FailWith(std::size_t index, int error_code) {
    calls.at(index).completion(std::nullopt, error_code);
  }

  void RespondWithoutResponse(std::size_t index) {
    calls.at(index).completion(std::nullopt, transport::kTransportOk);
  }

  std::vector<Call> calls;
};

class FakeSource final : public scanner::AdvertisementSource {
 public:
  bool IsRunning() const override {
    return running;
  }

  void Start(const scanner::ScanOptions& options) override {
    running = true;
    ++starts;
    last_options = options;
  }

  void Subscribe(scanner::AdvertisementHandler handler) override {
    handlers.push_back(std::move(handler));
  }

  void Emit(const model::Advertisement& advertisement) {
    for (const auto& handler : handlers) {
      handler(advertisement);
    }
  }

  bool                                       running = false;
  int                                        starts  = 0;
  std::optional<scanner::ScanOptions>        last_options;
  std::vector<scanner::AdvertisementHandler> handlers;
};

class FakeIdentityProvider final : public identity::IdentityProvider {
 public:
  void Resolve(identity::IdentityCallback callback) override {
    pending = std::move(callback);
  }

  void Answer(std::optional<std::string> address) {
    auto callback = std::move(pending);
    pending       = nullptr;
    callback(std::move(address));
  }

  identity::IdentityCallback pending;
};

} // namespace blegw::testing
