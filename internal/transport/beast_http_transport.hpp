#pragma once

#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "internal/runtime/executor.hpp"
#include "internal/transport/http_transport.hpp"

namespace blegw::transport {

struct ParsedUrl {
  std::string host;
  std::string port{"80"};
  std::string target{"/"};
};

// Plain http:// only. Returns nullopt for anything else.
std::optional<ParsedUrl> ParseHttpUrl(const std::string& url);

/*
  HTTP/1.1 POST over Boost.Beast.

  Requests run on a private io_context thread; completions are handed to the
  executor given at construction (the gateway event loop) so they never run
  concurrently with gateway code. Error codes are boost::system values.
*/
class BeastHttpTransport final : public HttpTransport {
 public:
  explicit BeastHttpTransport(runtime::Executor completion_executor);
  ~BeastHttpTransport() override;

  BeastHttpTransport(const BeastHttpTransport&)            = delete;
  BeastHttpTransport& operator=(const BeastHttpTransport&) = delete;

  void Post(const HttpRequest& request, HttpCompletion completion) override;

  void Stop();

 private:
  boost::asio::io_context                                                  ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  runtime::Executor                                                        completion_executor_;
  std::thread                                                              thread_;
};

} // namespace blegw::transport
