#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace blegw::transport {

inline constexpr int kTransportOk = 0;

struct HttpRequest {
  std::string          url;
  std::string          body;
  std::string          content_type{"application/json"};
  std::chrono::seconds timeout{5};
};

struct HttpResponse {
  int         status = 0;
  std::string body;
};

/*
  Invoked exactly once per Post. error_code is kTransportOk when the network
  exchange finished; the response may still be missing or carry a
  non-success status.
*/
using HttpCompletion = std::function<void(std::optional<HttpResponse> response, int error_code)>;

/*
  Outbound HTTP. Post never blocks; the completion arrives later, through
  whatever executor the implementation was given.
*/
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual void Post(const HttpRequest& request, HttpCompletion completion) = 0;
};

} // namespace blegw::transport
