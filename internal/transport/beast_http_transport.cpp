#include "beast_http_transport.hpp"

#include <chrono>
#include <string_view>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "internal/observability/logging.hpp"

namespace blegw::transport {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace {

/*
  One request: resolve, connect, write, read. Keeps itself alive through
  the handlers and calls Finish exactly once.
*/
class Session : public std::enable_shared_from_this<Session> {
 public:
  Session(net::io_context& ioc, runtime::Executor completion_executor, HttpCompletion completion)
      : resolver_(net::make_strand(ioc)),
        stream_(resolver_.get_executor()),
        completion_executor_(std::move(completion_executor)),
        completion_(std::move(completion)) {
  }

  void Run(const ParsedUrl& url, const HttpRequest& request) {
    timeout_ = request.timeout;

    req_.version(11);
    req_.method(http::verb::post);
    req_.target(url.target);
    req_.set(http::field::host, url.host);
    req_.set(http::field::user_agent, "ble-gateway");
    req_.set(http::field::content_type, request.content_type);
    req_.body() = request.body;
    req_.prepare_payload();

    resolver_.async_resolve(url.host, url.port, beast::bind_front_handler(&Session::OnResolve, shared_from_this()));
  }

 private:
  void OnResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return Finish(std::nullopt, ec);

    stream_.expires_after(timeout_);
    stream_.async_connect(results, beast::bind_front_handler(&Session::OnConnect, shared_from_this()));
  }

  void OnConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) return Finish(std::nullopt, ec);

    stream_.expires_after(timeout_);
    http::async_write(stream_, req_, beast::bind_front_handler(&Session::OnWrite, shared_from_this()));
  }

  void OnWrite(beast::error_code ec, std::size_t) {
    if (ec) return Finish(std::nullopt, ec);

    http::async_read(stream_, buffer_, res_, beast::bind_front_handler(&Session::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec) return Finish(std::nullopt, ec);

    HttpResponse response;
    response.status = static_cast<int>(res_.result_int());
    response.body   = std::move(res_.body());

    beast::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);

    Finish(std::move(response), {});
  }

  void Finish(std::optional<HttpResponse> response, beast::error_code ec) {
    const int code = ec ? ec.value() : kTransportOk;
    if (ec) {
      BLEGW_LOG_DEBUG("HTTP exchange failed", {observability::StringField("error", ec.message())});
    }
    completion_executor_([completion = std::move(completion_), response = std::move(response), code]() mutable {
      completion(std::move(response), code);
    });
  }

  tcp::resolver                     resolver_;
  beast::tcp_stream                 stream_;
  beast::flat_buffer                buffer_;
  http::request<http::string_body>  req_;
  http::response<http::string_body> res_;
  std::chrono::seconds              timeout_{5};

  runtime::Executor completion_executor_;
  HttpCompletion    completion_;
};

} // namespace

std::optional<ParsedUrl> ParseHttpUrl(const std::string& url) {
  static constexpr std::string_view kScheme = "http://";
  if (url.compare(0, kScheme.size(), kScheme) != 0) {
    return std::nullopt;
  }

  const auto authority_begin = kScheme.size();
  const auto path_begin      = url.find('/', authority_begin);
  const auto authority       = url.substr(authority_begin, path_begin == std::string::npos ? std::string::npos : path_begin - authority_begin);
  if (authority.empty()) {
    return std::nullopt;
  }

  ParsedUrl parsed;
  if (path_begin != std::string::npos) {
    parsed.target = url.substr(path_begin);
  }

  const auto colon = authority.rfind(':');
  if (colon == std::string::npos) {
    parsed.host = authority;
  } else {
    parsed.host = authority.substr(0, colon);
    parsed.port = authority.substr(colon + 1);
    if (parsed.host.empty() || parsed.port.empty()) {
      return std::nullopt;
    }
  }
  return parsed;
}

BeastHttpTransport::BeastHttpTransport(runtime::Executor completion_executor)
    : work_(net::make_work_guard(ioc_)), completion_executor_(std::move(completion_executor)) {
  thread_ = std::thread([this] { ioc_.run(); });
}

BeastHttpTransport::~BeastHttpTransport() {
  Stop();
}

void BeastHttpTransport::Stop() {
  work_.reset();
  ioc_.stop();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void BeastHttpTransport::Post(const HttpRequest& request, HttpCompletion completion) {
  auto url = ParseHttpUrl(request.url);
  if (!url) {
    BLEGW_LOG_ERROR("Unsupported endpoint URL", {observability::StringField("url", request.url)});
    const int code = static_cast<int>(boost::system::errc::invalid_argument);
    completion_executor_([completion = std::move(completion), code]() mutable { completion(std::nullopt, code); });
    return;
  }

  auto session = std::make_shared<Session>(ioc_, completion_executor_, std::move(completion));
  net::post(ioc_, [session, url = std::move(*url), request] { session->Run(url, request); });
}

} // namespace blegw::transport
