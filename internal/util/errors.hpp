#pragma once

#include <stdexcept>
#include <string>

namespace blegw::util {

/*
  Central error types.

  Delivery errors describe a failed send in the logs and feed the backoff
  controller. They never cross the event loop as exceptions.
  Config and ingest errors get translated to gRPC status codes.
*/

class TransportError : public std::runtime_error {
 public:
  TransportError(const std::string& msg, int code) : std::runtime_error(msg), code_(code) {
  }

  int code() const {
    return code_;
  }

 private:
  int code_;
};

class ApplicationError : public std::runtime_error {
 public:
  ApplicationError(const std::string& msg, int status) : std::runtime_error(msg), status_(status) {
  }

  int status() const {
    return status_;
  }

 private:
  int status_;
};

class WatchdogTimeout : public std::runtime_error {
 public:
  explicit WatchdogTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedAdvertisement : public std::runtime_error {
 public:
  explicit MalformedAdvertisement(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace blegw::util
