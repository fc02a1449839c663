#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace blegw::runtime {

/*
  gRPC listener for the ingest and status services.
*/
class Server {
 public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

  // Port actually bound; differs from bind_address when it asked for :0.
  int port() const {
    return selected_port_;
  }

 private:
  std::string                                   bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           selected_port_ = 0;
};

} // namespace blegw::runtime
