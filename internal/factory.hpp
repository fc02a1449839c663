#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

namespace blegw::core { class Gateway; }
namespace blegw::identity { class IdentityProvider; }
namespace blegw::runtime { class EventLoop; }
namespace blegw::scanner { class GrpcAdvertisementSource; }
namespace blegw::transport { class BeastHttpTransport; }

namespace blegw::factory {

/*
  Application

  Owns every long-lived object of the process. Members are destroyed in
  reverse order, so the gateway goes before the collaborators it holds
  references to, and the loop goes last.
*/
struct Application {
  std::shared_ptr<runtime::EventLoop>               loop;
  std::shared_ptr<transport::BeastHttpTransport>    transport;
  std::shared_ptr<scanner::GrpcAdvertisementSource> source;
  std::shared_ptr<identity::IdentityProvider>       identity;
  std::shared_ptr<core::Gateway>                    gateway;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // Starts the loop and runs Gateway::Start on it.
  void Start();
  // Stops the loop, then the transport.
  void Stop();
};

/*
  Build

  Composition root: the only place that knows the concrete collaborators.
*/
Application Build(const blegw::runtime::config::RuntimeConfig& config);

} // namespace blegw::factory
