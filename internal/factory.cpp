#include "factory.hpp"

#include <memory>

#include "internal/core/gateway.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/identity/sysfs_identity_provider.hpp"
#include "internal/runtime/event_loop.hpp"
#include "internal/scanner/grpc_advertisement_source.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/status_service.hpp"
#include "internal/transport/beast_http_transport.hpp"

namespace blegw::factory {

/*
    Build full application dependency graph
*/
Application Build(const blegw::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Event loop and collaborators
  // ------------------------------------------------------------------
  app.loop      = std::make_shared<runtime::EventLoop>();
  app.transport = std::make_shared<transport::BeastHttpTransport>(app.loop->AsExecutor());
  app.source    = std::make_shared<scanner::GrpcAdvertisementSource>(app.loop->AsExecutor());
  app.identity  = std::make_shared<identity::SysfsIdentityProvider>(app.loop->AsExecutor(), config.gateway().bluetooth_adapter(),
                                                                   config.gateway().gateway_mac());

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  app.gateway = std::make_shared<core::Gateway>(core::GatewayOptions::FromConfig(config), *app.source, *app.transport, *app.loop,
                                                *app.identity);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.gateway = app.gateway;
  ctx.loop    = app.loop;
  ctx.source  = app.source;

  auto ingest_service = std::make_shared<service::IngestService>(ctx);
  auto status_service = std::make_shared<service::StatusService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::IngestServer>(ingest_service, status_service));

  return app;
}

void Application::Start() {
  loop->Start();
  loop->Post([gateway = gateway] { gateway->Start(); });
}

void Application::Stop() {
  if (loop) loop->Stop();
  if (transport) transport->Stop();
}

} // namespace blegw::factory
