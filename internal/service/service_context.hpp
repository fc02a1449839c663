#pragma once

#include <chrono>
#include <memory>

namespace blegw::core { class Gateway; }
namespace blegw::runtime { class EventLoop; }
namespace blegw::scanner { class GrpcAdvertisementSource; }

namespace blegw::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<blegw::core::Gateway>                    gateway;
  std::shared_ptr<blegw::runtime::EventLoop>               loop;
  std::shared_ptr<blegw::scanner::GrpcAdvertisementSource> source;

  std::chrono::milliseconds status_timeout{2000};
};

}
