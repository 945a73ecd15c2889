#pragma once

#include <memory>

namespace seat::core {
class ReservationEngine;
}
namespace seat::store {
class StateStore;
}

namespace seat::service {

/*
  Dependency container shared by the services.
*/
struct ServiceContext {
  std::shared_ptr<seat::core::ReservationEngine> engine;
  std::shared_ptr<seat::store::StateStore>       store;
};

} // namespace seat::service
