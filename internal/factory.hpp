#pragma once

#include <memory>
#include <optional>
#include <string>

#include "config/config.pb.h"

namespace seat::core {
class ReservationEngine;
}
namespace seat::service {
class ReservationService;
}
namespace seat::store {
class StateStore;
}
namespace seat::util {
class IdGenerator;
class TimeSource;
}

namespace seat::factory {

/*
  Application

  Owns the long-lived objects of one process. The service holds the engine and
  store too; they are exposed for tooling and tests.
*/
struct Application {
  std::shared_ptr<store::StateStore>           store;
  std::shared_ptr<core::ReservationEngine>     engine;
  std::shared_ptr<service::ReservationService> service;
};

// Anything left unset comes from the config (or the system defaults).
struct BuildOverrides {
  std::optional<std::string>         state_file;  // forces a JSON file store
  std::shared_ptr<util::TimeSource>  clock;
  std::shared_ptr<util::IdGenerator> ids;
};

std::shared_ptr<store::StateStore> BuildStore(const seat::runtime::config::RuntimeConfig& config, const std::optional<std::string>& state_file);

/*
  Build

  Composition root: the ONLY place that knows concrete store types. Loading or
  seeding the state happens here, through the service constructor.
*/
Application Build(const seat::runtime::config::RuntimeConfig& config, BuildOverrides overrides = {});

} // namespace seat::factory
