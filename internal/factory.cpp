#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/catalog/flight_catalog.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/reservation_engine.hpp"
#include "internal/lease/hold_ledger.hpp"
#include "internal/purchase/purchase_ledger.hpp"
#include "internal/service/reservation_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/json_file_state_store.hpp"
#include "internal/store/memory_state_store.hpp"
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_state_store.hpp"
#include "internal/util/id_generator.hpp"
#include "internal/util/time.hpp"

namespace seat::factory {

std::shared_ptr<store::StateStore> BuildStore(const seat::runtime::config::RuntimeConfig& config, const std::optional<std::string>& state_file) {
  if (state_file) {
    return std::make_shared<store::JsonFileStateStore>(*state_file);
  }

  const auto& store_config = config.store();
  if (store_config.has_sqlite()) {
    auto sqlite_db = std::make_shared<store::sqlite::SqliteDB>(store_config.sqlite().path());
    return std::make_shared<store::sqlite::SqliteStateStore>(std::move(sqlite_db));
  }

  if (store_config.has_memory()) {
    return std::make_shared<store::MemoryStateStore>();
  }

  if (store_config.has_json_file()) {
    return std::make_shared<store::JsonFileStateStore>(store_config.json_file().path());
  }

  return std::make_shared<store::JsonFileStateStore>(config::kDefaultStatePath);
}

/*
    Build full application dependency graph
*/
Application Build(const seat::runtime::config::RuntimeConfig& config, BuildOverrides overrides) {
  Application app;

  // ------------------------------------------------------------------
  // Infrastructure
  // ------------------------------------------------------------------
  app.store = BuildStore(config, overrides.state_file);

  std::shared_ptr<util::TimeSource> clock = overrides.clock;
  if (!clock) clock = std::make_shared<util::SystemTimeSource>();

  std::shared_ptr<util::IdGenerator> ids = overrides.ids;
  if (!ids) ids = std::make_shared<util::RandomIdGenerator>();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto flight_catalog  = std::make_shared<catalog::FlightCatalog>();
  auto hold_ledger     = std::make_shared<lease::HoldLedger>(ids);
  auto purchase_ledger = std::make_shared<purchase::PurchaseLedger>(hold_ledger, ids);

  core::EngineOptions engine_options;
  engine_options.default_hold_ttl = config::DefaultHoldTtl(config);
  engine_options.max_hold_ttl     = config::MaxHoldTtl(config);

  app.engine = std::make_shared<core::ReservationEngine>(flight_catalog, hold_ledger, purchase_ledger, clock, engine_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine = app.engine;
  ctx.store  = app.store;

  service::ServiceOptions service_options;
  service_options.seed_default_flights = config::SeedDefaultFlights(config);

  app.service = std::make_shared<service::ReservationService>(ctx, service_options);
  return app;
}

} // namespace seat::factory
