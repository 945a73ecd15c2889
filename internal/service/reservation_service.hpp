#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/catalog/flight_catalog.hpp"
#include "internal/core/reservation_engine.hpp"
#include "internal/model/snapshot.hpp"
#include "service_context.hpp"

namespace seat::service {

struct ServiceOptions {
  // Add the default flights when the store has never been saved.
  bool seed_default_flights = true;
};

/*
  ReservationService

  Durable face of the engine. The constructor loads the stored snapshot (or
  seeds a fresh one); every operation that may change state is followed by a
  Save() of a fresh snapshot. A failed operation is logged with its error code
  and rethrown without saving.
*/
class ReservationService {
 public:
  ReservationService(ServiceContext ctx, ServiceOptions options = {});

  std::vector<model::Flight> SearchFlights(const catalog::FlightQuery& query);
  model::SeatMap             ViewSeats(const std::string& flight_id);
  model::Hold                Reserve(const core::ReserveRequest& request);
  model::Purchase            Purchase(const std::string& hold_id);
  model::Purchase            Cancel(const std::string& purchase_id);

  model::Flight              AddFlight(const catalog::NewFlight& request);
  std::vector<model::Flight> ListFlights();

  // Post-sweep dump of every flight, hold and purchase.
  model::InventorySnapshot Debug();

 private:
  void LoadOrSeed(const ServiceOptions& options);
  void Persist();

  ServiceContext ctx_;
  std::mutex     save_mutex_;
};

} // namespace seat::service
