#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/catalog/flight_catalog.hpp"
#include "internal/model/flight.hpp"
#include "internal/model/hold.hpp"
#include "internal/model/purchase.hpp"
#include "internal/model/seat_map.hpp"
#include "internal/model/snapshot.hpp"
#include "internal/util/time.hpp"

namespace seat::lease {
class HoldLedger;
}
namespace seat::purchase {
class PurchaseLedger;
}

namespace seat::core {

struct ReserveRequest {
  std::string flight_id;
  std::string customer;

  // Exactly one of seats / count.
  std::vector<std::string> seats;
  std::optional<int>       count;

  // Falls back to EngineOptions::default_hold_ttl.
  std::optional<std::chrono::minutes> hold_ttl;
};

struct EngineOptions {
  std::chrono::minutes                default_hold_ttl{10};
  std::optional<std::chrono::minutes> max_hold_ttl;
};

/*
  ReservationEngine

  Entry point for every state transition of the inventory. Caller-facing
  operations first sweep expired holds so no caller ever observes an overdue
  hold as active, then run their own transition inside the flight's exclusive
  scope:

    1. resolve the flight (UnknownFlight)
    2. lock FlightCatalog::Entry::mutex
    3. validate everything, then mutate seat map + ledger record together

  Operations on different flights never contend. Snapshot() is the only call
  that locks more than one flight and does so in flight id order.
*/
class ReservationEngine {
 public:
  ReservationEngine(std::shared_ptr<catalog::FlightCatalog> catalog, std::shared_ptr<lease::HoldLedger> holds,
                    std::shared_ptr<purchase::PurchaseLedger> purchases, std::shared_ptr<util::TimeSource> clock, EngineOptions options);

  std::size_t SweepExpired();
  std::size_t SweepExpired(util::TimePoint now);

  std::vector<model::Flight> Search(const catalog::FlightQuery& query);
  model::SeatMap             ViewSeats(const std::string& flight_id);
  model::Hold                Reserve(const ReserveRequest& request);
  model::Purchase            Purchase(const std::string& hold_id);
  model::Purchase            Cancel(const std::string& purchase_id);

  // Catalog administration, no sweep involved.
  model::Flight              AddFlight(const catalog::NewFlight& request);
  std::vector<model::Flight> ListFlights() const;

  // Post-sweep views of the ledgers.
  std::vector<model::Hold>     ListHolds();
  std::vector<model::Purchase> ListPurchases();

  model::InventorySnapshot Snapshot() const;

  // Replaces all state. Rejects snapshots whose holds or purchases reference
  // unknown flights or seats (std::runtime_error). Not safe to call while
  // other operations are running.
  void Restore(const model::InventorySnapshot& snapshot);

  const EngineOptions& options() const {
    return options_;
  }

 private:
  std::chrono::minutes ResolveTtl(const std::optional<std::chrono::minutes>& requested) const;

  std::shared_ptr<catalog::FlightCatalog>   catalog_;
  std::shared_ptr<lease::HoldLedger>        holds_;
  std::shared_ptr<purchase::PurchaseLedger> purchases_;
  std::shared_ptr<util::TimeSource>         clock_;
  EngineOptions                             options_;
};

} // namespace seat::core
