#include "reservation_engine.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/lease/hold_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/purchase/purchase_ledger.hpp"
#include "internal/util/errors.hpp"

namespace seat::core {

namespace {

void CheckSeatsExist(const model::SeatMap& seat_map, const std::vector<std::string>& seats, const std::string& owner) {
  for (const auto& seat : seats) {
    if (!seat_map.Contains(seat)) {
      throw std::runtime_error("corrupt state: " + owner + " references unknown seat " + seat);
    }
  }
}

} // namespace

ReservationEngine::ReservationEngine(std::shared_ptr<catalog::FlightCatalog> catalog, std::shared_ptr<lease::HoldLedger> holds,
                                     std::shared_ptr<purchase::PurchaseLedger> purchases, std::shared_ptr<util::TimeSource> clock,
                                     EngineOptions options)
    : catalog_(std::move(catalog)),
      holds_(std::move(holds)),
      purchases_(std::move(purchases)),
      clock_(std::move(clock)),
      options_(std::move(options)) {
}

std::chrono::minutes ReservationEngine::ResolveTtl(const std::optional<std::chrono::minutes>& requested) const {
  const auto ttl = requested.value_or(options_.default_hold_ttl);
  if (ttl <= std::chrono::minutes::zero()) {
    throw util::InvalidRequest("hold minutes must be > 0.");
  }
  if (options_.max_hold_ttl && ttl > *options_.max_hold_ttl) {
    throw util::InvalidRequest("hold minutes must be <= " + std::to_string(options_.max_hold_ttl->count()) + ".");
  }
  return ttl;
}

// ------------------------------------------------------------
// Sweep
// ------------------------------------------------------------

std::size_t ReservationEngine::SweepExpired() {
  return SweepExpired(clock_->Now());
}

std::size_t ReservationEngine::SweepExpired(util::TimePoint now) {
  std::size_t expired = 0;
  for (const auto& entry : catalog_->Entries()) {
    std::lock_guard lock(entry->mutex);
    expired += holds_->SweepExpired(entry->flight, now);
  }

  if (expired > 0) {
    SEAT_LOG_INFO("Expired holds swept", {observability::IntField("expired", static_cast<std::int64_t>(expired))});
  }
  return expired;
}

// ------------------------------------------------------------
// Caller-facing operations
// ------------------------------------------------------------

std::vector<model::Flight> ReservationEngine::Search(const catalog::FlightQuery& query) {
  SweepExpired();
  return catalog_->Search(query);
}

model::SeatMap ReservationEngine::ViewSeats(const std::string& flight_id) {
  SweepExpired();
  auto entry = catalog_->Get(flight_id);

  std::lock_guard lock(entry->mutex);
  return entry->flight.seat_map;
}

model::Hold ReservationEngine::Reserve(const ReserveRequest& request) {
  const auto now = clock_->Now();
  SweepExpired(now);

  auto entry = catalog_->Get(request.flight_id);

  lease::HoldRequest hold_request;
  hold_request.customer = request.customer;
  hold_request.seats    = request.seats;
  hold_request.count    = request.count;
  hold_request.ttl      = ResolveTtl(request.hold_ttl);

  std::lock_guard lock(entry->mutex);
  return holds_->Create(entry->flight, hold_request, now);
}

model::Purchase ReservationEngine::Purchase(const std::string& hold_id) {
  const auto now = clock_->Now();
  SweepExpired(now);

  const auto hold = holds_->Find(hold_id);
  if (!hold) {
    throw util::HoldNotFound(hold_id);
  }
  auto entry = catalog_->Get(hold->flight_id);

  std::lock_guard lock(entry->mutex);
  return purchases_->Convert(entry->flight, hold_id, now);
}

model::Purchase ReservationEngine::Cancel(const std::string& purchase_id) {
  SweepExpired();

  const auto purchase = purchases_->Find(purchase_id);
  if (!purchase) {
    throw util::PurchaseNotFound(purchase_id);
  }
  auto entry = catalog_->Get(purchase->flight_id);

  std::lock_guard lock(entry->mutex);
  return purchases_->Cancel(entry->flight, purchase_id);
}

// ------------------------------------------------------------
// Catalog administration
// ------------------------------------------------------------

model::Flight ReservationEngine::AddFlight(const catalog::NewFlight& request) {
  return catalog_->Add(catalog::BuildFlight(request));
}

std::vector<model::Flight> ReservationEngine::ListFlights() const {
  return catalog_->List();
}

std::vector<model::Hold> ReservationEngine::ListHolds() {
  SweepExpired();
  return holds_->List();
}

std::vector<model::Purchase> ReservationEngine::ListPurchases() {
  SweepExpired();
  return purchases_->List();
}

// ------------------------------------------------------------
// Snapshot / restore
// ------------------------------------------------------------

model::InventorySnapshot ReservationEngine::Snapshot() const {
  const auto entries = catalog_->Entries();

  std::vector<std::unique_lock<std::mutex>> locks;
  locks.reserve(entries.size());
  for (const auto& entry : entries) {
    locks.emplace_back(entry->mutex);
  }

  model::InventorySnapshot snapshot;
  snapshot.flights.reserve(entries.size());
  for (const auto& entry : entries) {
    snapshot.flights.push_back(entry->flight);
  }
  snapshot.holds     = holds_->List();
  snapshot.purchases = purchases_->List();
  return snapshot;
}

void ReservationEngine::Restore(const model::InventorySnapshot& snapshot) {
  catalog::FlightCatalog staged;
  for (const auto& flight : snapshot.flights) {
    staged.Add(flight);
  }

  for (const auto& hold : snapshot.holds) {
    auto entry = staged.Find(hold.flight_id);
    if (!entry) {
      throw std::runtime_error("corrupt state: hold " + hold.id + " references unknown flight " + hold.flight_id);
    }
    CheckSeatsExist(entry->flight.seat_map, hold.seats, "hold " + hold.id);
  }
  for (const auto& purchase : snapshot.purchases) {
    auto entry = staged.Find(purchase.flight_id);
    if (!entry) {
      throw std::runtime_error("corrupt state: purchase " + purchase.id + " references unknown flight " + purchase.flight_id);
    }
    CheckSeatsExist(entry->flight.seat_map, purchase.seats, "purchase " + purchase.id);
  }

  catalog_->Clear();
  for (const auto& flight : snapshot.flights) {
    catalog_->Add(flight);
  }
  holds_->Restore(snapshot.holds);
  purchases_->Restore(snapshot.purchases);
}

} // namespace seat::core
