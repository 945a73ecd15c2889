#include "reservation_service.hpp"

#include <stdexcept>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/store/state_store.hpp"
#include "internal/util/errors.hpp"

namespace seat::service {

namespace {

using seat::observability::IntField;
using seat::observability::StringField;

template <typename Fn>
auto ObserveOp(std::string_view op, std::string_view subject, Fn&& fn) {
  try {
    return fn();
  } catch (const util::ReservationError& ex) {
    SEAT_LOG_WARN("Operation rejected",
                  {StringField("op", op), StringField("subject", subject), StringField("code", util::ErrorCodeName(ex.code())),
                   StringField("error", ex.what())});
    throw;
  } catch (const std::exception& ex) {
    SEAT_LOG_ERROR("Operation failed", {StringField("op", op), StringField("subject", subject), StringField("error", ex.what())});
    throw;
  }
}

std::string JoinSeats(const std::vector<std::string>& seats) {
  std::string out;
  for (const auto& seat : seats) {
    if (!out.empty()) out += ",";
    out += seat;
  }
  return out;
}

} // namespace

ReservationService::ReservationService(ServiceContext ctx, ServiceOptions options) : ctx_(std::move(ctx)) {
  if (!ctx_.engine || !ctx_.store) {
    throw std::invalid_argument("ReservationService: engine and store are required");
  }
  LoadOrSeed(options);
}

void ReservationService::LoadOrSeed(const ServiceOptions& options) {
  auto loaded = ctx_.store->Load();
  if (loaded) {
    ctx_.engine->Restore(*loaded);
    SEAT_LOG_INFO("State loaded", {IntField("flights", static_cast<std::int64_t>(loaded->flights.size())),
                                   IntField("holds", static_cast<std::int64_t>(loaded->holds.size())),
                                   IntField("purchases", static_cast<std::int64_t>(loaded->purchases.size()))});
    return;
  }

  if (!options.seed_default_flights) {
    return;
  }
  for (const auto& flight : catalog::DefaultSeedFlights()) {
    const auto added = ctx_.engine->AddFlight(flight);
    SEAT_LOG_INFO("Seeded flight", {StringField("flight_id", added.id)});
  }
  Persist();
}

void ReservationService::Persist() {
  std::lock_guard lock(save_mutex_);
  const auto      snapshot = ctx_.engine->Snapshot();
  ctx_.store->Save(snapshot);
  SEAT_LOG_DEBUG("State saved", {IntField("flights", static_cast<std::int64_t>(snapshot.flights.size())),
                                 IntField("holds", static_cast<std::int64_t>(snapshot.holds.size())),
                                 IntField("purchases", static_cast<std::int64_t>(snapshot.purchases.size()))});
}

// ------------------------------------------------------------
// Customer operations
// ------------------------------------------------------------

std::vector<model::Flight> ReservationService::SearchFlights(const catalog::FlightQuery& query) {
  return ObserveOp("SearchFlights", "", [&] {
    auto flights = ctx_.engine->Search(query);
    Persist();
    return flights;
  });
}

model::SeatMap ReservationService::ViewSeats(const std::string& flight_id) {
  return ObserveOp("ViewSeats", flight_id, [&] {
    auto seats = ctx_.engine->ViewSeats(flight_id);
    Persist();
    return seats;
  });
}

model::Hold ReservationService::Reserve(const core::ReserveRequest& request) {
  return ObserveOp("Reserve", request.flight_id, [&] {
    auto hold = ctx_.engine->Reserve(request);
    Persist();
    SEAT_LOG_INFO("Hold created", {StringField("hold_id", hold.id), StringField("flight_id", hold.flight_id),
                                   StringField("customer", hold.customer), StringField("seats", JoinSeats(hold.seats)),
                                   observability::TimeField("expires_at", hold.expires_at)});
    return hold;
  });
}

model::Purchase ReservationService::Purchase(const std::string& hold_id) {
  return ObserveOp("Purchase", hold_id, [&] {
    auto purchase = ctx_.engine->Purchase(hold_id);
    Persist();
    SEAT_LOG_INFO("Purchase completed", {StringField("purchase_id", purchase.id), StringField("hold_id", hold_id),
                                         StringField("flight_id", purchase.flight_id), StringField("seats", JoinSeats(purchase.seats))});
    return purchase;
  });
}

model::Purchase ReservationService::Cancel(const std::string& purchase_id) {
  return ObserveOp("Cancel", purchase_id, [&] {
    auto purchase = ctx_.engine->Cancel(purchase_id);
    Persist();
    SEAT_LOG_INFO("Purchase cancelled", {StringField("purchase_id", purchase.id), StringField("flight_id", purchase.flight_id),
                                         StringField("seats", JoinSeats(purchase.seats))});
    return purchase;
  });
}

// ------------------------------------------------------------
// Administration
// ------------------------------------------------------------

model::Flight ReservationService::AddFlight(const catalog::NewFlight& request) {
  return ObserveOp("AddFlight", request.flight_id.value_or(""), [&] {
    auto flight = ctx_.engine->AddFlight(request);
    Persist();
    SEAT_LOG_INFO("Flight added", {StringField("flight_id", flight.id), IntField("seats", static_cast<std::int64_t>(flight.seat_map.size()))});
    return flight;
  });
}

std::vector<model::Flight> ReservationService::ListFlights() {
  return ObserveOp("ListFlights", "", [&] { return ctx_.engine->ListFlights(); });
}

model::InventorySnapshot ReservationService::Debug() {
  return ObserveOp("Debug", "", [&] {
    ctx_.engine->SweepExpired();
    Persist();
    return ctx_.engine->Snapshot();
  });
}

} // namespace seat::service
