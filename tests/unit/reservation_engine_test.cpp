#include "internal/core/reservation_engine.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/lease/hold_ledger.hpp"
#include "internal/purchase/purchase_ledger.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id_generator.hpp"

namespace {

using namespace std::chrono_literals;

using seat::core::EngineOptions;
using seat::core::ReservationEngine;
using seat::core::ReserveRequest;
using seat::model::HoldStatus;
using seat::model::PurchaseStatus;
using seat::model::SeatStatus;

const auto kStart = seat::util::MakeUtc(2025, 3, 1, 6, 0);

template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

struct Harness {
  explicit Harness(EngineOptions options = {}) {
    clock          = std::make_shared<seat::util::ManualTimeSource>(kStart);
    auto ids       = std::make_shared<seat::util::SequentialIdGenerator>();
    auto catalog   = std::make_shared<seat::catalog::FlightCatalog>();
    auto holds     = std::make_shared<seat::lease::HoldLedger>(ids);
    auto purchases = std::make_shared<seat::purchase::PurchaseLedger>(holds, ids);
    engine         = std::make_shared<ReservationEngine>(catalog, holds, purchases, clock, options);
  }

  std::string AddFlight(const std::string& id, int rows) {
    seat::catalog::NewFlight req;
    req.departure_city    = "San Francisco";
    req.arrival_city      = "Portland";
    req.departure_airport = "SFO";
    req.arrival_airport   = "PDX";
    req.departure_at      = seat::util::MakeUtc(2025, 3, 1, 8, 45);
    req.arrival_at        = seat::util::MakeUtc(2025, 3, 1, 10, 5);
    req.rows              = rows;
    req.flight_id         = id;
    return engine->AddFlight(req).id;
  }

  std::shared_ptr<seat::util::ManualTimeSource> clock;
  std::shared_ptr<ReservationEngine>             engine;
};

ReserveRequest Seats(const std::string& flight_id, std::vector<std::string> seats, const std::string& customer = "alice") {
  ReserveRequest req;
  req.flight_id = flight_id;
  req.customer  = customer;
  req.seats     = std::move(seats);
  return req;
}

ReserveRequest Count(const std::string& flight_id, int count) {
  ReserveRequest req;
  req.flight_id = flight_id;
  req.customer  = "bob";
  req.count     = count;
  return req;
}

// Seat statuses always agree with the active ledger records.
void CheckInvariants(const ReservationEngine& engine) {
  const auto snapshot = engine.Snapshot();
  for (const auto& flight : snapshot.flights) {
    std::size_t held      = 0;
    std::size_t purchased = 0;
    for (const auto& hold : snapshot.holds) {
      if (hold.flight_id != flight.id || hold.status != HoldStatus::kActive) continue;
      held += hold.seats.size();
      for (const auto& seat : hold.seats) {
        assert(flight.seat_map.Get(seat) == SeatStatus::kHeld);
      }
    }
    for (const auto& purchase : snapshot.purchases) {
      if (purchase.flight_id != flight.id || purchase.status != PurchaseStatus::kActive) continue;
      purchased += purchase.seats.size();
      for (const auto& seat : purchase.seats) {
        assert(flight.seat_map.Get(seat) == SeatStatus::kPurchased);
      }
    }
    assert(flight.seat_map.Count(SeatStatus::kHeld) == held);
    assert(flight.seat_map.Count(SeatStatus::kPurchased) == purchased);
  }
}

// ------------------------------------------------------------

void TestReserveUsesDefaultTtl() {
  Harness h;
  auto    flight = h.AddFlight("F-1", 1);

  auto hold = h.engine->Reserve(Seats(flight, {"1a"}));
  assert((hold.seats == std::vector<std::string>{"1A"}));
  assert(hold.expires_at == kStart + 10min);
  CheckInvariants(*h.engine);
}

void TestTtlBounds() {
  EngineOptions options;
  options.default_hold_ttl = 5min;
  options.max_hold_ttl     = 30min;
  Harness h(options);
  auto    flight = h.AddFlight("F-1", 1);

  auto req     = Seats(flight, {"1A"});
  req.hold_ttl = 31min;
  ExpectThrows<seat::util::InvalidRequest>([&] { h.engine->Reserve(req); });

  req.hold_ttl = 0min;
  ExpectThrows<seat::util::InvalidRequest>([&] { h.engine->Reserve(req); });

  req.hold_ttl = 30min;
  assert(h.engine->Reserve(req).expires_at == kStart + 30min);
  assert(h.engine->Reserve(Seats(flight, {"1B"})).expires_at == kStart + 5min);
}

void TestCountExhaustsThenFails() {
  Harness h;
  auto    flight = h.AddFlight("F-1", 1);

  auto hold = h.engine->Reserve(Count(flight, 6));
  assert(hold.seats.size() == 6);
  assert(h.engine->ViewSeats(flight).Available().empty());

  const auto before = h.engine->Snapshot();
  ExpectThrows<seat::util::InsufficientInventory>([&] { h.engine->Reserve(Count(flight, 1)); });
  assert(h.engine->Snapshot() == before);
  CheckInvariants(*h.engine);
}

void TestNPlusOneFailsWithoutMutation() {
  Harness h;
  auto    flight = h.AddFlight("F-1", 1);

  const auto before = h.engine->Snapshot();
  ExpectThrows<seat::util::InsufficientInventory>([&] { h.engine->Reserve(Count(flight, 7)); });
  assert(h.engine->Snapshot() == before);
}

void TestUnknownFlight() {
  Harness h;
  ExpectThrows<seat::util::UnknownFlight>([&] { h.engine->Reserve(Count("F-NOPE", 1)); });
  ExpectThrows<seat::util::UnknownFlight>([&] { h.engine->ViewSeats("F-NOPE"); });
}

void TestSeatHeldByAnotherCustomer() {
  Harness h;
  auto    flight = h.AddFlight("F-1", 1);
  h.engine->Reserve(Seats(flight, {"1C"}, "alice"));

  const auto before = h.engine->Snapshot();
  try {
    h.engine->Reserve(Seats(flight, {"1B", "1C"}, "mallory"));
    assert(false && "expected SeatUnavailable");
  } catch (const seat::util::SeatUnavailable& e) {
    assert(e.seat() == "1C");
  }
  assert(h.engine->Snapshot() == before);
}

void TestExpiredHoldIsSweptByAnyOperation() {
  Harness h;
  auto    flight = h.AddFlight("F-1", 1);

  auto req     = Seats(flight, {"1A", "1B"});
  req.hold_ttl = 1min;
  auto hold    = h.engine->Reserve(req);

  h.clock->Advance(2min);

  // a read is enough to trigger the sweep
  auto seats = h.engine->ViewSeats(flight);
  assert(seats.Get("1A") == SeatStatus::kAvailable);
  assert(seats.Get("1B") == SeatStatus::kAvailable);

  auto holds = h.engine->ListHolds();
  assert(holds.size() == 1);
  assert(holds.front().id == hold.id);
  assert(holds.front().status == HoldStatus::kExpired);

  ExpectThrows<seat::util::HoldExpired>([&] { h.engine->Purchase(hold.id); });

  // the freed seats can be held again
  h.engine->Reserve(Seats(flight, {"1A"}, "dave"));
  CheckInvariants(*h.engine);
}

void TestOverdueHoldCannotBePurchased() {
  Harness h;
  auto    flight = h.AddFlight("F-1", 1);

  auto req     = Seats(flight, {"1A"});
  req.hold_ttl = 1min;
  auto hold    = h.engine->Reserve(req);

  // no operation ran since expiry: Purchase itself must sweep first
  h.clock->Advance(1min);
  ExpectThrows<seat::util::HoldExpired>([&] { h.engine->Purchase(hold.id); });
  assert(h.engine->ListPurchases().empty());
}

void TestConvertThenConvertAgain() {
  Harness h;
  auto    flight = h.AddFlight("F-1", 1);

  auto hold     = h.engine->Reserve(Seats(flight, {"1A", "1B"}));
  auto purchase = h.engine->Purchase(hold.id);
  assert((purchase.seats == std::vector<std::string>{"1A", "1B"}));
  assert(purchase.purchased_at == kStart);

  auto seats = h.engine->ViewSeats(flight);
  assert(seats.Get("1A") == SeatStatus::kPurchased);
  assert(seats.Get("1B") == SeatStatus::kPurchased);
  assert(h.engine->ListHolds().front().status == HoldStatus::kConverted);

  const auto before = h.engine->Snapshot();
  ExpectThrows<seat::util::HoldAlreadyConverted>([&] { h.engine->Purchase(hold.id); });
  assert(h.engine->Snapshot() == before);

  // converted holds never expire
  h.clock->Advance(1h);
  h.engine->SweepExpired();
  assert(h.engine->ViewSeats(flight).Get("1A") == SeatStatus::kPurchased);
  CheckInvariants(*h.engine);
}

void TestCancelThenCancelAgain() {
  Harness h;
  auto    flight = h.AddFlight("F-1", 1);

  auto purchase  = h.engine->Purchase(h.engine->Reserve(Seats(flight, {"1A", "1B"})).id);
  auto cancelled = h.engine->Cancel(purchase.id);
  assert(cancelled.status == PurchaseStatus::kCancelled);

  auto seats = h.engine->ViewSeats(flight);
  assert(seats.Get("1A") == SeatStatus::kAvailable);
  assert(seats.Get("1B") == SeatStatus::kAvailable);

  ExpectThrows<seat::util::PurchaseAlreadyCancelled>([&] { h.engine->Cancel(purchase.id); });
  ExpectThrows<seat::util::PurchaseNotFound>([&] { h.engine->Cancel("P-nope"); });
  ExpectThrows<seat::util::HoldNotFound>([&] { h.engine->Purchase("H-nope"); });
  CheckInvariants(*h.engine);
}

void TestFullCycleRestoresInitialSeats() {
  Harness h;
  auto    flight  = h.AddFlight("F-1", 1);
  auto    initial = h.engine->ViewSeats(flight);

  auto hold = h.engine->Reserve(Count(flight, 2));
  assert((hold.seats == std::vector<std::string>{"1A", "1B"}));
  CheckInvariants(*h.engine);

  auto purchase = h.engine->Purchase(hold.id);
  CheckInvariants(*h.engine);

  h.engine->Cancel(purchase.id);
  CheckInvariants(*h.engine);

  assert(h.engine->ViewSeats(flight) == initial);
}

void TestSearchSweepsAndFilters() {
  Harness h;
  h.AddFlight("F-1", 1);

  seat::catalog::FlightQuery query;
  query.departing_city = "san fran";
  assert(h.engine->Search(query).size() == 1);

  query.arriving_city = "Seattle";
  assert(h.engine->Search(query).empty());
}

void TestRestoreRejectsDanglingReferences() {
  Harness h;
  auto    flight = h.AddFlight("F-1", 1);
  h.engine->Reserve(Seats(flight, {"1A"}));
  auto good = h.engine->Snapshot();

  auto unknown_flight                    = good;
  unknown_flight.holds.front().flight_id = "F-GONE";
  ExpectThrows<std::runtime_error>([&] { h.engine->Restore(unknown_flight); });

  auto unknown_seat                 = good;
  unknown_seat.holds.front().seats = {"9Z"};
  ExpectThrows<std::runtime_error>([&] { h.engine->Restore(unknown_seat); });

  // failed restores leave the engine untouched
  assert(h.engine->Snapshot() == good);

  Harness fresh;
  fresh.engine->Restore(good);
  assert(fresh.engine->Snapshot() == good);
  CheckInvariants(*fresh.engine);
}

} // namespace

int main() {
  TestReserveUsesDefaultTtl();
  TestTtlBounds();
  TestCountExhaustsThenFails();
  TestNPlusOneFailsWithoutMutation();
  TestUnknownFlight();
  TestSeatHeldByAnotherCustomer();
  TestExpiredHoldIsSweptByAnyOperation();
  TestOverdueHoldCannotBePurchased();
  TestConvertThenConvertAgain();
  TestCancelThenCancelAgain();
  TestFullCycleRestoresInitialSeats();
  TestSearchSweepsAndFilters();
  TestRestoreRejectsDanglingReferences();

  std::cout << "seat_inventory_unit_reservation_engine: pass\n";
  return 0;
}
