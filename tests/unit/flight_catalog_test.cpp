#include "internal/catalog/flight_catalog.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using seat::catalog::FlightCatalog;
using seat::catalog::FlightQuery;
using seat::catalog::NewFlight;

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

NewFlight SeaLax() {
  NewFlight req;
  req.departure_city    = " Seattle ";
  req.arrival_city      = "Los Angeles";
  req.departure_airport = "sea";
  req.arrival_airport   = "LAX";
  req.departure_at      = seat::util::MakeUtc(2025, 3, 2, 14, 30);
  req.arrival_at        = seat::util::MakeUtc(2025, 3, 2, 17, 10);
  return req;
}

void TestBuildFlightNormalizesAndGeneratesId() {
  auto flight = seat::catalog::BuildFlight(SeaLax());
  assert(flight.id == "F-SEA-LAX-20250302-1430");
  assert(flight.departure_city == "Seattle");
  assert(flight.departure_airport == "SEA");
  assert(flight.departure_date == "2025-03-02");
  assert(flight.seat_map.size() == 24 * 6);
  assert(flight.seat_map.MaxRow() == 24);
}

void TestBuildFlightHonoursExplicitIdAndRows() {
  auto req      = SeaLax();
  req.rows      = 2;
  req.flight_id = "AS-100";

  auto flight = seat::catalog::BuildFlight(req);
  assert(flight.id == "AS-100");
  assert(flight.seat_map.size() == 12);
}

void TestBuildFlightValidation() {
  auto bad_rows = SeaLax();
  bad_rows.rows = 0;
  ExpectThrows<seat::util::InvalidRequest>([&] { seat::catalog::BuildFlight(bad_rows); });

  auto backwards       = SeaLax();
  backwards.arrival_at = backwards.departure_at;
  ExpectThrows<seat::util::InvalidRequest>([&] { seat::catalog::BuildFlight(backwards); });

  auto bad_airport              = SeaLax();
  bad_airport.departure_airport = "SE1";
  ExpectThrows<seat::util::InvalidRequest>([&] { seat::catalog::BuildFlight(bad_airport); });

  auto no_city         = SeaLax();
  no_city.arrival_city = "   ";
  ExpectThrows<seat::util::InvalidRequest>([&] { seat::catalog::BuildFlight(no_city); });
}

void TestAddRejectsDuplicateIds() {
  FlightCatalog catalog;
  catalog.Add(seat::catalog::BuildFlight(SeaLax()));
  ExpectThrows<seat::util::AlreadyExists>([&] { catalog.Add(seat::catalog::BuildFlight(SeaLax())); });
  assert(catalog.size() == 1);

  ExpectThrows<seat::util::UnknownFlight>([&] { catalog.Get("F-NOPE"); });
  assert(catalog.Find("F-NOPE") == nullptr);
}

void TestSearchFilters() {
  FlightCatalog catalog;
  for (const auto& seed : seat::catalog::DefaultSeedFlights()) {
    catalog.Add(seat::catalog::BuildFlight(seed));
  }
  catalog.Add(seat::catalog::BuildFlight(SeaLax()));

  FlightQuery by_date;
  by_date.departure_date = "2025-03-01";
  auto found             = catalog.Search(by_date);
  assert(found.size() == 1);
  assert(found.front().id == "F-SFO-PDX-20250301-0845");

  FlightQuery by_time;
  by_time.departure_time = "20250301 08:";
  assert(catalog.Search(by_time).size() == 1);

  FlightQuery by_city;
  by_city.departing_city = "seattle";
  assert(catalog.Search(by_city).front().id == "F-SEA-LAX-20250302-1430");

  FlightQuery by_arrival;
  by_arrival.arriving_city = "ANGEL";
  by_arrival.arrival_time  = "17:10";
  assert(catalog.Search(by_arrival).size() == 1);

  FlightQuery none;
  none.departing_city = "Seattle";
  none.arriving_city  = "Portland";
  assert(catalog.Search(none).empty());

  FlightQuery blank_date;
  blank_date.departure_date = "  ";
  assert(catalog.Search(blank_date).size() == 2);

  // sorted by departure
  auto all = catalog.List();
  assert(all.size() == 2);
  assert(all[0].id == "F-SFO-PDX-20250301-0845");
  assert(all[1].id == "F-SEA-LAX-20250302-1430");
}

} // namespace

int main() {
  TestBuildFlightNormalizesAndGeneratesId();
  TestBuildFlightHonoursExplicitIdAndRows();
  TestBuildFlightValidation();
  TestAddRejectsDuplicateIds();
  TestSearchFilters();

  std::cout << "seat_inventory_unit_flight_catalog: pass\n";
  return 0;
}
