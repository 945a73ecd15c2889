#include "records.hpp"

#include "internal/util/time.hpp"
#include "seat_grid.hpp"

namespace seat::render {

namespace {

std::string JoinSeats(const std::vector<std::string>& seats) {
  std::string out;
  for (const auto& seat : seats) {
    if (!out.empty()) out += ",";
    out += seat;
  }
  return out;
}

void PrintPurchaseFields(std::ostream& out, const model::Purchase& purchase) {
  out << "purchase_id=" << purchase.id << "\n";
  out << "flight_id=" << purchase.flight_id << "\n";
  out << "customer=" << purchase.customer << "\n";
  out << "seats=" << JoinSeats(purchase.seats) << "\n";
}

} // namespace

void PrintFlights(std::ostream& out, const std::vector<model::Flight>& flights) {
  if (flights.empty()) {
    out << "No flights found.\n";
    return;
  }
  for (const auto& f : flights) {
    out << "- flight_id=" << f.id << "\n";
    out << "  " << f.departure_city << " (" << f.departure_airport << ") -> " << f.arrival_city << " (" << f.arrival_airport << ")\n";
    out << "  depart=" << util::FormatCompact(f.departure_at) << "  arrive=" << util::FormatCompact(f.arrival_at) << "\n";
    out << "\n";
  }
}

void PrintFlightAdded(std::ostream& out, const model::Flight& flight) {
  out << "FLIGHT ADDED\n";
  out << "flight_id=" << flight.id << "\n";
  out << "route=" << flight.departure_airport << "->" << flight.arrival_airport << "\n";
  out << "depart=" << util::FormatCompact(flight.departure_at) << "\n";
  out << "arrive=" << util::FormatCompact(flight.arrival_at) << "\n";
  out << "rows=" << GridRows(flight.seat_map) << "\n";
}

void PrintSeats(std::ostream& out, const std::string& flight_id, const model::SeatMap& seat_map) {
  out << "Flight: " << flight_id << "\n";
  out << FormatSeatGrid(seat_map, GridRows(seat_map)) << "\n";
}

void PrintHoldCreated(std::ostream& out, const model::Hold& hold) {
  out << "HOLD CREATED\n";
  out << "hold_id=" << hold.id << "\n";
  out << "flight_id=" << hold.flight_id << "\n";
  out << "customer=" << hold.customer << "\n";
  out << "seats=" << JoinSeats(hold.seats) << "\n";
  out << "expires_utc=" << util::FormatRfc3339(hold.expires_at) << "\n";
  out << "status=" << model::ToString(hold.status) << "\n";
}

void PrintPurchaseCompleted(std::ostream& out, const model::Purchase& purchase) {
  out << "PURCHASE COMPLETED (payment stubbed)\n";
  PrintPurchaseFields(out, purchase);
  out << "purchased_utc=" << util::FormatRfc3339(purchase.purchased_at) << "\n";
  out << "status=" << model::ToString(purchase.status) << "\n";
}

void PrintPurchaseCancelled(std::ostream& out, const model::Purchase& purchase) {
  out << "PURCHASE CANCELLED\n";
  PrintPurchaseFields(out, purchase);
  out << "status=" << model::ToString(purchase.status) << "\n";
}

void PrintDebug(std::ostream& out, const model::InventorySnapshot& snapshot) {
  out << "=== Holds ===\n";
  for (const auto& h : snapshot.holds) {
    out << h.id << " flight=" << h.flight_id << " seats=" << JoinSeats(h.seats) << " cust=" << h.customer
        << " exp=" << util::FormatRfc3339(h.expires_at) << " status=" << model::ToString(h.status) << "\n";
  }
  out << "\n";
  out << "=== Purchases ===\n";
  for (const auto& p : snapshot.purchases) {
    out << p.id << " flight=" << p.flight_id << " seats=" << JoinSeats(p.seats) << " cust=" << p.customer
        << " t=" << util::FormatRfc3339(p.purchased_at) << " status=" << model::ToString(p.status) << "\n";
  }
}

} // namespace seat::render
