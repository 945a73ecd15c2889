#include "state_codec.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace seat::store {

namespace v1 = seat::inventory::v1;

namespace {

[[noreturn]] void Corrupt(const std::string& what) {
  throw std::runtime_error("corrupt state: " + what);
}

void CheckKey(const std::string& key, const std::string& id, const char* kind) {
  if (key != id) {
    Corrupt(std::string(kind) + " keyed as " + key + " has id " + id);
  }
}

template <typename T>
void SortById(std::vector<T>& records) {
  std::sort(records.begin(), records.end(), [](const T& a, const T& b) { return a.id < b.id; });
}

// ------------------------------------------------------------
// Encode
// ------------------------------------------------------------

v1::Flight EncodeFlight(const model::Flight& flight) {
  v1::Flight out;
  out.set_id(flight.id);
  out.set_departure_city(flight.departure_city);
  out.set_arrival_city(flight.arrival_city);
  out.set_departure_airport(flight.departure_airport);
  out.set_arrival_airport(flight.arrival_airport);
  *out.mutable_departure_time() = util::ToProto(flight.departure_at);
  *out.mutable_arrival_time()   = util::ToProto(flight.arrival_at);
  out.set_departure_date(flight.departure_date);

  auto& seats = *out.mutable_seat_map();
  for (const auto& [seat, status] : flight.seat_map.entries()) {
    seats[seat] = std::string(model::ToString(status));
  }
  return out;
}

v1::Hold EncodeHold(const model::Hold& hold) {
  v1::Hold out;
  out.set_id(hold.id);
  out.set_flight_id(hold.flight_id);
  for (const auto& seat : hold.seats) {
    out.add_seats(seat);
  }
  out.set_customer(hold.customer);
  *out.mutable_time_expires() = util::ToProto(hold.expires_at);
  out.set_hold_status(std::string(model::ToString(hold.status)));
  return out;
}

v1::Purchase EncodePurchase(const model::Purchase& purchase) {
  v1::Purchase out;
  out.set_id(purchase.id);
  out.set_flight_id(purchase.flight_id);
  for (const auto& seat : purchase.seats) {
    out.add_seats(seat);
  }
  out.set_customer(purchase.customer);
  *out.mutable_time_purchased() = util::ToProto(purchase.purchased_at);
  out.set_purchased_status(std::string(model::ToString(purchase.status)));
  return out;
}

// ------------------------------------------------------------
// Decode
// ------------------------------------------------------------

model::Flight DecodeFlight(const v1::Flight& in) {
  model::Flight flight;
  flight.id                = in.id();
  flight.departure_city    = in.departure_city();
  flight.arrival_city      = in.arrival_city();
  flight.departure_airport = in.departure_airport();
  flight.arrival_airport   = in.arrival_airport();
  flight.departure_at      = util::FromProto(in.departure_time());
  flight.arrival_at        = util::FromProto(in.arrival_time());
  flight.departure_date    = in.departure_date();

  model::SeatMap::Entries seats;
  for (const auto& [seat, raw] : in.seat_map()) {
    auto status = model::ParseSeatStatus(raw);
    if (!status) {
      Corrupt("flight " + in.id() + " seat " + seat + " has unknown status " + raw);
    }
    seats.emplace(seat, *status);
  }
  flight.seat_map = model::SeatMap(std::move(seats));
  return flight;
}

model::Hold DecodeHold(const v1::Hold& in) {
  auto status = model::ParseHoldStatus(in.hold_status());
  if (!status) {
    Corrupt("hold " + in.id() + " has unknown status " + in.hold_status());
  }

  model::Hold hold;
  hold.id         = in.id();
  hold.flight_id  = in.flight_id();
  hold.seats.assign(in.seats().begin(), in.seats().end());
  hold.customer   = in.customer();
  hold.expires_at = util::FromProto(in.time_expires());
  hold.status     = *status;
  return hold;
}

model::Purchase DecodePurchase(const v1::Purchase& in) {
  auto status = model::ParsePurchaseStatus(in.purchased_status());
  if (!status) {
    Corrupt("purchase " + in.id() + " has unknown status " + in.purchased_status());
  }

  model::Purchase purchase;
  purchase.id           = in.id();
  purchase.flight_id    = in.flight_id();
  purchase.seats.assign(in.seats().begin(), in.seats().end());
  purchase.customer     = in.customer();
  purchase.purchased_at = util::FromProto(in.time_purchased());
  purchase.status       = *status;
  return purchase;
}

} // namespace

v1::InventoryState EncodeState(const model::InventorySnapshot& snapshot) {
  v1::InventoryState state;
  for (const auto& flight : snapshot.flights) {
    (*state.mutable_flights())[flight.id] = EncodeFlight(flight);
  }
  for (const auto& hold : snapshot.holds) {
    (*state.mutable_holds())[hold.id] = EncodeHold(hold);
  }
  for (const auto& purchase : snapshot.purchases) {
    (*state.mutable_purchases())[purchase.id] = EncodePurchase(purchase);
  }
  return state;
}

model::InventorySnapshot DecodeState(const v1::InventoryState& state) {
  model::InventorySnapshot snapshot;

  snapshot.flights.reserve(state.flights_size());
  for (const auto& [key, flight] : state.flights()) {
    CheckKey(key, flight.id(), "flight");
    snapshot.flights.push_back(DecodeFlight(flight));
  }

  snapshot.holds.reserve(state.holds_size());
  for (const auto& [key, hold] : state.holds()) {
    CheckKey(key, hold.id(), "hold");
    snapshot.holds.push_back(DecodeHold(hold));
  }

  snapshot.purchases.reserve(state.purchases_size());
  for (const auto& [key, purchase] : state.purchases()) {
    CheckKey(key, purchase.id(), "purchase");
    snapshot.purchases.push_back(DecodePurchase(purchase));
  }

  SortById(snapshot.flights);
  SortById(snapshot.holds);
  SortById(snapshot.purchases);
  return snapshot;
}

} // namespace seat::store
