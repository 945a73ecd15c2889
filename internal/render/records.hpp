#pragma once

#include <ostream>
#include <vector>

#include "internal/model/flight.hpp"
#include "internal/model/hold.hpp"
#include "internal/model/purchase.hpp"
#include "internal/model/snapshot.hpp"

namespace seat::render {

// key=value blocks consumed by scripts; keep the keys stable.

void PrintFlights(std::ostream& out, const std::vector<model::Flight>& flights);
void PrintFlightAdded(std::ostream& out, const model::Flight& flight);
void PrintSeats(std::ostream& out, const std::string& flight_id, const model::SeatMap& seat_map);

void PrintHoldCreated(std::ostream& out, const model::Hold& hold);
void PrintPurchaseCompleted(std::ostream& out, const model::Purchase& purchase);
void PrintPurchaseCancelled(std::ostream& out, const model::Purchase& purchase);

void PrintDebug(std::ostream& out, const model::InventorySnapshot& snapshot);

} // namespace seat::render
