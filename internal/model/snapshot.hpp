#pragma once

#include <vector>

#include "internal/model/flight.hpp"
#include "internal/model/hold.hpp"
#include "internal/model/purchase.hpp"

namespace seat::model {

/*
  Full inventory state, terminal records included.

  Flights are ordered by id, holds and purchases by id.
*/
struct InventorySnapshot {
  std::vector<Flight>   flights;
  std::vector<Hold>     holds;
  std::vector<Purchase> purchases;

  bool operator==(const InventorySnapshot&) const = default;
};

} // namespace seat::model
