#pragma once

#include "internal/model/snapshot.hpp"
#include "seat/inventory/v1.hpp"

namespace seat::store {

/*
  InventorySnapshot <-> seat.inventory.v1.InventoryState.

  Decoding throws std::runtime_error("corrupt state: ...") on unknown status
  strings or records whose map key disagrees with their id. Decoded records come
  back ordered by id; seat lists keep their stored order.
*/
seat::inventory::v1::InventoryState EncodeState(const model::InventorySnapshot& snapshot);
model::InventorySnapshot            DecodeState(const seat::inventory::v1::InventoryState& state);

} // namespace seat::store
