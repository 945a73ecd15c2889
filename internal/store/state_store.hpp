#pragma once

#include <optional>

#include "internal/model/snapshot.hpp"

namespace seat::store {

/*
  Durable home of the inventory.

  Semantics guaranteed for ALL backends:

  - Load() returns std::nullopt only when nothing was ever saved
  - Save() is atomic: a reader sees the previous snapshot or the new one
  - Load() after Save(s) yields a snapshot equal to s
  - I/O and decoding failures throw std::runtime_error
*/
class StateStore {
 public:
  virtual ~StateStore() = default;

  virtual std::optional<model::InventorySnapshot> Load() = 0;

  virtual void Save(const model::InventorySnapshot& snapshot) = 0;
};

} // namespace seat::store
