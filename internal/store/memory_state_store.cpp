#include "memory_state_store.hpp"

namespace seat::store {

std::optional<model::InventorySnapshot> MemoryStateStore::Load() {
  std::lock_guard lock(mutex_);
  return snapshot_;
}

void MemoryStateStore::Save(const model::InventorySnapshot& snapshot) {
  std::lock_guard lock(mutex_);
  snapshot_ = snapshot;
  ++saves_;
}

std::size_t MemoryStateStore::save_count() const {
  std::lock_guard lock(mutex_);
  return saves_;
}

} // namespace seat::store
