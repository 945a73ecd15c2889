#pragma once

#include <mutex>
#include <optional>

#include "state_store.hpp"

namespace seat::store {

class MemoryStateStore final : public StateStore {
 public:
  MemoryStateStore() = default;
  explicit MemoryStateStore(model::InventorySnapshot initial) : snapshot_(std::move(initial)) {
  }

  std::optional<model::InventorySnapshot> Load() override;
  void                                    Save(const model::InventorySnapshot& snapshot) override;

  std::size_t save_count() const;

 private:
  mutable std::mutex                      mutex_;
  std::optional<model::InventorySnapshot> snapshot_;
  std::size_t                             saves_ = 0;
};

} // namespace seat::store
