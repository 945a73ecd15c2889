#pragma once

#include <filesystem>
#include <mutex>

#include "state_store.hpp"

namespace seat::store {

/*
  Snapshot as an indented JSON document (seat.inventory.v1.InventoryState).

  Save() writes <path>.tmp and renames it over <path>, so a crash leaves either
  the old or the new file. A missing file loads as "no state yet".
*/
class JsonFileStateStore final : public StateStore {
 public:
  explicit JsonFileStateStore(std::filesystem::path path);

  std::optional<model::InventorySnapshot> Load() override;
  void                                    Save(const model::InventorySnapshot& snapshot) override;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
  std::mutex            mutex_;
};

} // namespace seat::store
