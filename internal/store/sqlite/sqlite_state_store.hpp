#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "internal/store/state_store.hpp"
#include "sqlite_db.hpp"

namespace seat::store::sqlite {

/*
  Relational rendition of the snapshot.

    state_info      one row once anything was saved
    flights         route + timing, instants as unix nanoseconds
    flight_seats    (flight_id, seat) -> status
    holds           hold records
    hold_seats      (hold_id, position) -> seat
    purchases       purchase records
    purchase_seats  (purchase_id, position) -> seat

  Save() replaces every row inside one BEGIN IMMEDIATE transaction.
*/
class SqliteStateStore final : public StateStore {
 public:
  explicit SqliteStateStore(std::shared_ptr<SqliteDB> db);

  std::optional<model::InventorySnapshot> Load() override;
  void                                    Save(const model::InventorySnapshot& snapshot) override;

 private:
  void Migrate();

  std::shared_ptr<SqliteDB> db_;
  std::mutex                mutex_;
};

} // namespace seat::store::sqlite
