#include "sqlite_state_store.hpp"

#include <map>
#include <stdexcept>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"
#include "sqlite_tx.hpp"

namespace seat::store::sqlite {

namespace {

constexpr const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS state_info (id INTEGER PRIMARY KEY CHECK (id = 1), saved_at_ns INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS flights (id TEXT PRIMARY KEY, departure_city TEXT NOT NULL, arrival_city TEXT NOT NULL, departure_airport TEXT "
    "NOT NULL, arrival_airport TEXT NOT NULL, departure_ns INTEGER NOT NULL, arrival_ns INTEGER NOT NULL, departure_date TEXT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS flight_seats (flight_id TEXT NOT NULL REFERENCES flights(id) ON DELETE CASCADE, seat TEXT NOT NULL, status TEXT "
    "NOT NULL, PRIMARY KEY (flight_id, seat));",
    "CREATE TABLE IF NOT EXISTS holds (id TEXT PRIMARY KEY, flight_id TEXT NOT NULL, customer TEXT NOT NULL, expires_ns INTEGER NOT NULL, "
    "status TEXT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS hold_seats (hold_id TEXT NOT NULL REFERENCES holds(id) ON DELETE CASCADE, position INTEGER NOT NULL, seat TEXT "
    "NOT NULL, PRIMARY KEY (hold_id, position));",
    "CREATE TABLE IF NOT EXISTS purchases (id TEXT PRIMARY KEY, flight_id TEXT NOT NULL, customer TEXT NOT NULL, purchased_ns INTEGER NOT NULL, "
    "status TEXT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS purchase_seats (purchase_id TEXT NOT NULL REFERENCES purchases(id) ON DELETE CASCADE, position INTEGER NOT NULL, "
    "seat TEXT NOT NULL, PRIMARY KEY (purchase_id, position));",
};

template <typename Status, typename Parse>
Status ParseStatus(const std::string& raw, Parse parse, const std::string& owner) {
  auto status = parse(raw);
  if (!status) {
    throw std::runtime_error("corrupt state: " + owner + " has unknown status " + raw);
  }
  return *status;
}

void InsertSeats(Statement& insert, const std::string& owner_id, const std::vector<std::string>& seats) {
  for (std::size_t i = 0; i < seats.size(); ++i) {
    insert.BindText(1, owner_id);
    insert.BindInt64(2, static_cast<std::int64_t>(i));
    insert.BindText(3, seats[i]);
    insert.Run();
  }
}

// owner id -> seats in position order
std::map<std::string, std::vector<std::string>> LoadSeatLists(SqliteDB& db, const char* sql) {
  std::map<std::string, std::vector<std::string>> out;
  Statement                                       select(db, sql);
  while (select.Step()) {
    out[select.ColText(0)].push_back(select.ColText(1));
  }
  return out;
}

} // namespace

SqliteStateStore::SqliteStateStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  if (!db_) {
    throw std::invalid_argument("SqliteStateStore: null db");
  }
  Migrate();
}

void SqliteStateStore::Migrate() {
  for (const char* sql : kSchema) {
    db_->Exec(sql);
  }
}

// ------------------------------------------------------------
// Save
// ------------------------------------------------------------

void SqliteStateStore::Save(const model::InventorySnapshot& snapshot) {
  std::lock_guard lock(mutex_);

  SqliteTransaction tx(db_);

  // seat tables cascade
  db_->Exec("DELETE FROM flights;");
  db_->Exec("DELETE FROM holds;");
  db_->Exec("DELETE FROM purchases;");

  Statement insert_flight(*db_,
                          "INSERT INTO flights(id,departure_city,arrival_city,departure_airport,arrival_airport,departure_ns,arrival_ns,departure_date) "
                          "VALUES(?,?,?,?,?,?,?,?);");
  Statement insert_seat(*db_, "INSERT INTO flight_seats(flight_id,seat,status) VALUES(?,?,?);");
  for (const auto& flight : snapshot.flights) {
    insert_flight.BindText(1, flight.id);
    insert_flight.BindText(2, flight.departure_city);
    insert_flight.BindText(3, flight.arrival_city);
    insert_flight.BindText(4, flight.departure_airport);
    insert_flight.BindText(5, flight.arrival_airport);
    insert_flight.BindInt64(6, util::ToUnixNanos(flight.departure_at));
    insert_flight.BindInt64(7, util::ToUnixNanos(flight.arrival_at));
    insert_flight.BindText(8, flight.departure_date);
    insert_flight.Run();

    for (const auto& [seat, status] : flight.seat_map.entries()) {
      insert_seat.BindText(1, flight.id);
      insert_seat.BindText(2, seat);
      insert_seat.BindText(3, std::string(model::ToString(status)));
      insert_seat.Run();
    }
  }

  Statement insert_hold(*db_, "INSERT INTO holds(id,flight_id,customer,expires_ns,status) VALUES(?,?,?,?,?);");
  Statement insert_hold_seat(*db_, "INSERT INTO hold_seats(hold_id,position,seat) VALUES(?,?,?);");
  for (const auto& hold : snapshot.holds) {
    insert_hold.BindText(1, hold.id);
    insert_hold.BindText(2, hold.flight_id);
    insert_hold.BindText(3, hold.customer);
    insert_hold.BindInt64(4, util::ToUnixNanos(hold.expires_at));
    insert_hold.BindText(5, std::string(model::ToString(hold.status)));
    insert_hold.Run();
    InsertSeats(insert_hold_seat, hold.id, hold.seats);
  }

  Statement insert_purchase(*db_, "INSERT INTO purchases(id,flight_id,customer,purchased_ns,status) VALUES(?,?,?,?,?);");
  Statement insert_purchase_seat(*db_, "INSERT INTO purchase_seats(purchase_id,position,seat) VALUES(?,?,?);");
  for (const auto& purchase : snapshot.purchases) {
    insert_purchase.BindText(1, purchase.id);
    insert_purchase.BindText(2, purchase.flight_id);
    insert_purchase.BindText(3, purchase.customer);
    insert_purchase.BindInt64(4, util::ToUnixNanos(purchase.purchased_at));
    insert_purchase.BindText(5, std::string(model::ToString(purchase.status)));
    insert_purchase.Run();
    InsertSeats(insert_purchase_seat, purchase.id, purchase.seats);
  }

  Statement mark(*db_, "INSERT OR REPLACE INTO state_info(id,saved_at_ns) VALUES(1,?);");
  mark.BindInt64(1, util::ToUnixNanos(util::Now()));
  mark.Run();

  tx.Commit();
}

// ------------------------------------------------------------
// Load
// ------------------------------------------------------------

std::optional<model::InventorySnapshot> SqliteStateStore::Load() {
  std::lock_guard lock(mutex_);

  SqliteTransaction tx(db_);

  {
    Statement saved(*db_, "SELECT saved_at_ns FROM state_info WHERE id=1;");
    if (!saved.Step()) {
      return std::nullopt;
    }
  }

  model::InventorySnapshot snapshot;

  std::map<std::string, model::SeatMap::Entries> seats_by_flight;
  {
    Statement select(*db_, "SELECT flight_id,seat,status FROM flight_seats;");
    while (select.Step()) {
      const auto flight_id = select.ColText(0);
      const auto seat      = select.ColText(1);
      seats_by_flight[flight_id].emplace(seat, ParseStatus<model::SeatStatus>(select.ColText(2), model::ParseSeatStatus,
                                                                              "flight " + flight_id + " seat " + seat));
    }
  }
  {
    Statement select(*db_,
                     "SELECT id,departure_city,arrival_city,departure_airport,arrival_airport,departure_ns,arrival_ns,departure_date "
                     "FROM flights ORDER BY id;");
    while (select.Step()) {
      model::Flight flight;
      flight.id                = select.ColText(0);
      flight.departure_city    = select.ColText(1);
      flight.arrival_city      = select.ColText(2);
      flight.departure_airport = select.ColText(3);
      flight.arrival_airport   = select.ColText(4);
      flight.departure_at      = util::FromUnixNanos(select.ColInt64(5));
      flight.arrival_at        = util::FromUnixNanos(select.ColInt64(6));
      flight.departure_date    = select.ColText(7);
      flight.seat_map          = model::SeatMap(std::move(seats_by_flight[flight.id]));
      snapshot.flights.push_back(std::move(flight));
    }
  }

  auto hold_seats = LoadSeatLists(*db_, "SELECT hold_id,seat FROM hold_seats ORDER BY hold_id,position;");
  {
    Statement select(*db_, "SELECT id,flight_id,customer,expires_ns,status FROM holds ORDER BY id;");
    while (select.Step()) {
      model::Hold hold;
      hold.id         = select.ColText(0);
      hold.flight_id  = select.ColText(1);
      hold.customer   = select.ColText(2);
      hold.expires_at = util::FromUnixNanos(select.ColInt64(3));
      hold.status     = ParseStatus<model::HoldStatus>(select.ColText(4), model::ParseHoldStatus, "hold " + hold.id);
      hold.seats      = std::move(hold_seats[hold.id]);
      snapshot.holds.push_back(std::move(hold));
    }
  }

  auto purchase_seats = LoadSeatLists(*db_, "SELECT purchase_id,seat FROM purchase_seats ORDER BY purchase_id,position;");
  {
    Statement select(*db_, "SELECT id,flight_id,customer,purchased_ns,status FROM purchases ORDER BY id;");
    while (select.Step()) {
      model::Purchase purchase;
      purchase.id           = select.ColText(0);
      purchase.flight_id    = select.ColText(1);
      purchase.customer     = select.ColText(2);
      purchase.purchased_at = util::FromUnixNanos(select.ColInt64(3));
      purchase.status       = ParseStatus<model::PurchaseStatus>(select.ColText(4), model::ParsePurchaseStatus, "purchase " + purchase.id);
      purchase.seats        = std::move(purchase_seats[purchase.id]);
      snapshot.purchases.push_back(std::move(purchase));
    }
  }

  tx.Commit();
  return snapshot;
}

} // namespace seat::store::sqlite
