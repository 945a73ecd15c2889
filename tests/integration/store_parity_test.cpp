#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/reservation_engine.hpp"
#include "internal/lease/hold_ledger.hpp"
#include "internal/purchase/purchase_ledger.hpp"
#include "internal/store/json_file_state_store.hpp"
#include "internal/store/memory_state_store.hpp"
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_state_store.hpp"
#include "internal/util/id_generator.hpp"

namespace {

using namespace std::chrono_literals;

using seat::model::HoldStatus;
using seat::model::InventorySnapshot;
using seat::model::PurchaseStatus;
using seat::store::StateStore;

struct BackendFactory {
  std::string                                 name;
  std::function<std::shared_ptr<StateStore>()> open;
  std::function<void()>                       cleanup;
};

std::filesystem::path TempPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "seat_inventory_store_parity";
  std::filesystem::create_directories(dir);
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return dir / (name + "_" + std::to_string(stamp));
}

std::vector<BackendFactory> Backends() {
  std::vector<BackendFactory> backends;

  auto memory = std::make_shared<seat::store::MemoryStateStore>();
  backends.push_back({"memory", [memory]() -> std::shared_ptr<StateStore> { return memory; }, []() {}});

  const auto json_path = TempPath("state") += ".json";
  backends.push_back({"json_file", [json_path]() -> std::shared_ptr<StateStore> { return std::make_shared<seat::store::JsonFileStateStore>(json_path); },
                      [json_path]() {
                        std::filesystem::remove(json_path);
                        std::filesystem::remove(std::filesystem::path(json_path) += ".tmp");
                      }});

  const auto db_path = (TempPath("state") += ".db").string();
  backends.push_back({"sqlite",
                      [db_path]() -> std::shared_ptr<StateStore> {
                        return std::make_shared<seat::store::sqlite::SqliteStateStore>(std::make_shared<seat::store::sqlite::SqliteDB>(db_path));
                      },
                      [db_path]() {
                        std::filesystem::remove(db_path);
                        std::filesystem::remove(db_path + "-wal");
                        std::filesystem::remove(db_path + "-shm");
                      }});
  return backends;
}

/*
  Snapshot with every record state: active, expired and converted holds, active
  and cancelled purchases, seat lists out of grid order, sub-second timestamps.
*/
InventorySnapshot BuildRichSnapshot() {
  auto clock     = std::make_shared<seat::util::ManualTimeSource>(seat::util::MakeUtc(2025, 2, 28, 9, 0) + 123456789ns);
  auto ids       = std::make_shared<seat::util::SequentialIdGenerator>();
  auto holds     = std::make_shared<seat::lease::HoldLedger>(ids);
  auto purchases = std::make_shared<seat::purchase::PurchaseLedger>(holds, ids);
  seat::core::ReservationEngine engine(std::make_shared<seat::catalog::FlightCatalog>(), holds, purchases, clock, seat::core::EngineOptions{});

  seat::catalog::NewFlight sfo;
  sfo.departure_city    = "San Francisco";
  sfo.arrival_city      = "Portland";
  sfo.departure_airport = "SFO";
  sfo.arrival_airport   = "PDX";
  sfo.departure_at      = seat::util::MakeUtc(2025, 3, 1, 8, 45);
  sfo.arrival_at        = seat::util::MakeUtc(2025, 3, 1, 10, 5);
  const auto sfo_id     = engine.AddFlight(sfo).id;

  auto sea              = sfo;
  sea.departure_city    = "Seattle";
  sea.arrival_city      = "Los Angeles";
  sea.departure_airport = "SEA";
  sea.arrival_airport   = "LAX";
  sea.rows              = 12;
  const auto sea_id     = engine.AddFlight(sea).id;

  auto reserve = [&](const std::string& flight, std::vector<std::string> seats, std::chrono::minutes ttl) {
    seat::core::ReserveRequest req;
    req.flight_id = flight;
    req.customer  = "cust-" + flight;
    req.seats     = std::move(seats);
    req.hold_ttl  = ttl;
    return engine.Reserve(req);
  };

  auto doomed = reserve(sfo_id, {"3A"}, 1min);
  clock->Advance(2min);
  engine.SweepExpired();

  reserve(sfo_id, {"10B", "2A", "10A"}, 30min);

  auto kept = reserve(sea_id, {"12C"}, 30min);
  engine.Purchase(kept.id);

  auto refunded = reserve(sea_id, {"1F", "1E"}, 30min);
  engine.Cancel(engine.Purchase(refunded.id).id);

  auto snapshot = engine.Snapshot();
  assert(snapshot.holds.size() == 4);
  assert(snapshot.purchases.size() == 2);
  assert(snapshot.holds.front().id == doomed.id);
  assert(snapshot.holds.front().status == HoldStatus::kExpired);
  return snapshot;
}

void TestFreshStoreHasNoState(const BackendFactory& backend) {
  assert(!backend.open()->Load().has_value() && "fresh store must report no state");
}

void TestRoundTrip(const BackendFactory& backend, const InventorySnapshot& snapshot) {
  backend.open()->Save(snapshot);

  // reopen, as a new process would
  auto loaded = backend.open()->Load();
  assert(loaded.has_value());
  assert(loaded->flights == snapshot.flights);
  assert(loaded->holds == snapshot.holds);
  assert(loaded->purchases == snapshot.purchases);

  const auto& unordered = loaded->holds[1];
  assert((unordered.seats == std::vector<std::string>{"10B", "2A", "10A"}));
}

void TestSaveReplacesPreviousState(const BackendFactory& backend, const InventorySnapshot& snapshot) {
  auto store = backend.open();
  store->Save(snapshot);

  InventorySnapshot smaller;
  smaller.flights.push_back(snapshot.flights.front());
  store->Save(smaller);

  auto loaded = backend.open()->Load();
  assert(loaded.has_value());
  assert(loaded->flights.size() == 1);
  assert(loaded->holds.empty());
  assert(loaded->purchases.empty());

  // an empty snapshot is still "state exists"
  store->Save(InventorySnapshot{});
  auto empty = backend.open()->Load();
  assert(empty.has_value());
  assert(empty->flights.empty());
}

void TestJsonDocumentShape() {
  const auto path = TempPath("shape") += ".json";
  auto       snapshot = BuildRichSnapshot();
  seat::store::JsonFileStateStore(path).Save(snapshot);

  std::ifstream     in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  const auto json = buffer.str();

  assert(json.find("\"12C\": \"PURCHASED\"") != std::string::npos);
  assert(json.find("\"hold_status\": \"EXPIRED\"") != std::string::npos);
  assert(json.find("\"purchased_status\": \"CANCELLED\"") != std::string::npos);
  assert(!std::filesystem::exists(std::filesystem::path(path) += ".tmp"));

  std::filesystem::remove(path);
}

void TestCorruptJsonIsRejected() {
  const auto path = TempPath("corrupt") += ".json";
  {
    std::ofstream out(path);
    out << R"({"flights": {"F-1": {"id": "F-1", "seat_map": {"1A": "BROKEN"}}}})";
  }

  bool threw = false;
  try {
    (void)seat::store::JsonFileStateStore(path).Load();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "unknown seat status must be rejected");

  {
    std::ofstream out(path, std::ios::trunc);
    out << "{ not json";
  }
  threw = false;
  try {
    (void)seat::store::JsonFileStateStore(path).Load();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "malformed JSON must be rejected");

  std::filesystem::remove(path);
}

} // namespace

int main() {
  const auto snapshot = BuildRichSnapshot();

  for (const auto& backend : Backends()) {
    TestFreshStoreHasNoState(backend);
    TestRoundTrip(backend, snapshot);
    TestSaveReplacesPreviousState(backend, snapshot);
    backend.cleanup();
    std::cout << "store_parity[" << backend.name << "]: pass\n";
  }

  TestJsonDocumentShape();
  TestCorruptJsonIsRejected();

  std::cout << "seat_inventory_integration_store_parity: pass\n";
  return 0;
}
