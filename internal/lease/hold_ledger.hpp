#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/flight.hpp"
#include "internal/model/hold.hpp"
#include "internal/util/id_generator.hpp"
#include "internal/util/time.hpp"

namespace seat::lease {

struct HoldRequest {
  std::string customer;

  // Exactly one of seats / count.
  std::vector<std::string> seats;
  std::optional<int>       count;

  std::chrono::minutes ttl{0};
};

/*
  HoldLedger

  Owns every hold ever created; expired and converted holds stay as history.

  Methods taking a Flight& must be called inside that flight's exclusive scope
  (FlightCatalog::Entry::mutex). The ledger's own mutex only protects its
  containers, it is always taken after the flight lock.
*/
class HoldLedger {
 public:
  explicit HoldLedger(std::shared_ptr<util::IdGenerator> ids);

  // Validates the whole request before touching a seat; throws InvalidRequest,
  // InvalidSeat, SeatUnavailable or InsufficientInventory with nothing changed.
  model::Hold Create(model::Flight& flight, const HoldRequest& request, util::TimePoint now);

  // Expires every active hold of the flight with expires_at <= now and frees
  // the seats that are still held. Returns the number of holds expired.
  std::size_t SweepExpired(model::Flight& flight, util::TimePoint now);

  // Active -> Converted. Throws HoldNotFound / HoldNotActive.
  model::Hold MarkConverted(const std::string& hold_id);

  std::optional<model::Hold> Find(const std::string& hold_id) const;

  std::vector<model::Hold> List() const;
  std::vector<model::Hold> ActiveForFlight(const std::string& flight_id) const;

  // Replaces the ledger content with persisted records.
  void Restore(const std::vector<model::Hold>& holds);

  std::size_t size() const;

 private:
  static constexpr int kMaxIdAttempts = 8;

  std::vector<std::string> SelectSeats(const model::Flight& flight, const HoldRequest& request) const;
  std::string              UniqueIdLocked();

  std::shared_ptr<util::IdGenerator> ids_;

  mutable std::mutex mutex_;

  std::map<std::string, model::Hold>                holds_;
  std::unordered_multimap<std::string, std::string> active_by_flight_;
};

} // namespace seat::lease
