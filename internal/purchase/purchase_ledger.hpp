#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/flight.hpp"
#include "internal/model/purchase.hpp"
#include "internal/util/id_generator.hpp"
#include "internal/util/time.hpp"

namespace seat::lease {
class HoldLedger;
}

namespace seat::purchase {

/*
  PurchaseLedger

  Converts active holds into purchases and cancels purchases. Payment is not
  modelled: a conversion that passes validation always succeeds.

  Same locking contract as HoldLedger: callers hold the flight's mutex.
*/
class PurchaseLedger {
 public:
  PurchaseLedger(std::shared_ptr<lease::HoldLedger> holds, std::shared_ptr<util::IdGenerator> ids);

  // Throws HoldNotFound, HoldExpired, HoldAlreadyConverted, HoldNotActive or
  // SeatStateMismatch before any mutation.
  model::Purchase Convert(model::Flight& flight, const std::string& hold_id, util::TimePoint now);

  // Throws PurchaseNotFound, PurchaseAlreadyCancelled or PurchaseNotActive.
  // Seats are released unconditionally; the source hold stays converted.
  model::Purchase Cancel(model::Flight& flight, const std::string& purchase_id);

  std::optional<model::Purchase> Find(const std::string& purchase_id) const;

  std::vector<model::Purchase> List() const;
  std::vector<model::Purchase> ActiveForFlight(const std::string& flight_id) const;

  void Restore(const std::vector<model::Purchase>& purchases);

  std::size_t size() const;

 private:
  static constexpr int kMaxIdAttempts = 8;

  std::string UniqueIdLocked();

  std::shared_ptr<lease::HoldLedger> holds_;
  std::shared_ptr<util::IdGenerator> ids_;

  mutable std::mutex                     mutex_;
  std::map<std::string, model::Purchase> purchases_;
};

} // namespace seat::purchase
