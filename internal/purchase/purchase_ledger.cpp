#include "purchase_ledger.hpp"

#include <stdexcept>

#include "internal/lease/hold_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace seat::purchase {

using model::HoldStatus;
using model::PurchaseStatus;
using model::SeatStatus;

PurchaseLedger::PurchaseLedger(std::shared_ptr<lease::HoldLedger> holds, std::shared_ptr<util::IdGenerator> ids)
    : holds_(std::move(holds)), ids_(std::move(ids)) {
}

std::string PurchaseLedger::UniqueIdLocked() {
  for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    auto id = ids_->Next("P");
    if (purchases_.find(id) == purchases_.end()) return id;
  }
  throw util::AlreadyExists("could not generate a unique purchase_id");
}

model::Purchase PurchaseLedger::Convert(model::Flight& flight, const std::string& hold_id, util::TimePoint now) {
  const auto hold = holds_->Find(hold_id);
  if (!hold) {
    throw util::HoldNotFound(hold_id);
  }

  switch (hold->status) {
    case HoldStatus::kActive:
      break;
    case HoldStatus::kExpired:
      throw util::HoldExpired(hold_id);
    case HoldStatus::kConverted:
      throw util::HoldAlreadyConverted(hold_id);
    default:
      throw util::HoldNotActive(hold_id, model::ToString(hold->status));
  }

  if (hold->flight_id != flight.id) {
    throw std::logic_error("hold " + hold_id + " belongs to flight " + hold->flight_id + ", not " + flight.id);
  }

  for (const auto& seat : hold->seats) {
    const auto status = flight.seat_map.Get(seat);
    if (!status || !model::CanTransition(*status, SeatStatus::kPurchased)) {
      throw util::SeatStateMismatch(seat, model::ToString(SeatStatus::kHeld), status ? model::ToString(*status) : "MISSING");
    }
  }

  std::lock_guard lock(mutex_);

  model::Purchase purchase;
  purchase.id           = UniqueIdLocked();
  purchase.flight_id    = hold->flight_id;
  purchase.seats        = hold->seats;
  purchase.customer     = hold->customer;
  purchase.purchased_at = now;
  purchase.status       = PurchaseStatus::kActive;

  holds_->MarkConverted(hold_id);
  for (const auto& seat : purchase.seats) {
    flight.seat_map.Set(seat, SeatStatus::kPurchased);
  }

  purchases_.emplace(purchase.id, purchase);
  return purchase;
}

model::Purchase PurchaseLedger::Cancel(model::Flight& flight, const std::string& purchase_id) {
  std::lock_guard lock(mutex_);

  auto it = purchases_.find(purchase_id);
  if (it == purchases_.end()) {
    throw util::PurchaseNotFound(purchase_id);
  }

  auto& purchase = it->second;
  switch (purchase.status) {
    case PurchaseStatus::kActive:
      break;
    case PurchaseStatus::kCancelled:
      throw util::PurchaseAlreadyCancelled(purchase_id);
    default:
      throw util::PurchaseNotActive(purchase_id, model::ToString(purchase.status));
  }

  if (purchase.flight_id != flight.id) {
    throw std::logic_error("purchase " + purchase_id + " belongs to flight " + purchase.flight_id + ", not " + flight.id);
  }

  for (const auto& seat : purchase.seats) {
    const auto status = flight.seat_map.Get(seat);
    if (status != SeatStatus::kPurchased) {
      SEAT_LOG_WARN("Cancelled purchase seat was not purchased; releasing anyway",
                    {observability::StringField("purchase_id", purchase.id), observability::StringField("flight_id", flight.id),
                     observability::StringField("seat", seat),
                     observability::StringField("status", status ? model::ToString(*status) : "MISSING")});
    }
    flight.seat_map.Set(seat, SeatStatus::kAvailable);
  }

  purchase.status = PurchaseStatus::kCancelled;
  return purchase;
}

std::optional<model::Purchase> PurchaseLedger::Find(const std::string& purchase_id) const {
  std::lock_guard lock(mutex_);
  auto            it = purchases_.find(purchase_id);
  if (it == purchases_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Purchase> PurchaseLedger::List() const {
  std::lock_guard              lock(mutex_);
  std::vector<model::Purchase> purchases;
  purchases.reserve(purchases_.size());
  for (const auto& [_, purchase] : purchases_) {
    purchases.push_back(purchase);
  }
  return purchases;
}

std::vector<model::Purchase> PurchaseLedger::ActiveForFlight(const std::string& flight_id) const {
  std::lock_guard              lock(mutex_);
  std::vector<model::Purchase> purchases;
  for (const auto& [_, purchase] : purchases_) {
    if (purchase.flight_id == flight_id && purchase.status == PurchaseStatus::kActive) {
      purchases.push_back(purchase);
    }
  }
  return purchases;
}

void PurchaseLedger::Restore(const std::vector<model::Purchase>& purchases) {
  std::map<std::string, model::Purchase> restored;
  for (const auto& purchase : purchases) {
    if (!restored.emplace(purchase.id, purchase).second) {
      throw std::runtime_error("corrupt state: duplicate purchase_id " + purchase.id);
    }
  }

  std::lock_guard lock(mutex_);
  purchases_ = std::move(restored);
}

std::size_t PurchaseLedger::size() const {
  std::lock_guard lock(mutex_);
  return purchases_.size();
}

} // namespace seat::purchase
