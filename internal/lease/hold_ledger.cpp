#include "hold_ledger.hpp"

#include <set>
#include <stdexcept>

#include "internal/model/seat_id.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace seat::lease {

using model::HoldStatus;
using model::SeatStatus;

namespace {

void EraseActive(std::unordered_multimap<std::string, std::string>& index, const std::string& flight_id, const std::string& hold_id) {
  auto range = index.equal_range(flight_id);
  for (auto it = range.first; it != range.second; ++it) {
    if (it->second == hold_id) {
      index.erase(it);
      return;
    }
  }
}

} // namespace

HoldLedger::HoldLedger(std::shared_ptr<util::IdGenerator> ids) : ids_(std::move(ids)) {
}

std::vector<std::string> HoldLedger::SelectSeats(const model::Flight& flight, const HoldRequest& request) const {
  const bool has_seats = !request.seats.empty();
  const bool has_count = request.count.has_value();

  if (has_seats && has_count) {
    throw util::InvalidRequest("Use either seats or count, not both.");
  }
  if (!has_seats && !has_count) {
    throw util::InvalidRequest("Must provide seats or count.");
  }

  std::vector<std::string> requested;
  if (has_seats) {
    std::set<std::string> seen;
    for (const auto& raw : request.seats) {
      auto seat = model::NormalizeSeat(raw);
      if (!seen.insert(seat).second) {
        throw util::InvalidRequest("Duplicate seat in request: " + seat);
      }
      requested.push_back(std::move(seat));
    }
  } else {
    if (*request.count <= 0) {
      throw util::InvalidRequest("count must be > 0.");
    }

    // front-to-back, A-F within a row
    auto       available = flight.seat_map.Available();
    const auto wanted    = static_cast<std::size_t>(*request.count);
    if (available.size() < wanted) {
      throw util::InsufficientInventory(wanted, available.size());
    }
    available.resize(wanted);
    requested = std::move(available);
  }

  for (const auto& seat : requested) {
    const auto status = flight.seat_map.Get(seat);
    if (!status) {
      throw util::InvalidSeat(flight.id, seat);
    }
    if (!model::CanTransition(*status, SeatStatus::kHeld)) {
      throw util::SeatUnavailable(seat, model::ToString(*status));
    }
  }
  return requested;
}

std::string HoldLedger::UniqueIdLocked() {
  for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    auto id = ids_->Next("H");
    if (holds_.find(id) == holds_.end()) return id;
  }
  throw util::AlreadyExists("could not generate a unique hold_id");
}

model::Hold HoldLedger::Create(model::Flight& flight, const HoldRequest& request, util::TimePoint now) {
  if (request.ttl <= std::chrono::minutes::zero()) {
    throw util::InvalidRequest("hold minutes must be > 0.");
  }
  auto seats = SelectSeats(flight, request);

  std::lock_guard lock(mutex_);

  model::Hold hold;
  hold.id         = UniqueIdLocked();
  hold.flight_id  = flight.id;
  hold.customer   = request.customer;
  hold.expires_at = now + request.ttl;
  hold.status     = HoldStatus::kActive;

  for (const auto& seat : seats) {
    flight.seat_map.Set(seat, SeatStatus::kHeld);
  }
  hold.seats = std::move(seats);

  holds_.emplace(hold.id, hold);
  active_by_flight_.emplace(hold.flight_id, hold.id);
  return hold;
}

std::size_t HoldLedger::SweepExpired(model::Flight& flight, util::TimePoint now) {
  std::lock_guard lock(mutex_);

  std::size_t expired = 0;
  auto        range   = active_by_flight_.equal_range(flight.id);
  for (auto it = range.first; it != range.second;) {
    auto hold_it = holds_.find(it->second);
    if (hold_it == holds_.end() || hold_it->second.status != HoldStatus::kActive) {
      it = active_by_flight_.erase(it);
      continue;
    }

    auto& hold = hold_it->second;
    if (hold.expires_at > now) {
      ++it;
      continue;
    }

    for (const auto& seat : hold.seats) {
      const auto status = flight.seat_map.Get(seat);
      if (status == SeatStatus::kHeld) {
        flight.seat_map.Set(seat, SeatStatus::kAvailable);
        continue;
      }
      SEAT_LOG_WARN("Expired hold seat no longer held; left unchanged",
                    {observability::StringField("hold_id", hold.id), observability::StringField("flight_id", flight.id),
                     observability::StringField("seat", seat),
                     observability::StringField("status", status ? model::ToString(*status) : "MISSING")});
    }

    hold.status = HoldStatus::kExpired;
    it          = active_by_flight_.erase(it);
    ++expired;
  }

  return expired;
}

model::Hold HoldLedger::MarkConverted(const std::string& hold_id) {
  std::lock_guard lock(mutex_);

  auto it = holds_.find(hold_id);
  if (it == holds_.end()) {
    throw util::HoldNotFound(hold_id);
  }

  auto& hold = it->second;
  if (!model::CanTransition(hold.status, HoldStatus::kConverted)) {
    throw util::HoldNotActive(hold_id, model::ToString(hold.status));
  }

  hold.status = HoldStatus::kConverted;
  EraseActive(active_by_flight_, hold.flight_id, hold.id);
  return hold;
}

std::optional<model::Hold> HoldLedger::Find(const std::string& hold_id) const {
  std::lock_guard lock(mutex_);
  auto            it = holds_.find(hold_id);
  if (it == holds_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Hold> HoldLedger::List() const {
  std::lock_guard          lock(mutex_);
  std::vector<model::Hold> holds;
  holds.reserve(holds_.size());
  for (const auto& [_, hold] : holds_) {
    holds.push_back(hold);
  }
  return holds;
}

std::vector<model::Hold> HoldLedger::ActiveForFlight(const std::string& flight_id) const {
  std::lock_guard          lock(mutex_);
  std::vector<model::Hold> holds;
  auto                     range = active_by_flight_.equal_range(flight_id);
  for (auto it = range.first; it != range.second; ++it) {
    auto hold_it = holds_.find(it->second);
    if (hold_it != holds_.end() && hold_it->second.status == HoldStatus::kActive) {
      holds.push_back(hold_it->second);
    }
  }
  return holds;
}

void HoldLedger::Restore(const std::vector<model::Hold>& holds) {
  std::map<std::string, model::Hold>                restored;
  std::unordered_multimap<std::string, std::string> active;
  for (const auto& hold : holds) {
    if (!restored.emplace(hold.id, hold).second) {
      throw std::runtime_error("corrupt state: duplicate hold_id " + hold.id);
    }
    if (hold.status == HoldStatus::kActive) {
      active.emplace(hold.flight_id, hold.id);
    }
  }

  std::lock_guard lock(mutex_);
  holds_            = std::move(restored);
  active_by_flight_ = std::move(active);
}

std::size_t HoldLedger::size() const {
  std::lock_guard lock(mutex_);
  return holds_.size();
}

} // namespace seat::lease
