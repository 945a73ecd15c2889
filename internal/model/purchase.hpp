#pragma once

#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace seat::model {

struct Purchase {
  std::string id;
  std::string flight_id;

  // Copied from the converted hold, same order.
  std::vector<std::string> seats;

  std::string     customer;
  util::TimePoint purchased_at{};
  PurchaseStatus  status = PurchaseStatus::kActive;

  bool operator==(const Purchase&) const = default;
};

} // namespace seat::model
