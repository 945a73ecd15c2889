#pragma once

#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace seat::model {

struct Hold {
  std::string id;
  std::string flight_id;

  // Request / assignment order.
  std::vector<std::string> seats;

  std::string     customer;
  util::TimePoint expires_at{};
  HoldStatus      status = HoldStatus::kActive;

  bool operator==(const Hold&) const = default;
};

} // namespace seat::model
