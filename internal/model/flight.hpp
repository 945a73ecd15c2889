#pragma once

#include <string>

#include "internal/model/seat_map.hpp"
#include "internal/util/time.hpp"

namespace seat::model {

struct Flight {
  std::string id;

  std::string departure_city;
  std::string arrival_city;
  std::string departure_airport;
  std::string arrival_airport;

  util::TimePoint departure_at{};
  util::TimePoint arrival_at{};

  // "YYYY-MM-DD" of departure, matched exactly by date searches.
  std::string departure_date;

  SeatMap seat_map;

  bool operator==(const Flight&) const = default;
};

} // namespace seat::model
