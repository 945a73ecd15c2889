#pragma once

#include <string>

#include "internal/model/seat_map.hpp"

namespace seat::render {

inline constexpr int kFallbackGridRows = 24;

// Highest row of the map, kFallbackGridRows for an empty map.
int GridRows(const model::SeatMap& seat_map);

/*
  ASCII seat grid, aisle between C and D:

    Row  A   B   C     D   E   F
    --------------------------------
      1  O   O   H     X   O   O

    Legend: O=AVAILABLE, H=HOLD, X=PURCHASED

  Seats missing from the map render as '?'.
*/
std::string FormatSeatGrid(const model::SeatMap& seat_map, int rows);

char SeatSymbol(model::SeatStatus status);

} // namespace seat::render
