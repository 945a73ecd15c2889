#include "seat_grid.hpp"

#include <iomanip>
#include <sstream>

namespace seat::render {

int GridRows(const model::SeatMap& seat_map) {
  const int rows = seat_map.MaxRow();
  return rows > 0 ? rows : kFallbackGridRows;
}

char SeatSymbol(model::SeatStatus status) {
  switch (status) {
    case model::SeatStatus::kAvailable:
      return 'O';
    case model::SeatStatus::kHeld:
      return 'H';
    case model::SeatStatus::kPurchased:
      return 'X';
  }
  return '?';
}

std::string FormatSeatGrid(const model::SeatMap& seat_map, int rows) {
  std::ostringstream out;
  out << "Row  A   B   C     D   E   F\n";
  out << "--------------------------------\n";

  for (int row = 1; row <= rows; ++row) {
    out << std::setw(3) << row << " ";
    for (std::size_t col = 0; col < model::kSeatColumns.size(); ++col) {
      const auto status = seat_map.Get(model::MakeSeatId(row, model::kSeatColumns[col]));
      // aisle
      out << (col == 3 ? "     " : (col == 0 ? " " : "   "));
      out << (status ? SeatSymbol(*status) : '?');
    }
    out << "\n";
  }

  out << "\n";
  out << "Legend: O=AVAILABLE, H=HOLD, X=PURCHASED";
  return out.str();
}

} // namespace seat::render
