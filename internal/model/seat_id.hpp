#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace seat::model {

/*
  Seat identifiers: row number followed by a column letter, e.g. "14A".
  Every flight uses the six-abreast A-F layout.
*/

inline constexpr std::string_view kSeatColumns = "ABCDEF";

struct SeatKey {
  int  row    = 0;
  char column = 'A';
};

// Strict parse of a normalized identifier; rejects row 0, leading zeros, rows
// longer than 9 digits and columns outside A-F.
std::optional<SeatKey> ParseSeat(std::string_view seat);

std::string MakeSeatId(int row, char column);

// Trims and upper-cases; throws util::InvalidRequest on an empty identifier.
std::string NormalizeSeat(std::string_view raw);

// Orders by (row, column) so "2A" < "10A". Identifiers that do not parse sort
// after valid ones by their text, which keeps the ordering total.
struct SeatOrder {
  bool operator()(const std::string& lhs, const std::string& rhs) const;
};

} // namespace seat::model
