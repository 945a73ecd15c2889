#include "seat_id.hpp"

#include <cctype>
#include <tuple>

#include "internal/util/errors.hpp"

namespace seat::model {

namespace {

std::tuple<bool, int, std::string_view> SortKey(std::string_view seat) {
  const auto key = ParseSeat(seat);
  if (!key) {
    return {true, 0, seat};
  }
  return {false, key->row, seat.substr(seat.size() - 1)};
}

} // namespace

std::optional<SeatKey> ParseSeat(std::string_view seat) {
  if (seat.size() < 2) return std::nullopt;

  const char column = seat.back();
  if (kSeatColumns.find(column) == std::string_view::npos) return std::nullopt;

  const auto digits = seat.substr(0, seat.size() - 1);
  // up to 9 digits so the row always fits in an int
  if (digits.front() == '0' || digits.size() > 9) return std::nullopt;

  int row = 0;
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    row = row * 10 + (c - '0');
  }
  return SeatKey{row, column};
}

std::string MakeSeatId(int row, char column) {
  return std::to_string(row) + column;
}

std::string NormalizeSeat(std::string_view raw) {
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.front()))) raw.remove_prefix(1);
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back()))) raw.remove_suffix(1);
  if (raw.empty()) {
    throw util::InvalidRequest("Empty seat.");
  }

  std::string seat(raw);
  for (auto& c : seat) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return seat;
}

bool SeatOrder::operator()(const std::string& lhs, const std::string& rhs) const {
  return SortKey(lhs) < SortKey(rhs);
}

} // namespace seat::model
