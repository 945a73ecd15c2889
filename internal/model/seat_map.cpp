#include "seat_map.hpp"

#include <algorithm>
#include <stdexcept>

namespace seat::model {

SeatMap SeatMap::WithRows(int rows) {
  Entries entries;
  for (int row = 1; row <= rows; ++row) {
    for (char column : kSeatColumns) {
      entries.emplace(MakeSeatId(row, column), SeatStatus::kAvailable);
    }
  }
  return SeatMap(std::move(entries));
}

std::optional<SeatStatus> SeatMap::Get(const std::string& seat) const {
  auto it = entries_.find(seat);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

void SeatMap::Set(const std::string& seat, SeatStatus status) {
  auto it = entries_.find(seat);
  if (it == entries_.end()) {
    throw std::out_of_range("seat not in layout: " + seat);
  }
  it->second = status;
}

std::vector<std::string> SeatMap::Available() const {
  std::vector<std::string> seats;
  for (const auto& [seat, status] : entries_) {
    if (status == SeatStatus::kAvailable) seats.push_back(seat);
  }
  return seats;
}

std::size_t SeatMap::Count(SeatStatus status) const {
  return static_cast<std::size_t>(
      std::count_if(entries_.begin(), entries_.end(), [status](const auto& entry) { return entry.second == status; }));
}

int SeatMap::MaxRow() const {
  int max_row = 0;
  for (const auto& [seat, _] : entries_) {
    if (auto key = ParseSeat(seat)) max_row = std::max(max_row, key->row);
  }
  return max_row;
}

} // namespace seat::model
