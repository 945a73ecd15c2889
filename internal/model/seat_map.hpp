#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/seat_id.hpp"
#include "internal/model/state_machine.hpp"

namespace seat::model {

/*
  Per-flight seat -> status table.

  The key set is fixed when the flight is created; Set() only ever changes the
  status of an existing seat. No validation of transitions happens here, callers
  check prior status before writing.
*/
class SeatMap {
 public:
  using Entries = std::map<std::string, SeatStatus, SeatOrder>;

  SeatMap() = default;
  explicit SeatMap(Entries entries) : entries_(std::move(entries)) {
  }

  // rows x A-F, all available.
  static SeatMap WithRows(int rows);

  std::optional<SeatStatus> Get(const std::string& seat) const;

  // Throws std::out_of_range for a seat outside the layout.
  void Set(const std::string& seat, SeatStatus status);

  bool Contains(const std::string& seat) const {
    return entries_.find(seat) != entries_.end();
  }

  // Available seats in (row, column) order.
  std::vector<std::string> Available() const;

  std::size_t Count(SeatStatus status) const;

  // Highest row number present, 0 for an empty map.
  int MaxRow() const;

  const Entries& entries() const {
    return entries_;
  }
  std::size_t size() const {
    return entries_.size();
  }

  bool operator==(const SeatMap&) const = default;

 private:
  Entries entries_;
};

} // namespace seat::model
