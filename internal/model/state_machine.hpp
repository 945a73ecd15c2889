#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace seat::model {

/*
  Status variants for seats, holds and purchases.

  The string forms are the persisted representation and must not change.

  Seat lifecycle (derived from hold/purchase state, never skips a step):

    Available --reserve--> Held --convert--> Purchased --cancel--> Available
                           Held --sweep----> Available
*/

enum class SeatStatus : std::uint8_t {
  kAvailable = 0,
  kHeld      = 1,
  kPurchased = 2,
};

enum class HoldStatus : std::uint8_t {
  kActive    = 0,
  kExpired   = 1,
  kConverted = 2,
};

enum class PurchaseStatus : std::uint8_t {
  kActive    = 0,
  kCancelled = 1,
};

constexpr std::string_view ToString(SeatStatus status) {
  switch (status) {
    case SeatStatus::kAvailable:
      return "AVAILABLE";
    case SeatStatus::kHeld:
      return "HOLD";
    case SeatStatus::kPurchased:
      return "PURCHASED";
  }
  return "UNKNOWN";
}

constexpr std::string_view ToString(HoldStatus status) {
  switch (status) {
    case HoldStatus::kActive:
      return "ACTIVE";
    case HoldStatus::kExpired:
      return "EXPIRED";
    case HoldStatus::kConverted:
      return "CONVERTED";
  }
  return "UNKNOWN";
}

constexpr std::string_view ToString(PurchaseStatus status) {
  switch (status) {
    case PurchaseStatus::kActive:
      return "ACTIVE";
    case PurchaseStatus::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

constexpr std::optional<SeatStatus> ParseSeatStatus(std::string_view value) {
  if (value == "AVAILABLE") return SeatStatus::kAvailable;
  if (value == "HOLD") return SeatStatus::kHeld;
  if (value == "PURCHASED") return SeatStatus::kPurchased;
  return std::nullopt;
}

constexpr std::optional<HoldStatus> ParseHoldStatus(std::string_view value) {
  if (value == "ACTIVE") return HoldStatus::kActive;
  if (value == "EXPIRED") return HoldStatus::kExpired;
  if (value == "CONVERTED") return HoldStatus::kConverted;
  return std::nullopt;
}

constexpr std::optional<PurchaseStatus> ParsePurchaseStatus(std::string_view value) {
  if (value == "ACTIVE") return PurchaseStatus::kActive;
  if (value == "CANCELLED") return PurchaseStatus::kCancelled;
  return std::nullopt;
}

constexpr bool IsTerminal(HoldStatus status) {
  return status == HoldStatus::kExpired || status == HoldStatus::kConverted;
}

constexpr bool CanTransition(SeatStatus from, SeatStatus to) {
  switch (from) {
    case SeatStatus::kAvailable:
      return to == SeatStatus::kHeld;
    case SeatStatus::kHeld:
      return to == SeatStatus::kAvailable || to == SeatStatus::kPurchased;
    case SeatStatus::kPurchased:
      return to == SeatStatus::kAvailable;
  }
  return false;
}

constexpr bool CanTransition(HoldStatus from, HoldStatus to) {
  return from == HoldStatus::kActive && IsTerminal(to);
}

constexpr bool CanTransition(PurchaseStatus from, PurchaseStatus to) {
  return from == PurchaseStatus::kActive && to == PurchaseStatus::kCancelled;
}

} // namespace seat::model
