#include "errors.hpp"

namespace seat::util {

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidRequest:
      return "InvalidRequest";
    case ErrorCode::kInvalidSeat:
      return "InvalidSeat";
    case ErrorCode::kSeatUnavailable:
      return "SeatUnavailable";
    case ErrorCode::kInsufficientInventory:
      return "InsufficientInventory";
    case ErrorCode::kHoldNotFound:
      return "HoldNotFound";
    case ErrorCode::kHoldExpired:
      return "HoldExpired";
    case ErrorCode::kHoldAlreadyConverted:
      return "HoldAlreadyConverted";
    case ErrorCode::kHoldNotActive:
      return "HoldNotActive";
    case ErrorCode::kSeatStateMismatch:
      return "SeatStateMismatch";
    case ErrorCode::kPurchaseNotFound:
      return "PurchaseNotFound";
    case ErrorCode::kPurchaseAlreadyCancelled:
      return "PurchaseAlreadyCancelled";
    case ErrorCode::kPurchaseNotActive:
      return "PurchaseNotActive";
    case ErrorCode::kUnknownFlight:
      return "UnknownFlight";
    case ErrorCode::kAlreadyExists:
      return "AlreadyExists";
  }
  return "Unknown";
}

} // namespace seat::util
