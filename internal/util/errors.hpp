#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace seat::util {

/*
  Central error types.

  Every reservation failure is detected before the first mutation, so catching
  one of these means the inventory is exactly as it was before the call.
*/

enum class ErrorCode {
  kInvalidRequest,
  kInvalidSeat,
  kSeatUnavailable,
  kInsufficientInventory,
  kHoldNotFound,
  kHoldExpired,
  kHoldAlreadyConverted,
  kHoldNotActive,
  kSeatStateMismatch,
  kPurchaseNotFound,
  kPurchaseAlreadyCancelled,
  kPurchaseNotActive,
  kUnknownFlight,
  kAlreadyExists,
};

std::string_view ErrorCodeName(ErrorCode code);

class ReservationError : public std::runtime_error {
 public:
  ReservationError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

class InvalidRequest : public ReservationError {
 public:
  explicit InvalidRequest(const std::string& msg) : ReservationError(ErrorCode::kInvalidRequest, msg) {
  }
};

class InvalidSeat : public ReservationError {
 public:
  InvalidSeat(const std::string& flight_id, const std::string& seat)
      : ReservationError(ErrorCode::kInvalidSeat, "Invalid seat for this plane: " + seat + " (flight=" + flight_id + ")"), seat_(seat) {
  }

  const std::string& seat() const {
    return seat_;
  }

 private:
  std::string seat_;
};

class SeatUnavailable : public ReservationError {
 public:
  SeatUnavailable(const std::string& seat, std::string_view actual_status)
      : ReservationError(ErrorCode::kSeatUnavailable, "Seat not available: " + seat + " (status=" + std::string(actual_status) + ")"),
        seat_(seat),
        actual_status_(actual_status) {
  }

  const std::string& seat() const {
    return seat_;
  }
  const std::string& actual_status() const {
    return actual_status_;
  }

 private:
  std::string seat_;
  std::string actual_status_;
};

class InsufficientInventory : public ReservationError {
 public:
  InsufficientInventory(std::size_t requested, std::size_t available)
      : ReservationError(ErrorCode::kInsufficientInventory,
                         "Not enough available seats. Requested=" + std::to_string(requested) + ", available=" + std::to_string(available)),
        requested_(requested),
        available_(available) {
  }

  std::size_t requested() const {
    return requested_;
  }
  std::size_t available() const {
    return available_;
  }

 private:
  std::size_t requested_;
  std::size_t available_;
};

class HoldNotFound : public ReservationError {
 public:
  explicit HoldNotFound(const std::string& hold_id) : ReservationError(ErrorCode::kHoldNotFound, "Unknown hold_id: " + hold_id) {
  }
};

class HoldExpired : public ReservationError {
 public:
  explicit HoldExpired(const std::string& hold_id)
      : ReservationError(ErrorCode::kHoldExpired, "Hold is expired; cannot purchase (hold_id=" + hold_id + ")") {
  }
};

class HoldAlreadyConverted : public ReservationError {
 public:
  explicit HoldAlreadyConverted(const std::string& hold_id)
      : ReservationError(ErrorCode::kHoldAlreadyConverted, "Hold already converted to a purchase (hold_id=" + hold_id + ")") {
  }
};

class HoldNotActive : public ReservationError {
 public:
  HoldNotActive(const std::string& hold_id, std::string_view status)
      : ReservationError(ErrorCode::kHoldNotActive, "Hold not ACTIVE (hold_id=" + hold_id + ", status=" + std::string(status) + ")") {
  }
};

class SeatStateMismatch : public ReservationError {
 public:
  SeatStateMismatch(const std::string& seat, std::string_view expected, std::string_view actual)
      : ReservationError(ErrorCode::kSeatStateMismatch,
                         "Seat state mismatch for " + seat + ". Expected " + std::string(expected) + ", found " + std::string(actual) + "."),
        seat_(seat) {
  }

  const std::string& seat() const {
    return seat_;
  }

 private:
  std::string seat_;
};

class PurchaseNotFound : public ReservationError {
 public:
  explicit PurchaseNotFound(const std::string& purchase_id)
      : ReservationError(ErrorCode::kPurchaseNotFound, "Unknown purchase_id: " + purchase_id) {
  }
};

class PurchaseAlreadyCancelled : public ReservationError {
 public:
  explicit PurchaseAlreadyCancelled(const std::string& purchase_id)
      : ReservationError(ErrorCode::kPurchaseAlreadyCancelled, "Purchase already cancelled (purchase_id=" + purchase_id + ")") {
  }
};

class PurchaseNotActive : public ReservationError {
 public:
  PurchaseNotActive(const std::string& purchase_id, std::string_view status)
      : ReservationError(ErrorCode::kPurchaseNotActive,
                         "Purchase not ACTIVE (purchase_id=" + purchase_id + ", status=" + std::string(status) + ")") {
  }
};

class UnknownFlight : public ReservationError {
 public:
  explicit UnknownFlight(const std::string& flight_id) : ReservationError(ErrorCode::kUnknownFlight, "Unknown flight_id: " + flight_id) {
  }
};

class AlreadyExists : public ReservationError {
 public:
  explicit AlreadyExists(const std::string& msg) : ReservationError(ErrorCode::kAlreadyExists, msg) {
  }
};

} // namespace seat::util
