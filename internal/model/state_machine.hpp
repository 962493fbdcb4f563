#pragma once

#include <cstdint>

namespace payday::model {

enum class PaymentStatus : std::uint8_t {
  kUnspecified = 0,
  kAwaitingPayment = 1,
  kInFlight = 2,
  kSettled = 3,
  kExpired = 4,
  kFailed = 5,
  kCanceled = 6,
};

constexpr bool IsTerminal(PaymentStatus status) {
  return status == PaymentStatus::kSettled || status == PaymentStatus::kExpired ||
         status == PaymentStatus::kFailed || status == PaymentStatus::kCanceled;
}

constexpr bool CanTransition(PaymentStatus from, PaymentStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case PaymentStatus::kUnspecified:
      return to == PaymentStatus::kAwaitingPayment || to == PaymentStatus::kInFlight;
    case PaymentStatus::kAwaitingPayment:
      return to == PaymentStatus::kSettled || to == PaymentStatus::kExpired || to == PaymentStatus::kFailed ||
             to == PaymentStatus::kCanceled;
    case PaymentStatus::kInFlight:
      return to == PaymentStatus::kSettled || to == PaymentStatus::kFailed;
    default:
      return false;
  }
}

}  // namespace payday::model
