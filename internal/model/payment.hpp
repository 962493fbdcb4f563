#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "internal/model/state_machine.hpp"

namespace payday::model {

enum class Direction : std::uint8_t {
  kUnspecified = 0,
  kIncoming = 1,
  kOutgoing = 2,
};

enum class FailureReason : std::uint8_t {
  kUnspecified = 0,
  kUnderpaid = 1,
  kRouteNotFound = 2,
  kInsufficientBalance = 3,
  kTimeout = 4,
  kNodeError = 5,
};

enum class SettlementSource : std::uint8_t {
  kUnspecified = 0,
  kLightning = 1,
  kOnChain = 2,
};

// Aggregate type names used as the stream key in the event log.
inline constexpr std::string_view kInvoiceAggregate = "Invoice";
inline constexpr std::string_view kPaymentAggregate = "Payment";

/*
  Current state of one invoice (incoming) or payment (outgoing).

  Owned by its event stream: the only way to produce one is to fold the
  stream's events, starting from Empty() or a snapshot.
*/
struct Payment {
  std::string id;
  Direction direction = Direction::kUnspecified;
  PaymentStatus status = PaymentStatus::kUnspecified;

  std::uint64_t amount_requested = 0;
  std::uint64_t amount_settled = 0;

  std::string node_id;
  std::string node_reference;
  std::string payment_request;
  std::string memo;
  std::string onchain_address;

  std::uint64_t expires_at_ms = 0;
  std::uint64_t created_at_ms = 0;
  std::optional<std::uint64_t> settled_at_ms;
  std::optional<FailureReason> failure_reason;
  bool overpaid = false;

  std::uint64_t fee_sat = 0;
  std::string preimage;
  SettlementSource settled_via = SettlementSource::kUnspecified;
  std::string transaction_id;

  // on-chain payment seen but not yet confirmed
  std::uint64_t pending_amount_sat = 0;
  std::string pending_transaction_id;

  // sequence of the last event folded in; 0 for an aggregate with no events
  std::uint64_t last_sequence = 0;

  bool Exists() const {
    return last_sequence > 0;
  }

  bool operator==(const Payment&) const = default;
};

inline Payment EmptyPayment(std::string id, Direction direction) {
  Payment payment;
  payment.id = std::move(id);
  payment.direction = direction;
  return payment;
}

inline std::string AggregateType(Direction direction) {
  return std::string(direction == Direction::kOutgoing ? kPaymentAggregate : kInvoiceAggregate);
}

inline std::optional<Direction> DirectionFromAggregateType(std::string_view aggregate_type) {
  if (aggregate_type == kInvoiceAggregate) {
    return Direction::kIncoming;
  }
  if (aggregate_type == kPaymentAggregate) {
    return Direction::kOutgoing;
  }
  return std::nullopt;
}

constexpr const char* ToString(PaymentStatus status) {
  switch (status) {
    case PaymentStatus::kAwaitingPayment:
      return "awaiting_payment";
    case PaymentStatus::kInFlight:
      return "in_flight";
    case PaymentStatus::kSettled:
      return "settled";
    case PaymentStatus::kExpired:
      return "expired";
    case PaymentStatus::kFailed:
      return "failed";
    case PaymentStatus::kCanceled:
      return "canceled";
    default:
      return "unspecified";
  }
}

constexpr const char* ToString(FailureReason reason) {
  switch (reason) {
    case FailureReason::kUnderpaid:
      return "underpaid";
    case FailureReason::kRouteNotFound:
      return "route_not_found";
    case FailureReason::kInsufficientBalance:
      return "insufficient_balance";
    case FailureReason::kTimeout:
      return "timeout";
    case FailureReason::kNodeError:
      return "node_error";
    default:
      return "unspecified";
  }
}

}  // namespace payday::model
