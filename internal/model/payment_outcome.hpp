#pragma once

#include <cstdint>
#include <string>

#include "internal/model/payment.hpp"

namespace payday::model {

enum class OutcomeStatus : std::uint8_t {
  kInFlight = 0,
  kSucceeded = 1,
  kFailed = 2,
};

// What a node reports about an outgoing payment.
struct PaymentOutcome {
  OutcomeStatus status = OutcomeStatus::kInFlight;
  std::string node_reference;
  std::uint64_t amount_sat = 0;
  std::uint64_t fee_sat = 0;
  std::string preimage;
  FailureReason reason = FailureReason::kUnspecified;
  std::string message;
  std::uint64_t at_ms = 0;
};

}  // namespace payday::model
