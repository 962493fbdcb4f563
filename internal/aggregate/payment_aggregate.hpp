#pragma once

#include <cstdint>
#include <vector>

#include "internal/model/payment.hpp"
#include "payday/v1.hpp"

namespace payday::aggregate {

enum class ApplyOutcome {
  kApplied,
  // event recorded a fact the state already reflects; only last_sequence moves
  kNoop,
};

struct SequencedEvent {
  uint64_t                 sequence = 0;
  payday::v1::PaymentEvent event;
};

/*
  Payment reducer.

  Pure and deterministic: the same starting state and events always fold
  to the same Payment. Every rejection is a util::InvalidTransition carrying
  aggregate id, sequence and event type, logged at error level before it
  is thrown.

  Events must arrive with sequence == state.last_sequence + 1.
*/
ApplyOutcome Apply(model::Payment& state, const SequencedEvent& event);

// Folds events with sequence > state.last_sequence onto state (empty or a
// snapshot). Events at or below state.last_sequence are skipped.
model::Payment Replay(model::Payment state, const std::vector<SequencedEvent>& events);

} // namespace payday::aggregate
