#include "internal/aggregate/payment_aggregate.hpp"

#include <string>

#include "internal/aggregate/payment_codec.hpp"
#include "internal/eventstore/event_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace payday::aggregate {

namespace {

using model::Direction;
using model::PaymentStatus;
using payday::v1::PaymentEvent;

[[noreturn]] void Reject(const model::Payment& state, const SequencedEvent& event, const std::string& reason) {
  const std::string event_type =
      event.event.kind_case() == PaymentEvent::KIND_NOT_SET ? "" : eventstore::EventTypeName(event.event);
  PAYDAY_LOG_ERROR("invalid transition",
                   {observability::StringField("aggregate_id", state.id),
                    observability::IntField("sequence", static_cast<int64_t>(event.sequence)),
                    observability::StringField("event_type", event_type),
                    observability::StringField("status", model::ToString(state.status)),
                    observability::StringField("reason", reason)});
  throw util::InvalidTransition(state.id, event.sequence, event_type,
                                event_type + " at sequence " + std::to_string(event.sequence) + " on " + state.id +
                                    " (" + model::ToString(state.status) + "): " + reason);
}

void MoveTo(model::Payment& state, const SequencedEvent& event, PaymentStatus next) {
  if (!model::CanTransition(state.status, next)) {
    Reject(state, event, std::string("cannot move to ") + model::ToString(next));
  }
  state.status = next;
}

void RequireDirection(const model::Payment& state, const SequencedEvent& event, Direction direction) {
  if (state.direction != direction) {
    Reject(state, event, direction == Direction::kIncoming ? "invoice event on an outgoing payment"
                                                           : "payment event on an incoming invoice");
  }
}

// ---------------------------------------------------------------------------
// Incoming
// ---------------------------------------------------------------------------

ApplyOutcome ApplyInvoiceCreated(model::Payment& state, const SequencedEvent& event) {
  if (state.Exists()) {
    Reject(state, event, "invoice already created");
  }

  const auto& created    = event.event.invoice_created();
  state.amount_requested = created.amount_sat();
  state.expires_at_ms    = created.expires_at_ms();
  state.created_at_ms    = created.created_at_ms();
  state.node_id          = created.node_id();
  state.node_reference   = created.node_reference();
  state.payment_request  = created.payment_request();
  state.memo             = created.memo();
  state.onchain_address  = created.onchain_address();
  MoveTo(state, event, PaymentStatus::kAwaitingPayment);
  return ApplyOutcome::kApplied;
}

ApplyOutcome ApplyInvoiceSettled(model::Payment& state, const SequencedEvent& event) {
  const auto& settled = event.event.invoice_settled();

  if (model::IsTerminal(state.status)) {
    PAYDAY_LOG_WARN("settlement for terminal invoice ignored",
                    {observability::StringField("aggregate_id", state.id),
                     observability::StringField("status", model::ToString(state.status)),
                     observability::IntField("sequence", static_cast<int64_t>(event.sequence)),
                     observability::IntField("amount_sat", static_cast<int64_t>(settled.amount_sat()))});
    return ApplyOutcome::kNoop;
  }
  if (state.status != PaymentStatus::kAwaitingPayment) {
    Reject(state, event, "invoice is not awaiting payment");
  }

  state.amount_settled     = settled.amount_sat();
  state.settled_at_ms      = settled.settled_at_ms();
  state.settled_via        = FromProto(settled.source());
  state.transaction_id     = settled.transaction_id();
  state.pending_amount_sat = 0;

  // a Lightning HTLC cannot be partially settled; short on-chain payments fail the invoice
  if (settled.amount_sat() < state.amount_requested) {
    state.failure_reason = model::FailureReason::kUnderpaid;
    MoveTo(state, event, PaymentStatus::kFailed);
    return ApplyOutcome::kApplied;
  }

  state.overpaid = settled.amount_sat() > state.amount_requested;
  MoveTo(state, event, PaymentStatus::kSettled);
  return ApplyOutcome::kApplied;
}

ApplyOutcome ApplyInvoicePaymentPending(model::Payment& state, const SequencedEvent& event) {
  if (state.status != PaymentStatus::kAwaitingPayment) {
    Reject(state, event, "invoice is not awaiting payment");
  }
  if (state.onchain_address.empty()) {
    Reject(state, event, "invoice has no on-chain address");
  }

  const auto& pending          = event.event.invoice_payment_pending();
  state.pending_amount_sat     = pending.amount_sat();
  state.pending_transaction_id = pending.transaction_id();
  return ApplyOutcome::kApplied;
}

ApplyOutcome ApplyInvoiceExpired(model::Payment& state, const SequencedEvent& event) {
  if (state.status == PaymentStatus::kSettled || state.status == PaymentStatus::kExpired) {
    return ApplyOutcome::kNoop;
  }
  if (state.status != PaymentStatus::kAwaitingPayment) {
    Reject(state, event, "invoice is not awaiting payment");
  }

  if (state.pending_amount_sat > 0) {
    Reject(state, event, "on-chain payment " + state.pending_transaction_id + " is pending");
  }

  const auto at_ms = event.event.invoice_expired().at_ms();
  if (at_ms < state.expires_at_ms) {
    Reject(state, event,
           "expiry at " + std::to_string(at_ms) + " precedes expires_at " + std::to_string(state.expires_at_ms));
  }

  MoveTo(state, event, PaymentStatus::kExpired);
  return ApplyOutcome::kApplied;
}

ApplyOutcome ApplyInvoiceCanceled(model::Payment& state, const SequencedEvent& event) {
  if (state.status != PaymentStatus::kAwaitingPayment) {
    Reject(state, event, "only an invoice awaiting payment can be canceled");
  }
  MoveTo(state, event, PaymentStatus::kCanceled);
  return ApplyOutcome::kApplied;
}

// ---------------------------------------------------------------------------
// Outgoing
// ---------------------------------------------------------------------------

ApplyOutcome ApplyPaymentInitiated(model::Payment& state, const SequencedEvent& event) {
  if (state.Exists()) {
    Reject(state, event, "payment already initiated");
  }

  const auto& initiated  = event.event.payment_initiated();
  state.amount_requested = initiated.amount_sat();
  state.payment_request  = initiated.payment_request();
  state.node_id          = initiated.node_id();
  state.created_at_ms    = initiated.created_at_ms();
  MoveTo(state, event, PaymentStatus::kInFlight);
  return ApplyOutcome::kApplied;
}

ApplyOutcome ApplyPaymentInFlight(model::Payment& state, const SequencedEvent& event) {
  if (state.status != PaymentStatus::kInFlight) {
    Reject(state, event, "payment is not in flight");
  }
  state.node_reference = event.event.payment_in_flight().node_reference();
  return ApplyOutcome::kApplied;
}

// A payment takes exactly one outcome; repeated node reports are dropped before append.
ApplyOutcome ApplyPaymentSucceeded(model::Payment& state, const SequencedEvent& event) {
  if (state.status != PaymentStatus::kInFlight) {
    Reject(state, event, "payment is not in flight");
  }

  const auto& succeeded = event.event.payment_succeeded();
  state.amount_settled  = succeeded.amount_sat();
  state.fee_sat         = succeeded.fee_sat();
  state.preimage        = succeeded.preimage();
  state.settled_at_ms   = succeeded.settled_at_ms();
  state.settled_via     = model::SettlementSource::kLightning;
  MoveTo(state, event, PaymentStatus::kSettled);
  return ApplyOutcome::kApplied;
}

ApplyOutcome ApplyPaymentFailed(model::Payment& state, const SequencedEvent& event) {
  auto reason = FromProto(event.event.payment_failed().reason());
  if (reason == model::FailureReason::kUnspecified) {
    reason = model::FailureReason::kNodeError;
  }

  if (state.status != PaymentStatus::kInFlight) {
    Reject(state, event, "payment is not in flight");
  }

  state.failure_reason = reason;
  MoveTo(state, event, PaymentStatus::kFailed);
  return ApplyOutcome::kApplied;
}

} // namespace

ApplyOutcome Apply(model::Payment& state, const SequencedEvent& event) {
  if (event.sequence != state.last_sequence + 1) {
    Reject(state, event, "expected sequence " + std::to_string(state.last_sequence + 1));
  }

  ApplyOutcome outcome = ApplyOutcome::kNoop;
  switch (event.event.kind_case()) {
    case PaymentEvent::kInvoiceCreated:
      RequireDirection(state, event, Direction::kIncoming);
      outcome = ApplyInvoiceCreated(state, event);
      break;
    case PaymentEvent::kInvoiceSettled:
      RequireDirection(state, event, Direction::kIncoming);
      outcome = ApplyInvoiceSettled(state, event);
      break;
    case PaymentEvent::kInvoiceExpired:
      RequireDirection(state, event, Direction::kIncoming);
      outcome = ApplyInvoiceExpired(state, event);
      break;
    case PaymentEvent::kInvoiceCanceled:
      RequireDirection(state, event, Direction::kIncoming);
      outcome = ApplyInvoiceCanceled(state, event);
      break;
    case PaymentEvent::kInvoicePaymentPending:
      RequireDirection(state, event, Direction::kIncoming);
      outcome = ApplyInvoicePaymentPending(state, event);
      break;
    case PaymentEvent::kPaymentInitiated:
      RequireDirection(state, event, Direction::kOutgoing);
      outcome = ApplyPaymentInitiated(state, event);
      break;
    case PaymentEvent::kPaymentInFlight:
      RequireDirection(state, event, Direction::kOutgoing);
      outcome = ApplyPaymentInFlight(state, event);
      break;
    case PaymentEvent::kPaymentSucceeded:
      RequireDirection(state, event, Direction::kOutgoing);
      outcome = ApplyPaymentSucceeded(state, event);
      break;
    case PaymentEvent::kPaymentFailed:
      RequireDirection(state, event, Direction::kOutgoing);
      outcome = ApplyPaymentFailed(state, event);
      break;
    case PaymentEvent::KIND_NOT_SET:
      Reject(state, event, "event has no kind set");
  }

  state.last_sequence = event.sequence;
  return outcome;
}

model::Payment Replay(model::Payment state, const std::vector<SequencedEvent>& events) {
  for (const auto& event : events) {
    if (event.sequence <= state.last_sequence) {
      continue;
    }
    Apply(state, event);
  }
  return state;
}

} // namespace payday::aggregate
