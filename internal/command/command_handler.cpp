#include "internal/command/command_handler.hpp"

#include <utility>

#include "internal/aggregate/payment_aggregate.hpp"
#include "internal/aggregate/payment_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace payday::command {

namespace {

using model::Direction;
using model::PaymentStatus;
using payday::v1::PaymentEvent;

void RequireId(const std::string& id, const char* what) {
  if (id.empty()) {
    throw util::InvalidArgument(std::string(what) + ": id is required");
  }
}

void RequireExists(const model::Payment& state, const char* what) {
  if (!state.Exists()) {
    throw util::NotFound(std::string(what) + ": " + state.id + " not found");
  }
}

[[noreturn]] void ThrowInvalidState(const model::Payment& state, const std::string& what) {
  throw util::InvalidState(what + ": " + state.id + " is " + model::ToString(state.status));
}

// References a node notification may carry for this aggregate.
std::vector<std::string> ReferencesOf(const std::vector<PaymentEvent>& events) {
  std::vector<std::string> references;
  for (const auto& event : events) {
    switch (event.kind_case()) {
      case PaymentEvent::kInvoiceCreated:
        references.push_back(event.invoice_created().node_reference());
        references.push_back(event.invoice_created().onchain_address());
        break;
      case PaymentEvent::kPaymentInitiated:
        references.push_back(event.payment_initiated().payment_request());
        break;
      case PaymentEvent::kPaymentInFlight:
        references.push_back(event.payment_in_flight().node_reference());
        break;
      default:
        break;
    }
  }
  return references;
}

// Events that record outcome on an outgoing payment in state.
std::vector<PaymentEvent> DecidePaymentOutcome(const model::Payment& state, const model::PaymentOutcome& outcome,
                                               uint64_t now_ms) {
  std::vector<PaymentEvent> events;
  const bool new_reference = !outcome.node_reference.empty() && outcome.node_reference != state.node_reference;
  const auto at_ms         = outcome.at_ms == 0 ? now_ms : outcome.at_ms;

  switch (outcome.status) {
    case model::OutcomeStatus::kInFlight:
      if (state.status != PaymentStatus::kInFlight || !new_reference) {
        return events;
      }
      events.emplace_back().mutable_payment_in_flight()->set_node_reference(outcome.node_reference);
      return events;

    case model::OutcomeStatus::kSucceeded: {
      if (state.status == PaymentStatus::kSettled) {
        return events;
      }
      if (state.status != PaymentStatus::kInFlight) {
        ThrowInvalidState(state, "node reports success");
      }
      if (new_reference) {
        events.emplace_back().mutable_payment_in_flight()->set_node_reference(outcome.node_reference);
      }
      auto* succeeded = events.emplace_back().mutable_payment_succeeded();
      succeeded->set_amount_sat(outcome.amount_sat == 0 ? state.amount_requested : outcome.amount_sat);
      succeeded->set_fee_sat(outcome.fee_sat);
      succeeded->set_preimage(outcome.preimage);
      succeeded->set_settled_at_ms(at_ms);
      return events;
    }

    case model::OutcomeStatus::kFailed: {
      const auto reason =
          outcome.reason == model::FailureReason::kUnspecified ? model::FailureReason::kNodeError : outcome.reason;
      if (state.status == PaymentStatus::kFailed && state.failure_reason == reason) {
        return events;
      }
      if (state.status != PaymentStatus::kInFlight) {
        ThrowInvalidState(state, std::string("node reports failure (") + model::ToString(reason) + ")");
      }
      auto* failed = events.emplace_back().mutable_payment_failed();
      failed->set_reason(aggregate::ToProto(reason));
      failed->set_message(outcome.message);
      failed->set_at_ms(at_ms);
      return events;
    }
  }
  return events;
}

} // namespace

CommandHandler::CommandHandler(std::shared_ptr<eventstore::EventStore>    events,
                               std::shared_ptr<eventstore::SnapshotStore> snapshots,
                               std::shared_ptr<node::LightningNode>       node,
                               CommandHandlerOptions                      options,
                               util::NowFn                                now,
                               std::shared_ptr<chain::OnChainMonitor>     chain)
    : events_(std::move(events)),
      snapshots_(std::move(snapshots)),
      node_(std::move(node)),
      options_(options),
      now_(std::move(now)),
      chain_(std::move(chain)) {
  if (options_.max_append_attempts == 0) {
    options_.max_append_attempts = 1;
  }
}

CommandResult CommandHandler::Handle(const Command& command, const eventstore::EventMetadata& metadata) {
  return std::visit([&](const auto& concrete) { return Handle(concrete, metadata); }, command);
}

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

model::Payment CommandHandler::Load(model::Direction direction, const std::string& id) const {
  const auto aggregate_type = model::AggregateType(direction);
  auto       state          = model::EmptyPayment(id, direction);

  if (auto snapshot = snapshots_->Latest(aggregate_type, id)) {
    try {
      state = aggregate::DecodeSnapshot(snapshot->payload);
    } catch (const util::StorageError& e) {
      // snapshots are a cache; the stream is the truth
      PAYDAY_LOG_WARN("ignoring unreadable snapshot", {observability::StringField("aggregate_id", id),
                                                       observability::IntField("last_sequence", static_cast<int64_t>(snapshot->last_sequence)),
                                                       observability::StringField("error", e.what())});
      state = model::EmptyPayment(id, direction);
    }
  }

  auto cursor = events_->Load(aggregate_type, id, state.last_sequence);
  while (auto record = cursor.Next()) {
    aggregate::Apply(state, {record->sequence, eventstore::DecodeEvent(*record)});
  }
  return state;
}

// ---------------------------------------------------------------------------
// Decide / append / retry
// ---------------------------------------------------------------------------

CommandResult CommandHandler::Execute(model::Direction direction, const std::string& id, const Decision& decide,
                                      eventstore::EventMetadata metadata) {
  if (metadata.correlation_id.empty()) {
    metadata.correlation_id = util::NewId();
  }
  const auto aggregate_type = model::AggregateType(direction);

  for (uint32_t attempt = 1; attempt <= options_.max_append_attempts; ++attempt) {
    auto state    = Load(direction, id);
    auto proposed = decide(state);

    CommandResult result;
    if (proposed.empty()) {
      result.noop  = true;
      result.state = std::move(state);
      return result;
    }

    // reject locally before touching the log
    auto next = state;
    for (size_t i = 0; i < proposed.size(); ++i) {
      aggregate::Apply(next, {state.last_sequence + i + 1, proposed[i]});
    }

    std::vector<db::model::EventRecord> records;
    records.reserve(proposed.size());
    for (const auto& event : proposed) {
      records.push_back(eventstore::EncodeEvent(event, metadata));
    }

    try {
      result.events = events_->Append(aggregate_type, id, state.last_sequence, std::move(records), ReferencesOf(proposed));
    } catch (const util::ConcurrencyConflict& e) {
      PAYDAY_LOG_WARN("append conflict, reloading", {observability::StringField("aggregate_id", id),
                                                     observability::IntField("expected_sequence", static_cast<int64_t>(e.expected_sequence())),
                                                     observability::IntField("attempt", attempt)});
      continue;
    }

    MaybeSnapshot(next, state.last_sequence);
    result.state = std::move(next);
    return result;
  }

  throw util::CommandConflict(aggregate_type + "/" + id + ": gave up after " +
                              std::to_string(options_.max_append_attempts) + " conflicting appends");
}

void CommandHandler::MaybeSnapshot(const model::Payment& state, uint64_t previous_sequence) {
  if (options_.snapshot_every == 0) {
    return;
  }
  if (state.last_sequence / options_.snapshot_every == previous_sequence / options_.snapshot_every) {
    return;
  }

  try {
    db::model::SnapshotRecord snapshot;
    snapshot.aggregate_type = model::AggregateType(state.direction);
    snapshot.aggregate_id   = state.id;
    snapshot.last_sequence  = state.last_sequence;
    snapshot.payload        = aggregate::EncodeSnapshot(state);
    snapshots_->Save(std::move(snapshot));
  } catch (const std::exception& e) {
    PAYDAY_LOG_WARN("snapshot failed", {observability::StringField("aggregate_id", state.id),
                                        observability::IntField("last_sequence", static_cast<int64_t>(state.last_sequence)),
                                        observability::StringField("error", e.what())});
  }
}

// ---------------------------------------------------------------------------
// Incoming
// ---------------------------------------------------------------------------

CommandResult CommandHandler::Handle(const CreateInvoice& command, const eventstore::EventMetadata& metadata) {
  RequireId(command.invoice_id, "create invoice");
  if (command.amount_sat == 0) {
    throw util::InvalidArgument("create invoice: amount must be positive");
  }
  if (command.expiry_seconds == 0) {
    throw util::InvalidArgument("create invoice: expiry must be positive");
  }
  if (command.expiry_seconds > kMaxExpirySeconds) {
    throw util::InvalidArgument("create invoice: expiry must not exceed " + std::to_string(kMaxExpirySeconds) +
                                " seconds");
  }

  if (command.on_chain && !chain_) {
    throw util::InvalidState("create invoice: no chain monitor configured for on-chain payment");
  }

  if (Load(Direction::kIncoming, command.invoice_id).Exists()) {
    throw util::AlreadyExists("create invoice: " + command.invoice_id + " already exists");
  }

  const auto created = node_->CreateInvoice(command.amount_sat, command.expiry_seconds, command.memo);
  const auto address = command.on_chain ? chain_->NewAddress() : std::string();
  const auto now_ms  = now_();

  return Execute(Direction::kIncoming, command.invoice_id, [&](const model::Payment& state) {
    if (state.Exists()) {
      throw util::AlreadyExists("create invoice: " + command.invoice_id + " already exists");
    }

    std::vector<PaymentEvent> events;
    auto* event = events.emplace_back().mutable_invoice_created();
    event->set_amount_sat(command.amount_sat);
    event->set_created_at_ms(now_ms);
    event->set_expires_at_ms(now_ms + command.expiry_seconds * 1000);
    event->set_node_id(node_->NodeId());
    event->set_node_reference(created.node_reference);
    event->set_payment_request(created.payment_request);
    event->set_memo(command.memo);
    event->set_onchain_address(address);
    return events;
  }, metadata);
}

CommandResult CommandHandler::Handle(const CancelInvoice& command, const eventstore::EventMetadata& metadata) {
  RequireId(command.invoice_id, "cancel invoice");
  const auto now_ms = now_();

  return Execute(Direction::kIncoming, command.invoice_id, [&](const model::Payment& state) {
    RequireExists(state, "cancel invoice");

    std::vector<PaymentEvent> events;
    if (state.status == PaymentStatus::kCanceled) {
      return events;
    }
    if (state.status != PaymentStatus::kAwaitingPayment) {
      ThrowInvalidState(state, "cancel invoice");
    }

    auto* event = events.emplace_back().mutable_invoice_canceled();
    event->set_reason(command.reason);
    event->set_at_ms(now_ms);
    return events;
  }, metadata);
}

CommandResult CommandHandler::Handle(const ExpireInvoice& command, const eventstore::EventMetadata& metadata) {
  RequireId(command.invoice_id, "expire invoice");
  const auto at_ms = command.at_ms == 0 ? now_() : command.at_ms;

  return Execute(Direction::kIncoming, command.invoice_id, [&](const model::Payment& state) {
    RequireExists(state, "expire invoice");

    std::vector<PaymentEvent> events;
    // settled, canceled or failed first: the expiry has nothing left to close
    if (model::IsTerminal(state.status)) {
      return events;
    }
    // funds are on their way; the confirmation settles or fails the invoice
    if (state.pending_amount_sat > 0) {
      PAYDAY_LOG_DEBUG("expiry deferred for pending payment",
                       {observability::StringField("aggregate_id", state.id),
                        observability::StringField("transaction_id", state.pending_transaction_id)});
      return events;
    }
    if (at_ms < state.expires_at_ms) {
      throw util::InvalidState("expire invoice: " + state.id + " expires at " + std::to_string(state.expires_at_ms));
    }

    events.emplace_back().mutable_invoice_expired()->set_at_ms(at_ms);
    return events;
  }, metadata);
}

CommandResult CommandHandler::Handle(const SettleInvoice& command, const eventstore::EventMetadata& metadata) {
  RequireId(command.invoice_id, "settle invoice");
  if (command.amount_sat == 0) {
    throw util::InvalidArgument("settle invoice: amount must be positive");
  }
  const auto settled_at_ms = command.settled_at_ms == 0 ? now_() : command.settled_at_ms;

  return Execute(Direction::kIncoming, command.invoice_id, [&](const model::Payment& state) {
    RequireExists(state, "settle invoice");

    std::vector<PaymentEvent> events;
    if (state.status == PaymentStatus::kSettled) {
      PAYDAY_LOG_INFO("settlement already recorded", {observability::StringField("aggregate_id", state.id),
                                                      observability::IntField("amount_sat", static_cast<int64_t>(command.amount_sat))});
      return events;
    }
    if (model::IsTerminal(state.status)) {
      // paid after close; left for a manual refund
      PAYDAY_LOG_WARN("settlement for closed invoice ignored",
                      {observability::StringField("aggregate_id", state.id),
                       observability::StringField("status", model::ToString(state.status)),
                       observability::IntField("amount_sat", static_cast<int64_t>(command.amount_sat)),
                       observability::StringField("transaction_id", command.transaction_id)});
      return events;
    }

    auto* event = events.emplace_back().mutable_invoice_settled();
    event->set_amount_sat(command.amount_sat);
    event->set_settled_at_ms(settled_at_ms);
    event->set_source(command.source == model::SettlementSource::kOnChain ? payday::v1::SETTLEMENT_SOURCE_ONCHAIN
                                                                          : payday::v1::SETTLEMENT_SOURCE_LIGHTNING);
    event->set_transaction_id(command.transaction_id);
    event->set_confirmations(command.confirmations);
    return events;
  }, metadata);
}

CommandResult CommandHandler::Handle(const RecordPendingPayment& command, const eventstore::EventMetadata& metadata) {
  RequireId(command.invoice_id, "record pending payment");
  if (command.amount_sat == 0) {
    throw util::InvalidArgument("record pending payment: amount must be positive");
  }
  const auto at_ms = command.at_ms == 0 ? now_() : command.at_ms;

  return Execute(Direction::kIncoming, command.invoice_id, [&](const model::Payment& state) {
    RequireExists(state, "record pending payment");

    std::vector<PaymentEvent> events;
    // later sightings of the same payment, or a closed invoice, change nothing
    if (model::IsTerminal(state.status) || state.pending_amount_sat > 0) {
      return events;
    }
    if (state.onchain_address.empty()) {
      ThrowInvalidState(state, "record pending payment (no on-chain address)");
    }

    auto* event = events.emplace_back().mutable_invoice_payment_pending();
    event->set_amount_sat(command.amount_sat);
    event->set_transaction_id(command.transaction_id);
    event->set_at_ms(at_ms);
    return events;
  }, metadata);
}

// ---------------------------------------------------------------------------
// Outgoing
// ---------------------------------------------------------------------------

CommandResult CommandHandler::Handle(const SendPayment& command, const eventstore::EventMetadata& metadata) {
  RequireId(command.payment_id, "send payment");
  if (command.payment_request.empty()) {
    throw util::InvalidArgument("send payment: payment request is required");
  }
  if (command.amount_sat == 0) {
    throw util::InvalidArgument("send payment: amount must be positive");
  }

  const auto now_ms    = now_();
  auto       initiated = Execute(Direction::kOutgoing, command.payment_id, [&](const model::Payment& state) {
    if (state.Exists()) {
      throw util::AlreadyExists("send payment: " + command.payment_id + " already exists; retry with a new id");
    }

    std::vector<PaymentEvent> events;
    auto* event = events.emplace_back().mutable_payment_initiated();
    event->set_amount_sat(command.amount_sat);
    event->set_payment_request(command.payment_request);
    event->set_node_id(node_->NodeId());
    event->set_created_at_ms(now_ms);
    return events;
  }, metadata);

  // the attempt is durable; whatever the node does from here is recoverable
  model::PaymentOutcome outcome;
  try {
    outcome = node_->Pay(command.payment_request, command.amount_sat);
  } catch (const util::NodeError& e) {
    model::PaymentOutcome failed;
    failed.status  = model::OutcomeStatus::kFailed;
    failed.reason  = model::FailureReason::kNodeError;
    failed.message = e.what();
    Handle(RecordPaymentResult{command.payment_id, failed}, metadata);
    throw;
  }

  auto recorded = Handle(RecordPaymentResult{command.payment_id, outcome}, metadata);

  CommandResult result;
  result.events = std::move(initiated.events);
  result.events.insert(result.events.end(), recorded.events.begin(), recorded.events.end());
  result.state = std::move(recorded.state);
  return result;
}

CommandResult CommandHandler::Handle(const RecordPaymentResult& command, const eventstore::EventMetadata& metadata) {
  RequireId(command.payment_id, "record payment result");
  const auto now_ms = now_();

  return Execute(Direction::kOutgoing, command.payment_id, [&](const model::Payment& state) {
    RequireExists(state, "record payment result");
    return DecidePaymentOutcome(state, command.outcome, now_ms);
  }, metadata);
}

} // namespace payday::command
