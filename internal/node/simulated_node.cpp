#include "internal/node/simulated_node.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace payday::node {

SimulatedNode::SimulatedNode(SimulatedNodeOptions options, util::NowFn now)
    : options_(std::move(options)), now_(std::move(now)) {
}

std::string SimulatedNode::NodeId() const {
  return options_.node_id;
}

void SimulatedNode::ThrowIfFailing() {
  if (fail_next_.has_value()) {
    auto message = std::move(*fail_next_);
    fail_next_.reset();
    throw util::NodeError(options_.node_id + ": " + message);
  }
}

CreatedInvoice SimulatedNode::CreateInvoice(uint64_t amount_sat, uint64_t expiry_seconds, const std::string& memo) {
  std::lock_guard lock(mutex_);
  ThrowIfFailing();

  CreatedInvoice created;
  created.node_reference  = util::NewId();
  created.payment_request = "lnsim" + std::to_string(amount_sat) + "n1" + created.node_reference;
  invoices_[created.node_reference] = Invoice{amount_sat, false};

  PAYDAY_LOG_DEBUG("simulated invoice created", {observability::StringField("node_reference", created.node_reference),
                                                 observability::IntField("expiry_seconds", static_cast<int64_t>(expiry_seconds)),
                                                 observability::StringField("memo", memo)});
  return created;
}

model::PaymentOutcome SimulatedNode::Pay(const std::string& payment_request, uint64_t amount_sat) {
  std::lock_guard lock(mutex_);
  pay_requests_.push_back(payment_request);
  ThrowIfFailing();

  model::PaymentOutcome outcome;
  outcome.node_reference = "simpay-" + util::NewId();
  outcome.amount_sat     = amount_sat;

  if (auto it = scripted_outcomes_.find(payment_request); it != scripted_outcomes_.end()) {
    auto scripted           = it->second;
    scripted.node_reference = scripted.node_reference.empty() ? outcome.node_reference : scripted.node_reference;
    if (scripted.amount_sat == 0) {
      scripted.amount_sat = amount_sat;
    }
    outcome = scripted;
  } else {
    outcome.status   = model::OutcomeStatus::kSucceeded;
    outcome.fee_sat  = options_.fee_sat;
    outcome.preimage = util::NewId();
  }
  outcome.at_ms = now_();

  requests_[payment_request] = outcome.node_reference;
  payments_[outcome.node_reference] = outcome;

  if (options_.async_payments && outcome.status != model::OutcomeStatus::kInFlight) {
    pending_.push_back(outcome.node_reference);
    model::PaymentOutcome in_flight;
    in_flight.status         = model::OutcomeStatus::kInFlight;
    in_flight.node_reference = outcome.node_reference;
    in_flight.amount_sat     = amount_sat;
    in_flight.at_ms          = outcome.at_ms;
    return in_flight;
  }
  return outcome;
}

void SimulatedNode::SubscribeSettlements(uint64_t from_settle_index, reconcile::NotificationSink sink) {
  std::vector<reconcile::InvoiceSettlement> backlog;
  {
    std::lock_guard lock(mutex_);
    ThrowIfFailing();
    for (const auto& settlement : settlements_) {
      if (settlement.settle_index > from_settle_index) {
        backlog.push_back(settlement);
      }
    }
    settlement_sink_ = sink;
  }

  for (auto& settlement : backlog) {
    sink(std::move(settlement));
  }
}

void SimulatedNode::SubscribePaymentUpdates(reconcile::NotificationSink sink) {
  std::lock_guard lock(mutex_);
  payment_sink_ = std::move(sink);
}

std::optional<model::PaymentOutcome> SimulatedNode::GetPaymentStatus(const std::string& reference) {
  std::lock_guard lock(mutex_);
  ThrowIfFailing();

  auto node_reference = reference;
  if (auto it = requests_.find(reference); it != requests_.end()) {
    node_reference = it->second;
  }

  auto it = payments_.find(node_reference);
  if (it == payments_.end()) {
    return std::nullopt;
  }
  for (const auto& pending : pending_) {
    if (pending == node_reference) {
      model::PaymentOutcome in_flight = it->second;
      in_flight.status                = model::OutcomeStatus::kInFlight;
      return in_flight;
    }
  }
  return it->second;
}

uint64_t SimulatedNode::SimulateIncomingPayment(const std::string& node_reference, uint64_t amount_sat) {
  reconcile::InvoiceSettlement settlement;
  reconcile::NotificationSink  sink;
  {
    std::lock_guard lock(mutex_);
    auto            it = invoices_.find(node_reference);
    if (it == invoices_.end()) {
      throw util::NodeError("unknown invoice " + node_reference);
    }
    it->second.settled = true;

    settlement.node_id        = options_.node_id;
    settlement.node_reference = node_reference;
    settlement.amount_sat     = amount_sat;
    settlement.settled_at_ms  = now_();
    settlement.settle_index   = static_cast<uint64_t>(settlements_.size()) + 1;
    settlements_.push_back(settlement);
    sink = settlement_sink_;
  }

  if (sink) {
    sink(settlement);
  }
  return settlement.settle_index;
}

void SimulatedNode::SetPaymentOutcome(const std::string& payment_request, model::PaymentOutcome outcome) {
  std::lock_guard lock(mutex_);
  scripted_outcomes_[payment_request] = std::move(outcome);
}

void SimulatedNode::FailNextCall(const std::string& message) {
  std::lock_guard lock(mutex_);
  fail_next_ = message;
}

size_t SimulatedNode::ResolvePendingPayments() {
  std::vector<reconcile::PaymentUpdate> updates;
  reconcile::NotificationSink           sink;
  {
    std::lock_guard lock(mutex_);
    while (!pending_.empty()) {
      const auto& outcome = payments_[pending_.front()];
      updates.push_back({outcome.node_reference, outcome});
      pending_.pop_front();
    }
    sink = payment_sink_;
  }

  if (sink) {
    for (auto& update : updates) {
      sink(std::move(update));
    }
  }
  return updates.size();
}

std::vector<std::string> SimulatedNode::PayRequests() const {
  std::lock_guard lock(mutex_);
  return pay_requests_;
}

} // namespace payday::node
