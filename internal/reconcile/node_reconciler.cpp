#include "internal/reconcile/node_reconciler.hpp"

#include <chrono>
#include <type_traits>
#include <utility>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace payday::reconcile {

namespace {

std::string Describe(const Notification& notification) {
  return std::visit(
      [](const auto& n) -> std::string {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, InvoiceSettlement>) {
          return "settlement " + n.node_reference + " index " + std::to_string(n.settle_index);
        } else if constexpr (std::is_same_v<T, OnChainConfirmation>) {
          return "confirmation " + n.tx_id + " to " + n.address + " (" + std::to_string(n.confirmations) + " conf)";
        } else {
          return "payment update " + n.node_reference;
        }
      },
      notification);
}

// Offset id and position a notification advances; empty id when it has none.
std::pair<std::string, uint64_t> ProgressOf(const Notification& notification) {
  if (const auto* settlement = std::get_if<InvoiceSettlement>(&notification)) {
    return {SettleIndexOffsetId(settlement->node_id), settlement->settle_index};
  }
  if (const auto* confirmation = std::get_if<OnChainConfirmation>(&notification)) {
    return {BlockHeightOffsetId(confirmation->monitor_id), confirmation->block_height};
  }
  return {"", 0};
}

NotificationSink QueueSink(std::shared_ptr<NotificationQueue> queue, std::string source) {
  return [queue = std::move(queue), source = std::move(source)](Notification notification) {
    auto description = Describe(notification);
    if (!queue->Enqueue(std::move(notification))) {
      PAYDAY_LOG_WARN("notification dropped after shutdown", {observability::StringField("source", source),
                                                              observability::StringField("notification", description)});
    }
  };
}

void LogRejected(const Notification& notification, const std::exception& e) {
  // retrying cannot change the outcome; move past it
  PAYDAY_LOG_ERROR("notification rejected", {observability::StringField("notification", Describe(notification)),
                                             observability::StringField("error", e.what())});
}

} // namespace

std::string SettleIndexOffsetId(const std::string& node_id) {
  return "node:" + node_id + ":settle_index";
}

std::string BlockHeightOffsetId(const std::string& monitor_id) {
  return "chain:" + monitor_id + ":block_height";
}

NodeReconciler::NodeReconciler(std::shared_ptr<NotificationQueue>       queue,
                               std::shared_ptr<command::CommandHandler> handler,
                               std::shared_ptr<eventstore::EventStore>  events,
                               std::shared_ptr<eventstore::OffsetStore> offsets,
                               NodeReconcilerOptions                    options)
    : queue_(std::move(queue)),
      handler_(std::move(handler)),
      events_(std::move(events)),
      offsets_(std::move(offsets)),
      options_(options) {
}

NodeReconciler::~NodeReconciler() {
  Stop();
}

void NodeReconciler::Attach(node::LightningNode& node) {
  const auto from = offsets_->Get(SettleIndexOffsetId(node.NodeId()));
  auto       sink = QueueSink(queue_, node.NodeId());

  node.SubscribePaymentUpdates(sink);
  node.SubscribeSettlements(from, sink);

  PAYDAY_LOG_INFO("reconciler attached to node", {observability::StringField("node_id", node.NodeId()),
                                                  observability::IntField("from_settle_index", static_cast<int64_t>(from))});
}

void NodeReconciler::AttachChain(chain::OnChainMonitor& chain) {
  const auto from = offsets_->Get(BlockHeightOffsetId(chain.MonitorId()));
  chain.Subscribe(from, QueueSink(queue_, chain.MonitorId()));

  PAYDAY_LOG_INFO("reconciler attached to chain", {observability::StringField("monitor_id", chain.MonitorId()),
                                                   observability::IntField("from_block_height", static_cast<int64_t>(from))});
}

void NodeReconciler::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&NodeReconciler::Run, this);
}

void NodeReconciler::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable())
    thread_.join();
}

void NodeReconciler::Run() {
  const auto interval   = std::chrono::milliseconds(options_.retry_interval_ms);
  auto       last_retry = std::chrono::steady_clock::now();

  while (true) {
    auto notification = queue_->DequeueFor(interval);
    if (!notification && queue_->IsShutdown())
      break;

    if (notification) {
      try {
        Dispatch(*notification);
      } catch (const std::exception& e) {
        PAYDAY_LOG_ERROR("notification failed", {observability::StringField("notification", Describe(*notification)),
                                                 observability::StringField("error", e.what())});
      }
    }

    const auto now = std::chrono::steady_clock::now();
    if (!notification || now - last_retry >= interval) {
      last_retry = now;
      try {
        RetryHeld();
      } catch (const std::exception& e) {
        PAYDAY_LOG_ERROR("retry of held notifications failed", {observability::StringField("error", e.what())});
      }
    }
  }
}

void NodeReconciler::Dispatch(const Notification& notification) {
  Route(notification, Delivery::kFirst);
}

std::size_t NodeReconciler::RetryHeld() {
  std::vector<Notification> batch;
  {
    std::lock_guard lock(mutex_);
    batch.swap(held_);
  }

  std::size_t applied = 0;
  for (const auto& notification : batch) {
    if (Route(notification, Delivery::kRetry)) {
      ++applied;
    }
  }
  if (!batch.empty()) {
    PAYDAY_LOG_INFO("held notifications retried", {observability::IntField("retried", static_cast<int64_t>(batch.size())),
                                                   observability::IntField("applied", static_cast<int64_t>(applied))});
  }
  return applied;
}

std::size_t NodeReconciler::HeldCount() const {
  std::lock_guard lock(mutex_);
  return held_.size();
}

bool NodeReconciler::Route(const Notification& notification, Delivery delivery) {
  bool applied = true;
  try {
    std::visit(
        [this](const auto& n) {
          using T = std::decay_t<decltype(n)>;
          if constexpr (std::is_same_v<T, InvoiceSettlement>) {
            OnSettlement(n);
          } else if constexpr (std::is_same_v<T, OnChainConfirmation>) {
            OnConfirmation(n);
          } else {
            OnPaymentUpdate(n);
          }
        },
        notification);
  } catch (const util::InvalidState& e) {
    LogRejected(notification, e);
  } catch (const util::InvalidTransition& e) {
    LogRejected(notification, e);
  } catch (const util::InvalidArgument& e) {
    LogRejected(notification, e);
  } catch (const util::NotFound& e) {
    LogRejected(notification, e);
  } catch (const std::exception& e) {
    applied = false;
    PAYDAY_LOG_ERROR("notification held for retry", {observability::StringField("notification", Describe(notification)),
                                                      observability::BoolField("retry", delivery == Delivery::kRetry),
                                                      observability::StringField("error", e.what())});
  }

  Record(notification, delivery, applied);
  return applied;
}

void NodeReconciler::Record(const Notification& notification, Delivery delivery, bool applied) {
  const auto [offset_id, position] = ProgressOf(notification);

  uint64_t committable = 0;
  {
    std::lock_guard lock(mutex_);
    if (!applied) {
      held_.push_back(notification);
    }
    // unconfirmed transactions and payment updates carry no position
    if (offset_id.empty() || position == 0) {
      return;
    }

    auto& point = progress_[offset_id];
    if (!applied) {
      if (delivery == Delivery::kFirst) {
        point.Hold(position);
      }
    } else if (delivery == Delivery::kRetry) {
      point.Release(position);
    } else {
      point.Handled(position);
    }
    committable = point.Committable();
  }

  if (committable > 0) {
    offsets_->Commit(offset_id, committable);
  }
}

void NodeReconciler::Pin(const OnChainConfirmation& confirmation) {
  if (confirmation.block_height == 0) {
    return;
  }
  std::lock_guard lock(mutex_);
  if (pinned_.emplace(confirmation.tx_id, confirmation.block_height).second) {
    progress_[BlockHeightOffsetId(confirmation.monitor_id)].Hold(confirmation.block_height);
  }
}

void NodeReconciler::Unpin(const OnChainConfirmation& confirmation) {
  std::lock_guard lock(mutex_);
  auto it = pinned_.find(confirmation.tx_id);
  if (it == pinned_.end()) {
    return;
  }
  progress_[BlockHeightOffsetId(confirmation.monitor_id)].Release(it->second);
  pinned_.erase(it);
}

void NodeReconciler::OnSettlement(const InvoiceSettlement& settlement) {
  const auto reference = events_->FindReference(settlement.node_reference);
  if (!reference || reference->aggregate_type != model::kInvoiceAggregate) {
    PAYDAY_LOG_WARN("settlement for unknown invoice dropped",
                    {observability::StringField("node_id", settlement.node_id),
                     observability::StringField("node_reference", settlement.node_reference),
                     observability::IntField("settle_index", static_cast<int64_t>(settlement.settle_index))});
    return;
  }

  command::SettleInvoice settle;
  settle.invoice_id    = reference->aggregate_id;
  settle.amount_sat    = settlement.amount_sat;
  settle.settled_at_ms = settlement.settled_at_ms;
  settle.source        = model::SettlementSource::kLightning;

  auto result = handler_->Handle(settle, {"reconciler", "settle_index:" + std::to_string(settlement.settle_index)});
  PAYDAY_LOG_INFO("settlement reconciled", {observability::StringField("aggregate_id", settle.invoice_id),
                                            observability::StringField("status", model::ToString(result.state.status)),
                                            observability::BoolField("noop", result.noop)});
}

void NodeReconciler::OnConfirmation(const OnChainConfirmation& confirmation) {
  const auto reference = events_->FindReference(confirmation.address);
  if (!reference || reference->aggregate_type != model::kInvoiceAggregate) {
    PAYDAY_LOG_WARN("confirmation for unknown address dropped", {observability::StringField("address", confirmation.address),
                                                                 observability::StringField("tx_id", confirmation.tx_id)});
    return;
  }

  if (confirmation.confirmations < options_.min_confirmations) {
    command::RecordPendingPayment pending;
    pending.invoice_id     = reference->aggregate_id;
    pending.amount_sat     = confirmation.amount_sat;
    pending.transaction_id = confirmation.tx_id;
    pending.at_ms          = confirmation.at_ms;

    auto result = handler_->Handle(pending, {"reconciler", "tx:" + confirmation.tx_id});
    PAYDAY_LOG_DEBUG("confirmation below threshold", {observability::StringField("aggregate_id", pending.invoice_id),
                                                      observability::StringField("tx_id", confirmation.tx_id),
                                                      observability::IntField("confirmations", static_cast<int64_t>(confirmation.confirmations)),
                                                      observability::BoolField("noop", result.noop)});
    // a restart must see this transaction again to settle it
    if (!model::IsTerminal(result.state.status)) {
      Pin(confirmation);
    }
    return;
  }

  command::SettleInvoice settle;
  settle.invoice_id     = reference->aggregate_id;
  settle.amount_sat     = confirmation.amount_sat;
  settle.settled_at_ms  = confirmation.at_ms;
  settle.source         = model::SettlementSource::kOnChain;
  settle.transaction_id = confirmation.tx_id;
  settle.confirmations  = confirmation.confirmations;

  auto result = handler_->Handle(settle, {"reconciler", "tx:" + confirmation.tx_id});
  Unpin(confirmation);
  PAYDAY_LOG_INFO("confirmation reconciled", {observability::StringField("aggregate_id", settle.invoice_id),
                                              observability::StringField("status", model::ToString(result.state.status)),
                                              observability::BoolField("noop", result.noop)});
}

void NodeReconciler::OnPaymentUpdate(const PaymentUpdate& update) {
  const auto reference = events_->FindReference(update.node_reference);
  if (!reference || reference->aggregate_type != model::kPaymentAggregate) {
    PAYDAY_LOG_WARN("payment update for unknown reference dropped",
                    {observability::StringField("node_reference", update.node_reference)});
    return;
  }

  auto outcome = update.outcome;
  if (outcome.node_reference.empty()) {
    outcome.node_reference = update.node_reference;
  }

  auto result = handler_->Handle(command::RecordPaymentResult{reference->aggregate_id, outcome},
                                 {"reconciler", "payment:" + update.node_reference});
  PAYDAY_LOG_INFO("payment update reconciled", {observability::StringField("aggregate_id", reference->aggregate_id),
                                                observability::StringField("status", model::ToString(result.state.status)),
                                                observability::BoolField("noop", result.noop)});
}

} // namespace payday::reconcile
