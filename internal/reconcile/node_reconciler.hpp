#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/chain/onchain_monitor.hpp"
#include "internal/command/command_handler.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/eventstore/offset_store.hpp"
#include "internal/node/lightning_node.hpp"
#include "internal/reconcile/notification_queue.hpp"
#include "internal/reconcile/resume_point.hpp"

namespace payday::reconcile {

struct NodeReconcilerOptions {
  uint64_t min_confirmations = 1;
  // how often held notifications are retried
  uint64_t retry_interval_ms = 1000;
};

// Offset id under which a node's last processed settle index is kept.
std::string SettleIndexOffsetId(const std::string& node_id);

// Offset id under which a chain monitor's last processed block height is kept.
std::string BlockHeightOffsetId(const std::string& monitor_id);

/*
  Background worker applying node and chain notifications to aggregates.

  Each notification is routed through the reference index to its aggregate
  and becomes a SettleInvoice, RecordPendingPayment or RecordPaymentResult
  command, so it takes the same optimistic-concurrency path as API
  commands. Redelivered notifications are no-ops.

  A notification the command path rejects for good is logged and counted
  as handled. One that fails for any other reason (storage, contention) is
  held and retried; the committed settle index or block height never passes
  a held notification, so a restart replays it.
*/
class NodeReconciler {
 public:
  NodeReconciler(std::shared_ptr<NotificationQueue>          queue,
                 std::shared_ptr<command::CommandHandler>    handler,
                 std::shared_ptr<eventstore::EventStore>     events,
                 std::shared_ptr<eventstore::OffsetStore>    offsets,
                 NodeReconcilerOptions                       options = {});
  ~NodeReconciler();

  // Subscribes to node pushes, resuming settlements after the committed settle index.
  void Attach(node::LightningNode& node);

  // Subscribes to chain pushes, resuming after the committed block height.
  void AttachChain(chain::OnChainMonitor& chain);

  void Start();
  void Stop();

  // Single dispatch point. Throws only when committing progress fails.
  void Dispatch(const Notification& notification);

  // Dispatches every held notification again; returns how many now applied.
  std::size_t RetryHeld();

  std::size_t HeldCount() const;

 private:
  enum class Delivery { kFirst, kRetry };

  void Run();

  bool Route(const Notification& notification, Delivery delivery);
  void Record(const Notification& notification, Delivery delivery, bool applied);

  void OnSettlement(const InvoiceSettlement& settlement);
  void OnConfirmation(const OnChainConfirmation& confirmation);
  void OnPaymentUpdate(const PaymentUpdate& update);

  void Pin(const OnChainConfirmation& confirmation);
  void Unpin(const OnChainConfirmation& confirmation);

  std::shared_ptr<NotificationQueue>       queue_;
  std::shared_ptr<command::CommandHandler> handler_;
  std::shared_ptr<eventstore::EventStore>  events_;
  std::shared_ptr<eventstore::OffsetStore> offsets_;
  NodeReconcilerOptions                    options_;

  mutable std::mutex                 mutex_;
  std::map<std::string, ResumePoint> progress_;
  std::vector<Notification>          held_;
  // pending on-chain payments: tx id -> block height held in progress_
  std::map<std::string, uint64_t> pinned_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace payday::reconcile
