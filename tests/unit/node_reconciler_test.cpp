#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "internal/chain/simulated_chain.hpp"
#include "internal/command/command_handler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/eventstore/offset_store.hpp"
#include "internal/node/simulated_node.hpp"
#include "internal/reconcile/node_reconciler.hpp"
#include "internal/reconcile/notification_queue.hpp"

namespace {

using payday::model::Direction;
using payday::model::OutcomeStatus;
using payday::model::PaymentStatus;
using payday::reconcile::InvoiceSettlement;
using payday::reconcile::NodeReconciler;
using payday::reconcile::NotificationQueue;
using payday::reconcile::OnChainConfirmation;
using payday::reconcile::PaymentUpdate;

constexpr uint64_t kT = 1'700'000'000'000;

// Memory repository whose next appends fail with an I/O error.
class FlakyRepository final : public payday::db::Repository {
 public:
  void FailNextAppends(int n) {
    failures_ = n;
  }

  std::unique_ptr<payday::db::Transaction> Begin() override {
    return inner_.Begin();
  }

  payday::db::Result AppendEvents(payday::db::Transaction& tx, const std::string& aggregate_type,
                                  const std::string& aggregate_id, uint64_t expected_last_sequence,
                                  std::vector<payday::db::model::EventRecord>& events) override {
    if (failures_ > 0) {
      --failures_;
      return payday::db::Result::Err(payday::db::ErrorCode::IOError, "disk unavailable");
    }
    return inner_.AppendEvents(tx, aggregate_type, aggregate_id, expected_last_sequence, events);
  }

  std::vector<payday::db::model::EventRecord> LoadEvents(payday::db::Transaction& tx, const std::string& aggregate_type,
                                                         const std::string& aggregate_id, uint64_t after_sequence,
                                                         std::optional<uint64_t> max_events) override {
    return inner_.LoadEvents(tx, aggregate_type, aggregate_id, after_sequence, max_events);
  }

  uint64_t LastSequence(payday::db::Transaction& tx, const std::string& aggregate_type,
                        const std::string& aggregate_id) override {
    return inner_.LastSequence(tx, aggregate_type, aggregate_id);
  }

  std::vector<payday::db::model::EventRecord> LoadEventsSince(payday::db::Transaction& tx, uint64_t after_position,
                                                              std::optional<uint64_t> max_events) override {
    return inner_.LoadEventsSince(tx, after_position, max_events);
  }

  payday::db::Result InsertSnapshot(payday::db::Transaction& tx, payday::db::model::SnapshotRecord& record) override {
    return inner_.InsertSnapshot(tx, record);
  }

  std::optional<payday::db::model::SnapshotRecord> GetLatestSnapshot(payday::db::Transaction& tx,
                                                                     const std::string& aggregate_type,
                                                                     const std::string& aggregate_id) override {
    return inner_.GetLatestSnapshot(tx, aggregate_type, aggregate_id);
  }

  payday::db::Result CommitOffset(payday::db::Transaction& tx, const payday::db::model::OffsetRecord& record) override {
    return inner_.CommitOffset(tx, record);
  }

  std::optional<payday::db::model::OffsetRecord> GetOffset(payday::db::Transaction& tx, const std::string& id) override {
    return inner_.GetOffset(tx, id);
  }

  payday::db::Result PutReference(payday::db::Transaction& tx, const payday::db::model::ReferenceRecord& record) override {
    return inner_.PutReference(tx, record);
  }

  std::optional<payday::db::model::ReferenceRecord> FindReference(payday::db::Transaction& tx,
                                                                   const std::string& node_reference) override {
    return inner_.FindReference(tx, node_reference);
  }

 private:
  payday::db::memory::MemoryRepository inner_;
  int                                  failures_ = 0;
};

struct Fixture {
  explicit Fixture(uint64_t min_confirmations = 1, bool async_payments = false) {
    repo    = std::make_shared<FlakyRepository>();
    events  = std::make_shared<payday::eventstore::EventStore>(repo);
    offsets   = std::make_shared<payday::eventstore::OffsetStore>(repo);

    payday::node::SimulatedNodeOptions node_options;
    node_options.node_id        = "node-a";
    node_options.async_payments = async_payments;
    auto now                    = [] { return kT; };
    node    = std::make_shared<payday::node::SimulatedNode>(node_options, now);
    chain   = std::make_shared<payday::chain::SimulatedChain>(payday::chain::SimulatedChainOptions{}, now);
    handler = std::make_shared<payday::command::CommandHandler>(
        events, std::make_shared<payday::eventstore::SnapshotStore>(repo), node, payday::command::CommandHandlerOptions{}, now,
        chain);

    queue      = std::make_shared<NotificationQueue>(16);
    reconciler = std::make_shared<NodeReconciler>(queue, handler, events, offsets,
                                                  payday::reconcile::NodeReconcilerOptions{min_confirmations});
  }

  payday::model::Payment CreateInvoice(const std::string& id, uint64_t amount_sat) {
    return handler->Handle(payday::command::CreateInvoice{id, amount_sat, 3600, ""}).state;
  }

  payday::model::Payment CreateOnChainInvoice(const std::string& id, uint64_t amount_sat) {
    payday::command::CreateInvoice create{id, amount_sat, 3600, ""};
    create.on_chain = true;
    return handler->Handle(create).state;
  }

  payday::model::Payment Invoice(const std::string& id) {
    return handler->Load(Direction::kIncoming, id);
  }

  uint64_t SettleIndex() const {
    return offsets->Get(payday::reconcile::SettleIndexOffsetId("node-a"));
  }

  uint64_t BlockHeight() const {
    return offsets->Get(payday::reconcile::BlockHeightOffsetId("simulated-chain"));
  }

  // Dispatches everything queued so far on the calling thread.
  void Drain() {
    while (queue->Size() > 0) {
      auto notification = queue->Dequeue();
      assert(notification.has_value());
      reconciler->Dispatch(*notification);
    }
  }

  std::shared_ptr<FlakyRepository>                 repo;
  std::shared_ptr<payday::eventstore::EventStore>  events;
  std::shared_ptr<payday::eventstore::OffsetStore> offsets;
  std::shared_ptr<payday::node::SimulatedNode>     node;
  std::shared_ptr<payday::chain::SimulatedChain>   chain;
  std::shared_ptr<payday::command::CommandHandler> handler;
  std::shared_ptr<NotificationQueue>               queue;
  std::shared_ptr<NodeReconciler>                  reconciler;
};

bool WaitFor(const std::function<bool()>& done) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (done()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return done();
}

void TestSettlementIsAppliedOnceAndIndexCommitted() {
  Fixture f;
  const auto invoice = f.CreateInvoice("inv-1", 1000);

  InvoiceSettlement settlement{"node-a", invoice.node_reference, 1000, kT + 10'000, 1};
  f.reconciler->Dispatch(settlement);

  auto state = f.handler->Load(Direction::kIncoming, "inv-1");
  assert(state.status == PaymentStatus::kSettled);
  assert(state.last_sequence == 2);
  assert(f.SettleIndex() == 1);

  // redelivery after a restart
  f.reconciler->Dispatch(settlement);
  state = f.handler->Load(Direction::kIncoming, "inv-1");
  assert(state.status == PaymentStatus::kSettled);
  assert(state.last_sequence == 2);
  assert(f.SettleIndex() == 1);
}

void TestUnknownReferenceIsDroppedAndIndexAdvances() {
  Fixture f;
  f.reconciler->Dispatch(InvoiceSettlement{"node-a", "never-issued", 500, kT, 5});
  assert(f.SettleIndex() == 5);

  f.reconciler->Dispatch(PaymentUpdate{"never-issued", {}});
  f.reconciler->Dispatch(OnChainConfirmation{"simulated-chain", "bc1qunknown", 500, "tx-1", 6, 106, kT});
  assert(f.BlockHeight() == 106);
}

void TestRejectedSettlementStillAdvancesIndex() {
  Fixture f;
  const auto invoice = f.CreateInvoice("inv-1", 1000);
  f.handler->Handle(payday::command::CancelInvoice{"inv-1", "customer left"});

  f.reconciler->Dispatch(InvoiceSettlement{"node-a", invoice.node_reference, 1000, kT + 10'000, 3});
  assert(f.handler->Load(Direction::kIncoming, "inv-1").status == PaymentStatus::kCanceled);
  assert(f.SettleIndex() == 3);
}

void TestStorageFailureHoldsSettleIndex() {
  Fixture f;
  const auto first  = f.CreateInvoice("inv-a", 1000);
  const auto second = f.CreateInvoice("inv-b", 2000);

  f.repo->FailNextAppends(1);
  f.reconciler->Dispatch(InvoiceSettlement{"node-a", first.node_reference, 1000, kT + 10'000, 1});
  f.reconciler->Dispatch(InvoiceSettlement{"node-a", second.node_reference, 2000, kT + 10'000, 2});

  assert(f.Invoice("inv-a").status == PaymentStatus::kAwaitingPayment);
  assert(f.Invoice("inv-b").status == PaymentStatus::kSettled);
  // index 2 is done but 1 is not; a restart must resume from 0
  assert(f.SettleIndex() == 0);
  assert(f.reconciler->HeldCount() == 1);

  assert(f.reconciler->RetryHeld() == 1);
  assert(f.reconciler->HeldCount() == 0);
  assert(f.Invoice("inv-a").status == PaymentStatus::kSettled);
  assert(f.SettleIndex() == 2);
}

void TestRetryThatFailsAgainStaysHeld() {
  Fixture f;
  const auto invoice = f.CreateInvoice("inv-a", 1000);

  f.repo->FailNextAppends(2);
  f.reconciler->Dispatch(InvoiceSettlement{"node-a", invoice.node_reference, 1000, kT + 10'000, 1});
  assert(f.reconciler->RetryHeld() == 0);
  assert(f.reconciler->HeldCount() == 1);
  assert(f.SettleIndex() == 0);

  assert(f.reconciler->RetryHeld() == 1);
  assert(f.SettleIndex() == 1);
}

void TestHeldSettlementIsRetriedByWorker() {
  Fixture f;
  f.queue      = std::make_shared<NotificationQueue>(16);
  f.reconciler = std::make_shared<NodeReconciler>(f.queue, f.handler, f.events, f.offsets,
                                                  payday::reconcile::NodeReconcilerOptions{1, 10});
  const auto invoice = f.CreateInvoice("inv-1", 1000);

  f.repo->FailNextAppends(1);
  f.reconciler->Start();
  f.reconciler->Attach(*f.node);
  f.node->SimulateIncomingPayment(invoice.node_reference, 1000);

  assert(WaitFor([&] { return f.Invoice("inv-1").status == PaymentStatus::kSettled; }));
  assert(WaitFor([&] { return f.SettleIndex() == 1; }));
  f.reconciler->Stop();
}

void TestOnChainPaymentIsPendingUntilConfirmed() {
  Fixture f(2);
  const auto invoice = f.CreateOnChainInvoice("inv-1", 1000);
  assert(!invoice.onchain_address.empty());
  f.reconciler->AttachChain(*f.chain);

  const auto tx = f.chain->SimulateTransaction(invoice.onchain_address, 1000);
  f.Drain();
  auto state = f.Invoice("inv-1");
  assert(state.status == PaymentStatus::kAwaitingPayment);
  assert(state.pending_amount_sat == 1000);
  assert(state.pending_transaction_id == tx);

  // one confirmation at height 101; still below threshold
  f.chain->MineBlocks(1);
  f.Drain();
  assert(f.Invoice("inv-1").status == PaymentStatus::kAwaitingPayment);
  assert(f.Invoice("inv-1").last_sequence == state.last_sequence);
  assert(f.BlockHeight() == 100);

  f.chain->MineBlocks(1);
  f.Drain();
  state = f.Invoice("inv-1");
  assert(state.status == PaymentStatus::kSettled);
  assert(state.settled_via == payday::model::SettlementSource::kOnChain);
  assert(state.transaction_id == tx);
  assert(state.pending_amount_sat == 0);
  assert(f.BlockHeight() == 101);

  // further confirmations of the same transaction change nothing
  f.chain->MineBlocks(1);
  f.Drain();
  assert(f.Invoice("inv-1").last_sequence == state.last_sequence);
}

void TestPendingTransactionPinsBlockHeight() {
  Fixture f(2);
  const auto first  = f.CreateOnChainInvoice("inv-1", 1000);
  const auto second = f.CreateOnChainInvoice("inv-2", 2000);
  f.reconciler->AttachChain(*f.chain);

  f.chain->SimulateTransaction(first.onchain_address, 1000);
  f.chain->MineBlocks(1);
  const auto pending_tx = f.chain->SimulateTransaction(second.onchain_address, 2000);
  f.chain->MineBlocks(1);
  f.Drain();

  assert(f.Invoice("inv-1").status == PaymentStatus::kSettled);
  assert(f.Invoice("inv-2").status == PaymentStatus::kAwaitingPayment);
  // height 102 holds a transaction still short of confirmations
  assert(f.BlockHeight() == 101);

  // a restarted reconciler is handed the pending transaction again
  auto queue     = std::make_shared<NotificationQueue>(16);
  auto restarted = std::make_shared<NodeReconciler>(queue, f.handler, f.events, f.offsets,
                                                    payday::reconcile::NodeReconcilerOptions{2});
  restarted->AttachChain(*f.chain);
  assert(queue->Size() == 1);
  auto notification = queue->Dequeue();
  assert(notification.has_value());
  const auto& confirmation = std::get<OnChainConfirmation>(*notification);
  assert(confirmation.tx_id == pending_tx);
  assert(confirmation.block_height == 102);
}

void TestExpiryWaitsForPendingPayment() {
  Fixture f(2);
  const auto invoice = f.CreateOnChainInvoice("inv-1", 1000);
  f.reconciler->AttachChain(*f.chain);
  f.chain->SimulateTransaction(invoice.onchain_address, 1000);
  f.Drain();

  auto result = f.handler->Handle(payday::command::ExpireInvoice{"inv-1", invoice.expires_at_ms});
  assert(result.noop);
  assert(result.state.status == PaymentStatus::kAwaitingPayment);

  f.chain->MineBlocks(2);
  f.Drain();
  assert(f.Invoice("inv-1").status == PaymentStatus::kSettled);
}

void TestPaymentUpdateResolvesInFlightPayment() {
  Fixture f(1, true);
  auto sent = f.handler->Handle(payday::command::SendPayment{"pay-1", "lnbc500n1example", 500}).state;
  assert(sent.status == PaymentStatus::kInFlight);

  payday::model::PaymentOutcome succeeded;
  succeeded.status   = OutcomeStatus::kSucceeded;
  succeeded.fee_sat  = 3;
  succeeded.preimage = "preimage";

  f.reconciler->Dispatch(PaymentUpdate{sent.node_reference, succeeded});
  auto state = f.handler->Load(Direction::kOutgoing, "pay-1");
  assert(state.status == PaymentStatus::kSettled);
  assert(state.fee_sat == 3);

  f.reconciler->Dispatch(PaymentUpdate{sent.node_reference, succeeded});
  assert(f.handler->Load(Direction::kOutgoing, "pay-1").last_sequence == state.last_sequence);
}

void TestWorkerConsumesNodeNotifications() {
  Fixture f(1, true);
  const auto invoice = f.CreateInvoice("inv-1", 1000);
  auto       sent    = f.handler->Handle(payday::command::SendPayment{"pay-1", "lnbc500n1example", 500}).state;

  f.reconciler->Start();
  f.reconciler->Attach(*f.node);

  const auto settle_index = f.node->SimulateIncomingPayment(invoice.node_reference, 1000);
  assert(f.node->ResolvePendingPayments() == 1);

  assert(WaitFor([&] { return f.handler->Load(Direction::kIncoming, "inv-1").status == PaymentStatus::kSettled; }));
  assert(WaitFor([&] { return f.handler->Load(Direction::kOutgoing, "pay-1").status == PaymentStatus::kSettled; }));
  assert(WaitFor([&] { return f.SettleIndex() == settle_index; }));

  f.reconciler->Stop();
  assert(sent.node_reference == f.handler->Load(Direction::kOutgoing, "pay-1").node_reference);
}

void TestAttachResumesAfterCommittedIndex() {
  Fixture f;
  const auto first  = f.CreateInvoice("inv-1", 1000);
  const auto second = f.CreateInvoice("inv-2", 2000);

  // settlements the node saw while we were down
  assert(f.node->SimulateIncomingPayment(first.node_reference, 1000) == 1);
  assert(f.node->SimulateIncomingPayment(second.node_reference, 2000) == 2);
  f.offsets->Commit(payday::reconcile::SettleIndexOffsetId("node-a"), 1);

  f.reconciler->Attach(*f.node);
  assert(f.queue->Size() == 1);

  auto notification = f.queue->Dequeue();
  assert(notification.has_value());
  const auto& settlement = std::get<InvoiceSettlement>(*notification);
  assert(settlement.settle_index == 2);
  assert(settlement.node_reference == second.node_reference);
}

void TestNotificationAfterShutdownIsLogged() {
  std::ostringstream captured;
  auto               previous = spdlog::default_logger();
  spdlog::set_default_logger(
      std::make_shared<spdlog::logger>("captured", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured)));

  Fixture f;
  const auto invoice = f.CreateInvoice("inv-1", 1000);
  f.reconciler->Attach(*f.node);
  f.reconciler->Stop();
  f.node->SimulateIncomingPayment(invoice.node_reference, 1000);

  spdlog::set_default_logger(previous);

  assert(captured.str().find("notification dropped after shutdown") != std::string::npos);
  assert(captured.str().find(invoice.node_reference) != std::string::npos);
  assert(f.queue->Size() == 0);
  assert(f.Invoice("inv-1").status == PaymentStatus::kAwaitingPayment);
}

} // namespace

int main() {
  TestSettlementIsAppliedOnceAndIndexCommitted();
  TestUnknownReferenceIsDroppedAndIndexAdvances();
  TestRejectedSettlementStillAdvancesIndex();
  TestStorageFailureHoldsSettleIndex();
  TestRetryThatFailsAgainStaysHeld();
  TestHeldSettlementIsRetriedByWorker();
  TestOnChainPaymentIsPendingUntilConfirmed();
  TestPendingTransactionPinsBlockHeight();
  TestExpiryWaitsForPendingPayment();
  TestPaymentUpdateResolvesInFlightPayment();
  TestWorkerConsumesNodeNotifications();
  TestAttachResumesAfterCommittedIndex();
  TestNotificationAfterShutdownIsLogged();

  std::cout << "payday_unit_node_reconciler: pass\n";
  return 0;
}
