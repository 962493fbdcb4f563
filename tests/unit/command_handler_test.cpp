#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/chain/simulated_chain.hpp"
#include "internal/command/command_handler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/node/simulated_node.hpp"
#include "internal/util/errors.hpp"

namespace {

using payday::command::CommandHandler;
using payday::command::CommandHandlerOptions;
using payday::model::Direction;
using payday::model::FailureReason;
using payday::model::OutcomeStatus;
using payday::model::PaymentStatus;

constexpr uint64_t kT = 1'700'000'000'000;

// Fails the first `failures` appends with `code`; Conflict reads as another writer getting there first.
class ConflictingRepository final : public payday::db::Repository {
 public:
  explicit ConflictingRepository(int failures, payday::db::ErrorCode code = payday::db::ErrorCode::Conflict)
      : conflicts_(failures), code_(code) {
  }

  int appends() const {
    return appends_;
  }

  std::unique_ptr<payday::db::Transaction> Begin() override {
    return inner_.Begin();
  }

  payday::db::Result AppendEvents(payday::db::Transaction& tx, const std::string& aggregate_type,
                                  const std::string& aggregate_id, uint64_t expected_last_sequence,
                                  std::vector<payday::db::model::EventRecord>& events) override {
    ++appends_;
    if (conflicts_ > 0) {
      --conflicts_;
      return payday::db::Result::Err(code_, "simulated append failure");
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
  int                                  conflicts_;
  payday::db::ErrorCode                code_;
  int                                  appends_ = 0;
};

// Records whether the payment attempt was already in the log when Pay() ran.
class WitnessNode final : public payday::node::LightningNode {
 public:
  WitnessNode(std::shared_ptr<payday::eventstore::EventStore> events, std::string payment_id)
      : events_(std::move(events)), payment_id_(std::move(payment_id)) {
  }

  bool initiated_before_pay = false;

  std::string NodeId() const override {
    return "witness";
  }

  payday::node::CreatedInvoice CreateInvoice(uint64_t, uint64_t, const std::string&) override {
    return {"witness-ref", "lnwitness"};
  }

  payday::model::PaymentOutcome Pay(const std::string&, uint64_t amount_sat) override {
    initiated_before_pay = events_->LastSequence("Payment", payment_id_) == 1;
    payday::model::PaymentOutcome outcome;
    outcome.status         = OutcomeStatus::kInFlight;
    outcome.node_reference = "witness-pay";
    outcome.amount_sat     = amount_sat;
    return outcome;
  }

  void SubscribeSettlements(uint64_t, payday::reconcile::NotificationSink) override {
  }

  void SubscribePaymentUpdates(payday::reconcile::NotificationSink) override {
  }

  std::optional<payday::model::PaymentOutcome> GetPaymentStatus(const std::string&) override {
    return std::nullopt;
  }

 private:
  std::shared_ptr<payday::eventstore::EventStore> events_;
  std::string                                     payment_id_;
};

struct Fixture {
  explicit Fixture(CommandHandlerOptions options = {}, payday::node::SimulatedNodeOptions node_options = {},
                   std::shared_ptr<payday::db::Repository> repository = nullptr)
      : clock(std::make_shared<std::atomic<uint64_t>>(kT)) {
    repo = repository ? std::move(repository) : std::make_shared<payday::db::memory::MemoryRepository>();
    events    = std::make_shared<payday::eventstore::EventStore>(repo);
    snapshots = std::make_shared<payday::eventstore::SnapshotStore>(repo);
    auto now  = [c = clock] { return c->load(); };
    node      = std::make_shared<payday::node::SimulatedNode>(node_options, now);
    handler   = std::make_shared<CommandHandler>(events, snapshots, node, options, now);
  }

  void Advance(uint64_t ms) {
    clock->fetch_add(ms);
  }

  std::shared_ptr<std::atomic<uint64_t>>            clock;
  std::shared_ptr<payday::db::Repository>           repo;
  std::shared_ptr<payday::eventstore::EventStore>   events;
  std::shared_ptr<payday::eventstore::SnapshotStore> snapshots;
  std::shared_ptr<payday::node::SimulatedNode>      node;
  std::shared_ptr<CommandHandler>                   handler;
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCreateInvoiceRecordsNodeInvoice() {
  Fixture f;
  auto result = f.handler->Handle(payday::command::CreateInvoice{"inv-1", 1000, 3600, "coffee"});

  assert(!result.noop);
  assert(result.events.size() == 1);
  assert(result.events[0].event_type == "InvoiceCreated");
  assert(result.state.status == PaymentStatus::kAwaitingPayment);
  assert(result.state.amount_requested == 1000);
  assert(result.state.expires_at_ms == kT + 3'600'000);
  assert(result.state.node_id == "simulated");
  assert(!result.state.node_reference.empty());
  assert(result.state.payment_request.rfind("lnsim1000n1", 0) == 0);

  auto reference = f.events->FindReference(result.state.node_reference);
  assert(reference.has_value());
  assert(reference->aggregate_id == "inv-1");

  assert(f.handler->Load(Direction::kIncoming, "inv-1") == result.state);

  assert(Throws<payday::util::AlreadyExists>([&] {
    f.handler->Handle(payday::command::CreateInvoice{"inv-1", 1000, 3600, ""});
  }));
  assert(Throws<payday::util::InvalidArgument>([&] {
    f.handler->Handle(payday::command::CreateInvoice{"inv-2", 0, 3600, ""});
  }));
}

void TestNodeFailureOnCreateAppendsNothing() {
  Fixture f;
  f.node->FailNextCall("connection refused");

  assert(Throws<payday::util::NodeError>([&] {
    f.handler->Handle(payday::command::CreateInvoice{"inv-1", 1000, 3600, ""});
  }));
  assert(f.events->LastSequence("Invoice", "inv-1") == 0);
  assert(!f.handler->Load(Direction::kIncoming, "inv-1").Exists());
}

void TestInvoiceSettlementScenario() {
  Fixture f;
  f.handler->Handle(payday::command::CreateInvoice{"inv-1", 1000, 3600, ""});

  payday::command::SettleInvoice settle;
  settle.invoice_id    = "inv-1";
  settle.amount_sat    = 1000;
  settle.settled_at_ms = kT + 10'000;

  auto settled = f.handler->Handle(settle);
  assert(!settled.noop);
  assert(settled.state.status == PaymentStatus::kSettled);
  assert(settled.state.settled_at_ms == kT + 10'000);

  auto duplicate = f.handler->Handle(settle);
  assert(duplicate.noop);
  assert(duplicate.events.empty());
  assert(duplicate.state.status == PaymentStatus::kSettled);
  assert(f.events->LastSequence("Invoice", "inv-1") == 2);

  // expiry after settlement does not revert it
  f.Advance(3'600'000);
  auto expired = f.handler->Handle(payday::command::ExpireInvoice{"inv-1", 0});
  assert(expired.noop);
  assert(expired.state.status == PaymentStatus::kSettled);
}

void TestUnderpaidSettlementFailsInvoice() {
  Fixture f;
  f.handler->Handle(payday::command::CreateInvoice{"inv-1", 1000, 3600, ""});

  payday::command::SettleInvoice settle;
  settle.invoice_id = "inv-1";
  settle.amount_sat = 400;
  settle.source     = payday::model::SettlementSource::kOnChain;
  settle.transaction_id = "tx-1";

  auto result = f.handler->Handle(settle);
  assert(result.state.status == PaymentStatus::kFailed);
  assert(result.state.failure_reason == FailureReason::kUnderpaid);
  assert(result.state.transaction_id == "tx-1");

  // topping up a failed invoice records nothing
  settle.amount_sat = 1000;
  auto late = f.handler->Handle(settle);
  assert(late.noop);
  assert(late.state.status == PaymentStatus::kFailed);
  assert(late.state.amount_settled == 400);
  assert(f.events->LastSequence("Invoice", "inv-1") == 2);
}

void TestSettlementAfterExpiryOrCancelIsNoop() {
  Fixture f;
  f.handler->Handle(payday::command::CreateInvoice{"inv-exp", 1000, 60, ""});
  f.handler->Handle(payday::command::CreateInvoice{"inv-can", 1000, 60, ""});
  f.handler->Handle(payday::command::ExpireInvoice{"inv-exp", kT + 60'000});
  f.handler->Handle(payday::command::CancelInvoice{"inv-can", "customer left"});

  payday::command::SettleInvoice settle;
  settle.invoice_id = "inv-exp";
  settle.amount_sat = 1000;

  auto expired = f.handler->Handle(settle);
  assert(expired.noop);
  assert(expired.events.empty());
  assert(expired.state.status == PaymentStatus::kExpired);
  assert(f.events->LastSequence("Invoice", "inv-exp") == 2);

  settle.invoice_id = "inv-can";
  auto canceled = f.handler->Handle(settle);
  assert(canceled.noop);
  assert(canceled.state.status == PaymentStatus::kCanceled);
  assert(!canceled.state.settled_at_ms.has_value());
}

void TestOversizedExpiryIsRejectedBeforeNodeCall() {
  Fixture f;
  f.node->FailNextCall("node must not be called");

  // 18446744073709552 * 1000 wraps to 384 in 64 bits
  assert(Throws<payday::util::InvalidArgument>([&] {
    f.handler->Handle(payday::command::CreateInvoice{"inv-1", 1000, 18446744073709552ULL, ""});
  }));
  assert(Throws<payday::util::InvalidArgument>([&] {
    f.handler->Handle(payday::command::CreateInvoice{"inv-1", 1000, CommandHandler::kMaxExpirySeconds + 1, ""});
  }));
  assert(f.events->LastSequence("Invoice", "inv-1") == 0);

  // the armed failure is still pending, so the node saw neither request
  assert(Throws<payday::util::NodeError>([&] {
    f.handler->Handle(payday::command::CreateInvoice{"inv-1", 1000, 3600, ""});
  }));

  auto longest = f.handler->Handle(payday::command::CreateInvoice{"inv-2", 1000, CommandHandler::kMaxExpirySeconds, ""});
  assert(longest.state.expires_at_ms == kT + CommandHandler::kMaxExpirySeconds * 1000);
}

void TestOnChainInvoiceTracksPendingPayment() {
  Fixture f;
  auto now   = [] { return kT; };
  auto chain = std::make_shared<payday::chain::SimulatedChain>(payday::chain::SimulatedChainOptions{}, now);
  CommandHandler handler(f.events, f.snapshots, f.node, CommandHandlerOptions{}, now, chain);

  payday::command::CreateInvoice create{"inv-1", 1000, 3600, ""};
  create.on_chain = true;
  const auto created = handler.Handle(create).state;
  assert(created.onchain_address.rfind("bcrt1q", 0) == 0);
  auto reference = f.events->FindReference(created.onchain_address);
  assert(reference.has_value());
  assert(reference->aggregate_id == "inv-1");

  auto pending = handler.Handle(payday::command::RecordPendingPayment{"inv-1", 1000, "tx-1", kT + 1'000});
  assert(!pending.noop);
  assert(pending.events.size() == 1);
  assert(pending.events[0].event_type == "InvoicePaymentPending");
  assert(pending.state.pending_amount_sat == 1000);

  // seen again in the next block
  assert(handler.Handle(payday::command::RecordPendingPayment{"inv-1", 1000, "tx-1", kT + 2'000}).noop);

  auto expired = handler.Handle(payday::command::ExpireInvoice{"inv-1", kT + 3'600'000});
  assert(expired.noop);
  assert(expired.state.status == PaymentStatus::kAwaitingPayment);
}

void TestOnChainInvoiceNeedsChainMonitor() {
  Fixture f;
  payday::command::CreateInvoice create{"inv-1", 1000, 3600, ""};
  create.on_chain = true;
  assert(Throws<payday::util::InvalidState>([&] { f.handler->Handle(create); }));
  assert(!f.handler->Load(Direction::kIncoming, "inv-1").Exists());

  f.handler->Handle(payday::command::CreateInvoice{"inv-2", 1000, 3600, ""});
  assert(Throws<payday::util::InvalidState>([&] {
    f.handler->Handle(payday::command::RecordPendingPayment{"inv-2", 1000, "tx-1", kT});
  }));
  assert(Throws<payday::util::InvalidArgument>([&] {
    f.handler->Handle(payday::command::RecordPendingPayment{"inv-2", 0, "tx-1", kT});
  }));
}

void TestExpireAndCancel() {
  Fixture f;
  f.handler->Handle(payday::command::CreateInvoice{"inv-exp", 1000, 60, ""});
  f.handler->Handle(payday::command::CreateInvoice{"inv-can", 1000, 60, ""});

  assert(Throws<payday::util::InvalidState>([&] {
    f.handler->Handle(payday::command::ExpireInvoice{"inv-exp", kT + 30'000});
  }));

  auto expired = f.handler->Handle(payday::command::ExpireInvoice{"inv-exp", kT + 60'000});
  assert(expired.state.status == PaymentStatus::kExpired);
  assert(f.handler->Handle(payday::command::ExpireInvoice{"inv-exp", kT + 90'000}).noop);
  assert(Throws<payday::util::InvalidState>([&] {
    f.handler->Handle(payday::command::CancelInvoice{"inv-exp", "late"});
  }));

  auto canceled = f.handler->Handle(payday::command::CancelInvoice{"inv-can", "customer left"});
  assert(canceled.state.status == PaymentStatus::kCanceled);
  assert(f.handler->Handle(payday::command::CancelInvoice{"inv-can", "again"}).noop);
  assert(f.handler->Handle(payday::command::ExpireInvoice{"inv-can", kT + 60'000}).noop);

  assert(Throws<payday::util::NotFound>([&] {
    f.handler->Handle(payday::command::CancelInvoice{"missing", ""});
  }));
}

void TestSendPaymentSucceeds() {
  Fixture f;
  auto result = f.handler->Handle(payday::command::SendPayment{"pay-1", "lnbc500n1example", 500});

  assert(result.state.status == PaymentStatus::kSettled);
  assert(result.state.amount_settled == 500);
  assert(result.state.fee_sat == 1);
  assert(!result.state.preimage.empty());
  assert(result.events.size() == 3);
  assert(result.events[0].event_type == "PaymentInitiated");
  assert(result.events[1].event_type == "PaymentInFlight");
  assert(result.events[2].event_type == "PaymentSucceeded");
  assert(f.node->PayRequests() == std::vector<std::string>{"lnbc500n1example"});

  auto by_request = f.events->FindReference("lnbc500n1example");
  assert(by_request.has_value() && by_request->aggregate_id == "pay-1");
  auto by_hash = f.events->FindReference(result.state.node_reference);
  assert(by_hash.has_value() && by_hash->aggregate_type == "Payment");

  // a retry must use a new id
  assert(Throws<payday::util::AlreadyExists>([&] {
    f.handler->Handle(payday::command::SendPayment{"pay-1", "lnbc500n1example", 500});
  }));
  assert(f.node->PayRequests().size() == 1);
}

void TestSendPaymentTimeoutScenario() {
  Fixture f;
  payday::model::PaymentOutcome timeout;
  timeout.status = OutcomeStatus::kFailed;
  timeout.reason = FailureReason::kTimeout;
  f.node->SetPaymentOutcome("lnbc500n1slow", timeout);

  auto result = f.handler->Handle(payday::command::SendPayment{"pay-1", "lnbc500n1slow", 500});
  assert(result.state.status == PaymentStatus::kFailed);
  assert(result.state.failure_reason == FailureReason::kTimeout);

  payday::model::PaymentOutcome late;
  late.status = OutcomeStatus::kSucceeded;
  assert(Throws<payday::util::InvalidState>([&] {
    f.handler->Handle(payday::command::RecordPaymentResult{"pay-1", late});
  }));

  // the same failure reported again is a no-op
  assert(f.handler->Handle(payday::command::RecordPaymentResult{"pay-1", timeout}).noop);
}

void TestPaymentIsDurableBeforeNodeCall() {
  auto repo   = std::make_shared<payday::db::memory::MemoryRepository>();
  auto events = std::make_shared<payday::eventstore::EventStore>(repo);
  auto node   = std::make_shared<WitnessNode>(events, "pay-1");
  CommandHandler handler(events, std::make_shared<payday::eventstore::SnapshotStore>(repo), node);

  auto result = handler.Handle(payday::command::SendPayment{"pay-1", "lnwitness", 500});
  assert(node->initiated_before_pay);
  assert(result.state.status == PaymentStatus::kInFlight);
  assert(result.state.node_reference == "witness-pay");
}

void TestNodeFailureOnPayRecordsFailure() {
  Fixture f;
  f.node->FailNextCall("node offline");

  assert(Throws<payday::util::NodeError>([&] {
    f.handler->Handle(payday::command::SendPayment{"pay-1", "lnbc500n1example", 500});
  }));

  auto state = f.handler->Load(Direction::kOutgoing, "pay-1");
  assert(state.status == PaymentStatus::kFailed);
  assert(state.failure_reason == FailureReason::kNodeError);
  assert(state.last_sequence == 2);
}

void TestAsyncPaymentStaysInFlight() {
  payday::node::SimulatedNodeOptions node_options;
  node_options.async_payments = true;
  Fixture f({}, node_options);

  auto result = f.handler->Handle(payday::command::SendPayment{"pay-1", "lnbc500n1example", 500});
  assert(result.state.status == PaymentStatus::kInFlight);
  assert(!result.state.node_reference.empty());

  auto status = f.node->GetPaymentStatus(result.state.node_reference);
  assert(status.has_value() && status->status == OutcomeStatus::kInFlight);
}

void TestConflictRetryReloadsAndSucceeds() {
  auto repo = std::make_shared<ConflictingRepository>(2);
  Fixture f({3, 10}, {}, repo);

  auto result = f.handler->Handle(payday::command::CreateInvoice{"inv-1", 1000, 3600, ""});
  assert(result.state.status == PaymentStatus::kAwaitingPayment);
  assert(repo->appends() == 3);
}

void TestConflictRetriesAreBounded() {
  auto repo = std::make_shared<ConflictingRepository>(100);
  Fixture f({3, 10}, {}, repo);

  assert(Throws<payday::util::CommandConflict>([&] {
    f.handler->Handle(payday::command::CreateInvoice{"inv-1", 1000, 3600, ""});
  }));
  assert(repo->appends() == 3);
  assert(f.events->LastSequence("Invoice", "inv-1") == 0);
}

void TestConstraintViolationIsNotRetried() {
  auto repo = std::make_shared<ConflictingRepository>(1, payday::db::ErrorCode::ConstraintViolation);
  Fixture f({3, 10}, {}, repo);

  assert(Throws<payday::util::StorageError>([&] {
    f.handler->Handle(payday::command::CreateInvoice{"inv-1", 1000, 3600, ""});
  }));
  assert(repo->appends() == 1);
  assert(f.events->LastSequence("Invoice", "inv-1") == 0);
}

void TestSnapshotsAreTakenAndUsed() {
  Fixture f({3, 2});
  auto result = f.handler->Handle(payday::command::SendPayment{"pay-1", "lnbc500n1example", 500});
  assert(result.state.last_sequence == 3);

  auto snapshot = f.snapshots->Latest("Payment", "pay-1");
  assert(snapshot.has_value());
  assert(snapshot->last_sequence == 3);

  assert(f.handler->Load(Direction::kOutgoing, "pay-1") == result.state);
}

} // namespace

int main() {
  TestCreateInvoiceRecordsNodeInvoice();
  TestNodeFailureOnCreateAppendsNothing();
  TestInvoiceSettlementScenario();
  TestUnderpaidSettlementFailsInvoice();
  TestSettlementAfterExpiryOrCancelIsNoop();
  TestOversizedExpiryIsRejectedBeforeNodeCall();
  TestOnChainInvoiceTracksPendingPayment();
  TestOnChainInvoiceNeedsChainMonitor();
  TestExpireAndCancel();
  TestSendPaymentSucceeds();
  TestSendPaymentTimeoutScenario();
  TestPaymentIsDurableBeforeNodeCall();
  TestNodeFailureOnPayRecordsFailure();
  TestAsyncPaymentStaysInFlight();
  TestConflictRetryReloadsAndSucceeds();
  TestConflictRetriesAreBounded();
  TestConstraintViolationIsNotRetried();
  TestSnapshotsAreTakenAndUsed();

  std::cout << "payday_unit_command_handler: pass\n";
  return 0;
}
