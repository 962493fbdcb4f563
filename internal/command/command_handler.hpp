#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/chain/onchain_monitor.hpp"
#include "internal/command/commands.hpp"
#include "internal/eventstore/event_codec.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/eventstore/snapshot_store.hpp"
#include "internal/node/lightning_node.hpp"
#include "internal/util/time.hpp"

namespace payday::command {

struct CommandHandlerOptions {
  uint32_t max_append_attempts = 3;
  uint32_t snapshot_every      = 10;
};

/*
  Turns commands into appended events.

  Every command loads the aggregate (latest snapshot + tail), decides the
  new events against that state and appends them at the state's sequence.
  A lost race reloads and decides again, up to max_append_attempts, then
  throws util::CommandConflict. Node calls happen once, outside the retry
  loop, and no lock is held across them. The chain monitor is optional;
  without one, on-chain invoices are refused.

  Precondition failures throw util::NotFound, util::AlreadyExists,
  util::InvalidState or util::InvalidArgument before anything is written.
*/
class CommandHandler {
 public:
  // Invoices expire within a year.
  static constexpr uint64_t kMaxExpirySeconds = 365ULL * 24 * 3600;

  CommandHandler(std::shared_ptr<eventstore::EventStore>    events,
                 std::shared_ptr<eventstore::SnapshotStore> snapshots,
                 std::shared_ptr<node::LightningNode>       node,
                 CommandHandlerOptions                      options = {},
                 util::NowFn                                now     = util::NowMs,
                 std::shared_ptr<chain::OnChainMonitor>     chain   = nullptr);

  CommandResult Handle(const Command& command, const eventstore::EventMetadata& metadata = {"api", ""});

  CommandResult Handle(const CreateInvoice& command, const eventstore::EventMetadata& metadata = {"api", ""});
  CommandResult Handle(const CancelInvoice& command, const eventstore::EventMetadata& metadata = {"api", ""});
  CommandResult Handle(const ExpireInvoice& command, const eventstore::EventMetadata& metadata = {"api", ""});
  CommandResult Handle(const SettleInvoice& command, const eventstore::EventMetadata& metadata = {"api", ""});
  CommandResult Handle(const RecordPendingPayment& command, const eventstore::EventMetadata& metadata = {"api", ""});
  CommandResult Handle(const SendPayment& command, const eventstore::EventMetadata& metadata = {"api", ""});
  CommandResult Handle(const RecordPaymentResult& command, const eventstore::EventMetadata& metadata = {"api", ""});

  // Fresh fold of the aggregate; Exists() is false when it has no events.
  model::Payment Load(model::Direction direction, const std::string& id) const;

 private:
  // Returns the events to append; empty means no-op.
  using Decision = std::function<std::vector<payday::v1::PaymentEvent>(const model::Payment& state)>;

  CommandResult Execute(model::Direction direction, const std::string& id, const Decision& decide,
                        eventstore::EventMetadata metadata);

  void MaybeSnapshot(const model::Payment& state, uint64_t previous_sequence);

  std::shared_ptr<eventstore::EventStore>    events_;
  std::shared_ptr<eventstore::SnapshotStore> snapshots_;
  std::shared_ptr<node::LightningNode>       node_;
  CommandHandlerOptions                      options_;
  util::NowFn                                now_;
  std::shared_ptr<chain::OnChainMonitor>     chain_;
};

} // namespace payday::command
