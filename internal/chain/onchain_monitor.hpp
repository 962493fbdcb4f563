#pragma once

#include <cstdint>
#include <string>

#include "internal/reconcile/notification.hpp"

namespace payday::chain {

/*
  Capability interface of an on-chain wallet watching invoice addresses.

  Every call may throw util::NodeError. Implementations are selected at
  startup from the chain section of the runtime config.
*/
class OnChainMonitor {
 public:
  virtual ~OnChainMonitor() = default;

  virtual std::string MonitorId() const = 0;

  // Fresh receive address, never handed out before.
  virtual std::string NewAddress() = 0;

  // Pushes an OnChainConfirmation into sink for every transaction to one of
  // our addresses that is unconfirmed or was mined above from_block_height,
  // then one for each new transaction and each new confirmation.
  virtual void Subscribe(uint64_t from_block_height, reconcile::NotificationSink sink) = 0;
};

} // namespace payday::chain
