#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/chain/onchain_monitor.hpp"
#include "internal/util/time.hpp"

namespace payday::chain {

struct SimulatedChainOptions {
  std::string monitor_id   = "simulated-chain";
  uint64_t    start_height = 100;
};

/*
  In-process chain for development and tests.

  Transactions sit in the mempool until MineBlocks() includes them; each
  further block adds a confirmation to every mined transaction.
*/
class SimulatedChain final : public OnChainMonitor {
 public:
  explicit SimulatedChain(SimulatedChainOptions options, util::NowFn now = util::NowMs);

  std::string MonitorId() const override;

  std::string NewAddress() override;

  void Subscribe(uint64_t from_block_height, reconcile::NotificationSink sink) override;

  // ---------------------------------------------------------------------
  // Simulation controls
  // ---------------------------------------------------------------------

  // A payer broadcasts a transaction to address. Returns its id.
  std::string SimulateTransaction(const std::string& address, uint64_t amount_sat);

  // Mines n blocks; the first one includes the whole mempool.
  void MineBlocks(uint64_t n);

  uint64_t TipHeight() const;

  // The next call throws util::NodeError(message).
  void FailNextCall(const std::string& message);

 private:
  struct Transaction {
    std::string tx_id;
    std::string address;
    uint64_t    amount_sat   = 0;
    uint64_t    block_height = 0;
  };

  reconcile::OnChainConfirmation Describe(const Transaction& tx) const;
  void                           ThrowIfFailing();

  SimulatedChainOptions options_;
  util::NowFn           now_;

  mutable std::mutex              mutex_;
  uint64_t                        tip_height_;
  std::unordered_set<std::string> addresses_;
  std::vector<Transaction>        transactions_;
  std::optional<std::string>      fail_next_;

  reconcile::NotificationSink sink_;
};

} // namespace payday::chain
