#include "internal/chain/simulated_chain.hpp"

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace payday::chain {

namespace {

std::string Hex(std::string id) {
  id.erase(std::remove(id.begin(), id.end(), '-'), id.end());
  return id;
}

} // namespace

SimulatedChain::SimulatedChain(SimulatedChainOptions options, util::NowFn now)
    : options_(std::move(options)), now_(std::move(now)), tip_height_(options_.start_height) {
}

std::string SimulatedChain::MonitorId() const {
  return options_.monitor_id;
}

void SimulatedChain::ThrowIfFailing() {
  if (fail_next_.has_value()) {
    auto message = std::move(*fail_next_);
    fail_next_.reset();
    throw util::NodeError(options_.monitor_id + ": " + message);
  }
}

reconcile::OnChainConfirmation SimulatedChain::Describe(const Transaction& tx) const {
  reconcile::OnChainConfirmation confirmation;
  confirmation.monitor_id    = options_.monitor_id;
  confirmation.address       = tx.address;
  confirmation.amount_sat    = tx.amount_sat;
  confirmation.tx_id         = tx.tx_id;
  confirmation.block_height  = tx.block_height;
  confirmation.confirmations = tx.block_height == 0 ? 0 : tip_height_ - tx.block_height + 1;
  confirmation.at_ms         = now_();
  return confirmation;
}

std::string SimulatedChain::NewAddress() {
  std::lock_guard lock(mutex_);
  ThrowIfFailing();

  auto address = "bcrt1q" + Hex(util::NewId());
  addresses_.insert(address);
  PAYDAY_LOG_DEBUG("simulated address issued", {observability::StringField("address", address)});
  return address;
}

void SimulatedChain::Subscribe(uint64_t from_block_height, reconcile::NotificationSink sink) {
  std::vector<reconcile::OnChainConfirmation> backlog;
  {
    std::lock_guard lock(mutex_);
    ThrowIfFailing();
    for (const auto& tx : transactions_) {
      if (addresses_.count(tx.address) != 0 && (tx.block_height == 0 || tx.block_height > from_block_height)) {
        backlog.push_back(Describe(tx));
      }
    }
    sink_ = sink;
  }

  for (auto& confirmation : backlog) {
    sink(std::move(confirmation));
  }
}

std::string SimulatedChain::SimulateTransaction(const std::string& address, uint64_t amount_sat) {
  reconcile::OnChainConfirmation seen;
  reconcile::NotificationSink    sink;
  {
    std::lock_guard lock(mutex_);
    Transaction tx;
    tx.tx_id      = Hex(util::NewId()) + Hex(util::NewId());
    tx.address    = address;
    tx.amount_sat = amount_sat;
    transactions_.push_back(tx);

    // not one of ours
    if (addresses_.count(address) == 0) {
      return tx.tx_id;
    }
    seen = Describe(tx);
    sink = sink_;
  }

  if (sink) {
    sink(seen);
  }
  return seen.tx_id;
}

void SimulatedChain::MineBlocks(uint64_t n) {
  std::vector<reconcile::OnChainConfirmation> updates;
  reconcile::NotificationSink                 sink;
  {
    std::lock_guard lock(mutex_);
    for (uint64_t i = 0; i < n; ++i) {
      ++tip_height_;
      for (auto& tx : transactions_) {
        if (tx.block_height == 0) {
          tx.block_height = tip_height_;
        }
      }
    }
    for (const auto& tx : transactions_) {
      if (tx.block_height != 0 && addresses_.count(tx.address) != 0) {
        updates.push_back(Describe(tx));
      }
    }
    sink = sink_;
  }

  if (sink) {
    for (auto& update : updates) {
      sink(std::move(update));
    }
  }
}

uint64_t SimulatedChain::TipHeight() const {
  std::lock_guard lock(mutex_);
  return tip_height_;
}

void SimulatedChain::FailNextCall(const std::string& message) {
  std::lock_guard lock(mutex_);
  fail_next_ = message;
}

} // namespace payday::chain
