#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/node/lightning_node.hpp"
#include "internal/util/time.hpp"

namespace payday::node {

struct SimulatedNodeOptions {
  std::string node_id = "simulated";
  // Pay() returns in flight; ResolvePendingPayments() finishes them
  bool     async_payments = false;
  uint64_t fee_sat        = 1;
};

/*
  In-process Lightning node for development and tests.

  Keeps invoices, settlements and payments in memory. The simulation
  controls stand in for what a real node would observe from the network.
*/
class SimulatedNode final : public LightningNode {
 public:
  explicit SimulatedNode(SimulatedNodeOptions options, util::NowFn now = util::NowMs);

  std::string NodeId() const override;

  CreatedInvoice CreateInvoice(uint64_t amount_sat, uint64_t expiry_seconds, const std::string& memo) override;

  model::PaymentOutcome Pay(const std::string& payment_request, uint64_t amount_sat) override;

  void SubscribeSettlements(uint64_t from_settle_index, reconcile::NotificationSink sink) override;

  void SubscribePaymentUpdates(reconcile::NotificationSink sink) override;

  std::optional<model::PaymentOutcome> GetPaymentStatus(const std::string& reference) override;

  // ---------------------------------------------------------------------
  // Simulation controls
  // ---------------------------------------------------------------------

  // A payer settles one of our invoices. Returns the settle index.
  uint64_t SimulateIncomingPayment(const std::string& node_reference, uint64_t amount_sat);

  // Outcome Pay() reports for payment_request instead of success.
  void SetPaymentOutcome(const std::string& payment_request, model::PaymentOutcome outcome);

  // The next node call throws util::NodeError(message).
  void FailNextCall(const std::string& message);

  // Resolves payments left in flight by async mode. Returns how many resolved.
  size_t ResolvePendingPayments();

  // Payments Pay() was asked to make, in call order.
  std::vector<std::string> PayRequests() const;

 private:
  struct Invoice {
    uint64_t amount_sat = 0;
    bool     settled    = false;
  };

  void ThrowIfFailing();

  SimulatedNodeOptions options_;
  util::NowFn          now_;

  mutable std::mutex                                     mutex_;
  std::unordered_map<std::string, Invoice>               invoices_;
  std::vector<reconcile::InvoiceSettlement>              settlements_;
  std::unordered_map<std::string, model::PaymentOutcome> payments_;
  // payment_request -> node_reference
  std::unordered_map<std::string, std::string>           requests_;
  std::unordered_map<std::string, model::PaymentOutcome> scripted_outcomes_;
  std::deque<std::string>                                pending_;
  std::vector<std::string>                               pay_requests_;
  std::optional<std::string>                             fail_next_;

  reconcile::NotificationSink settlement_sink_;
  reconcile::NotificationSink payment_sink_;
};

} // namespace payday::node
