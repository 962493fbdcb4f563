#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/payment_outcome.hpp"
#include "internal/reconcile/notification.hpp"

namespace payday::node {

struct CreatedInvoice {
  std::string node_reference;
  std::string payment_request;
};

/*
  Capability interface of a Lightning node backend.

  Every call may throw util::NodeError. Implementations are selected at
  startup from the node section of the runtime config.
*/
class LightningNode {
 public:
  virtual ~LightningNode() = default;

  virtual std::string NodeId() const = 0;

  virtual CreatedInvoice CreateInvoice(uint64_t amount_sat, uint64_t expiry_seconds, const std::string& memo) = 0;

  // Starts an outgoing payment. The outcome may still be in flight.
  virtual model::PaymentOutcome Pay(const std::string& payment_request, uint64_t amount_sat) = 0;

  // Pushes an InvoiceSettlement into sink for every settlement with
  // settle_index > from_settle_index, then for each new one.
  virtual void SubscribeSettlements(uint64_t from_settle_index, reconcile::NotificationSink sink) = 0;

  // Pushes a PaymentUpdate whenever an in-flight payment resolves.
  virtual void SubscribePaymentUpdates(reconcile::NotificationSink sink) = 0;

  // Looks a payment up by node reference or, when the reference was never
  // recorded, by payment request. nullopt when the node has no such payment.
  virtual std::optional<model::PaymentOutcome> GetPaymentStatus(const std::string& reference) = 0;
};

} // namespace payday::node
