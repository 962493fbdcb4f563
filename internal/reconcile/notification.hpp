#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <variant>

#include "internal/model/payment_outcome.hpp"

namespace payday::reconcile {

// Lightning invoice paid, as reported by the node's invoice subscription.
struct InvoiceSettlement {
  std::string node_id;
  std::string node_reference;
  uint64_t    amount_sat    = 0;
  uint64_t    settled_at_ms = 0;
  // node-assigned, increasing; the resume point of the subscription
  uint64_t settle_index = 0;
};

// On-chain payment to an invoice address. Sent once when the transaction
// is seen (confirmations 0) and again as blocks confirm it.
struct OnChainConfirmation {
  std::string monitor_id;
  std::string address;
  uint64_t    amount_sat = 0;
  std::string tx_id;
  uint64_t    confirmations = 0;
  // block that included the transaction; 0 while unconfirmed
  uint64_t block_height = 0;
  uint64_t at_ms        = 0;
};

// Status change of an outgoing payment.
struct PaymentUpdate {
  std::string           node_reference;
  model::PaymentOutcome outcome;
};

using Notification = std::variant<InvoiceSettlement, OnChainConfirmation, PaymentUpdate>;

using NotificationSink = std::function<void(Notification)>;

} // namespace payday::reconcile
