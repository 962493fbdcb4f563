#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "internal/db/model/event_record.hpp"
#include "internal/model/payment.hpp"
#include "internal/model/payment_outcome.hpp"

namespace payday::command {

struct CreateInvoice {
  std::string invoice_id;
  uint64_t    amount_sat     = 0;
  uint64_t    expiry_seconds = 0;
  std::string memo;
  // also take payment at a fresh on-chain address
  bool on_chain = false;
};

struct CancelInvoice {
  std::string invoice_id;
  std::string reason;
};

struct ExpireInvoice {
  std::string invoice_id;
  uint64_t    at_ms = 0;
};

struct SettleInvoice {
  std::string             invoice_id;
  uint64_t                amount_sat    = 0;
  uint64_t                settled_at_ms = 0;
  model::SettlementSource source        = model::SettlementSource::kLightning;
  std::string             transaction_id;
  uint64_t                confirmations = 0;
};

// On-chain payment seen below the confirmation threshold.
struct RecordPendingPayment {
  std::string invoice_id;
  uint64_t    amount_sat = 0;
  std::string transaction_id;
  uint64_t    at_ms = 0;
};

struct SendPayment {
  std::string payment_id;
  std::string payment_request;
  uint64_t    amount_sat = 0;
};

struct RecordPaymentResult {
  std::string           payment_id;
  model::PaymentOutcome outcome;
};

using Command = std::variant<CreateInvoice, CancelInvoice, ExpireInvoice, SettleInvoice, RecordPendingPayment,
                             SendPayment, RecordPaymentResult>;

struct CommandResult {
  // appended by this command, in sequence order
  std::vector<db::model::EventRecord> events;
  // true when the command restated an already-recorded fact
  bool noop = false;
  // state after the command
  model::Payment state;
};

} // namespace payday::command
