#include "internal/projection/settlement_publisher.hpp"

#include "internal/aggregate/payment_codec.hpp"
#include "internal/eventstore/event_codec.hpp"

namespace payday::projection {

SettlementPublisher::SettlementPublisher(Sink sink) : sink_(std::move(sink)) {
}

void SettlementPublisher::Handle(const db::model::EventRecord& event) {
  if (event.event_type != "InvoiceSettled" && event.event_type != "PaymentSucceeded") {
    return;
  }

  const auto decoded = eventstore::DecodeEvent(event);

  Settlement settlement;
  settlement.global_position = event.global_position;
  settlement.aggregate_id    = event.aggregate_id;

  if (decoded.has_invoice_settled()) {
    const auto& settled      = decoded.invoice_settled();
    settlement.direction     = model::Direction::kIncoming;
    settlement.amount_sat    = settled.amount_sat();
    settlement.settled_at_ms = settled.settled_at_ms();
    settlement.source        = aggregate::FromProto(settled.source());
  } else {
    const auto& succeeded    = decoded.payment_succeeded();
    settlement.direction     = model::Direction::kOutgoing;
    settlement.amount_sat    = succeeded.amount_sat();
    settlement.fee_sat       = succeeded.fee_sat();
    settlement.settled_at_ms = succeeded.settled_at_ms();
    settlement.source        = model::SettlementSource::kLightning;
  }

  sink_(settlement);
}

} // namespace payday::projection
