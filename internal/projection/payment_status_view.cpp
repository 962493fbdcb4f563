#include "internal/projection/payment_status_view.hpp"

#include "internal/aggregate/payment_aggregate.hpp"
#include "internal/eventstore/event_codec.hpp"
#include "internal/util/errors.hpp"

namespace payday::projection {

namespace {

std::string Key(const std::string& aggregate_type, const std::string& aggregate_id) {
  return aggregate_type + "#" + aggregate_id;
}

} // namespace

void PaymentStatusView::Handle(const db::model::EventRecord& event) {
  const auto direction = model::DirectionFromAggregateType(event.aggregate_type);
  if (!direction) {
    return;
  }

  auto decoded = eventstore::DecodeEvent(event);

  std::lock_guard lock(mutex_);
  auto& state = payments_
                    .try_emplace(Key(event.aggregate_type, event.aggregate_id),
                                 model::EmptyPayment(event.aggregate_id, *direction))
                    .first->second;
  if (event.sequence <= state.last_sequence) {
    return;
  }

  // fold a copy so a rejected event leaves the view untouched
  auto next = state;
  aggregate::Apply(next, {event.sequence, std::move(decoded)});
  state = std::move(next);
}

std::optional<model::Payment> PaymentStatusView::Get(model::Direction direction, const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto            it = payments_.find(Key(model::AggregateType(direction), id));
  if (it == payments_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<model::Payment> PaymentStatusView::Overdue(uint64_t now_ms) const {
  std::lock_guard             lock(mutex_);
  std::vector<model::Payment> out;
  for (const auto& [_, payment] : payments_) {
    if (payment.direction == model::Direction::kIncoming &&
        payment.status == model::PaymentStatus::kAwaitingPayment && payment.pending_amount_sat == 0 &&
        payment.expires_at_ms <= now_ms) {
      out.push_back(payment);
    }
  }
  return out;
}

std::vector<model::Payment> PaymentStatusView::WithStatus(model::Direction direction, model::PaymentStatus status) const {
  std::lock_guard             lock(mutex_);
  std::vector<model::Payment> out;
  for (const auto& [_, payment] : payments_) {
    if (payment.direction == direction && payment.status == status) {
      out.push_back(payment);
    }
  }
  return out;
}

std::size_t PaymentStatusView::Size() const {
  std::lock_guard lock(mutex_);
  return payments_.size();
}

} // namespace payday::projection
