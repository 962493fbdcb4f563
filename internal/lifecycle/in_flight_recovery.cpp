#include "internal/lifecycle/in_flight_recovery.hpp"

#include "internal/observability/logging.hpp"

namespace payday::lifecycle {

InFlightRecovery::InFlightRecovery(std::shared_ptr<projection::ProjectionRunner>  runner,
                                   std::shared_ptr<projection::PaymentStatusView> view,
                                   std::shared_ptr<command::CommandHandler>       handler,
                                   std::shared_ptr<node::LightningNode>           node)
    : runner_(std::move(runner)), view_(std::move(view)), handler_(std::move(handler)), node_(std::move(node)) {
}

RecoveryReport InFlightRecovery::Run() {
  runner_->CatchUp();

  RecoveryReport report;
  for (const auto& payment : view_->WithStatus(model::Direction::kOutgoing, model::PaymentStatus::kInFlight)) {
    ++report.examined;
    const auto& reference = payment.node_reference.empty() ? payment.payment_request : payment.node_reference;

    try {
      auto outcome = node_->GetPaymentStatus(reference);
      if (!outcome) {
        model::PaymentOutcome failed;
        failed.status  = model::OutcomeStatus::kFailed;
        failed.reason  = model::FailureReason::kNodeError;
        failed.message = "payment unknown to node after restart";
        outcome        = failed;
      }

      auto result = handler_->Handle(command::RecordPaymentResult{payment.id, *outcome}, {"recovery", ""});
      if (result.state.status == model::PaymentStatus::kInFlight) {
        ++report.in_flight;
      } else {
        ++report.resolved;
      }
    } catch (const std::exception& e) {
      ++report.failed;
      PAYDAY_LOG_ERROR("in-flight recovery failed", {observability::StringField("aggregate_id", payment.id),
                                                     observability::StringField("reference", reference),
                                                     observability::StringField("error", e.what())});
    }
  }

  PAYDAY_LOG_INFO("in-flight recovery done", {observability::IntField("examined", static_cast<int64_t>(report.examined)),
                                              observability::IntField("resolved", static_cast<int64_t>(report.resolved)),
                                              observability::IntField("in_flight", static_cast<int64_t>(report.in_flight)),
                                              observability::IntField("failed", static_cast<int64_t>(report.failed))});
  return report;
}

} // namespace payday::lifecycle
