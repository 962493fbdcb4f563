#include "internal/lifecycle/expiry_sweeper.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"

namespace payday::lifecycle {

ExpirySweeper::ExpirySweeper(std::shared_ptr<projection::ProjectionRunner>  runner,
                             std::shared_ptr<projection::PaymentStatusView> view,
                             std::shared_ptr<command::CommandHandler>       handler,
                             uint32_t                                       interval_ms,
                             util::NowFn                                    now)
    : runner_(std::move(runner)),
      view_(std::move(view)),
      handler_(std::move(handler)),
      interval_ms_(interval_ms == 0 ? 1000 : interval_ms),
      now_(std::move(now)) {
}

ExpirySweeper::~ExpirySweeper() {
  Stop();
}

std::size_t ExpirySweeper::SweepOnce() {
  runner_->CatchUp();

  const auto  now_ms  = now_();
  std::size_t expired = 0;
  for (const auto& invoice : view_->Overdue(now_ms)) {
    try {
      auto result = handler_->Handle(command::ExpireInvoice{invoice.id, now_ms}, {"expiry_sweeper", ""});
      if (!result.noop) {
        ++expired;
      }
    } catch (const std::exception& e) {
      PAYDAY_LOG_WARN("expiry failed", {observability::StringField("aggregate_id", invoice.id),
                                        observability::StringField("error", e.what())});
    }
  }

  if (expired > 0) {
    PAYDAY_LOG_INFO("invoices expired", {observability::IntField("count", static_cast<int64_t>(expired))});
  }
  return expired;
}

void ExpirySweeper::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&ExpirySweeper::Run, this);
}

void ExpirySweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void ExpirySweeper::Run() {
  while (running_) {
    try {
      SweepOnce();
    } catch (const std::exception& e) {
      PAYDAY_LOG_ERROR("expiry sweep failed", {observability::StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    wake_.wait_for(lock, std::chrono::milliseconds(interval_ms_), [this] { return !running_; });
  }
}

} // namespace payday::lifecycle
