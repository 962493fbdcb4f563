#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/command/command_handler.hpp"
#include "internal/projection/payment_status_view.hpp"
#include "internal/projection/projection_runner.hpp"
#include "internal/util/time.hpp"

namespace payday::lifecycle {

/*
  Periodically expires invoices whose expiry has passed.

  Candidates come from the status view; each expiry goes through the
  command handler, which re-checks the aggregate, so a settlement that
  landed first turns the expiry into a no-op.
*/
class ExpirySweeper {
 public:
  ExpirySweeper(std::shared_ptr<projection::ProjectionRunner>  runner,
                std::shared_ptr<projection::PaymentStatusView> view,
                std::shared_ptr<command::CommandHandler>       handler,
                uint32_t                                       interval_ms,
                util::NowFn                                    now = util::NowMs);
  ~ExpirySweeper();

  // One pass. Returns the number of invoices expired.
  std::size_t SweepOnce();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<projection::ProjectionRunner>  runner_;
  std::shared_ptr<projection::PaymentStatusView> view_;
  std::shared_ptr<command::CommandHandler>       handler_;
  uint32_t                                       interval_ms_;
  util::NowFn                                    now_;

  std::mutex              mutex_;
  std::condition_variable wake_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace payday::lifecycle
