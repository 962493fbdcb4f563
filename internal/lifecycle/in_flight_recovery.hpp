#pragma once

#include <cstddef>
#include <memory>

#include "internal/command/command_handler.hpp"
#include "internal/node/lightning_node.hpp"
#include "internal/projection/payment_status_view.hpp"
#include "internal/projection/projection_runner.hpp"

namespace payday::lifecycle {

struct RecoveryReport {
  std::size_t examined  = 0;
  std::size_t resolved  = 0;
  std::size_t in_flight = 0;
  std::size_t failed    = 0;
};

/*
  Startup pass over outgoing payments left in flight.

  A payment the node does not know never left this process and is failed
  with node_error. Anything the node reports is recorded through the
  command handler. Errors are per payment: one bad payment does not stop
  the pass.
*/
class InFlightRecovery {
 public:
  InFlightRecovery(std::shared_ptr<projection::ProjectionRunner>  runner,
                   std::shared_ptr<projection::PaymentStatusView> view,
                   std::shared_ptr<command::CommandHandler>       handler,
                   std::shared_ptr<node::LightningNode>           node);

  RecoveryReport Run();

 private:
  std::shared_ptr<projection::ProjectionRunner>  runner_;
  std::shared_ptr<projection::PaymentStatusView> view_;
  std::shared_ptr<command::CommandHandler>       handler_;
  std::shared_ptr<node::LightningNode>           node_;
};

} // namespace payday::lifecycle
