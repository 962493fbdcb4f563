#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/chain/onchain_monitor.hpp"
#include "internal/command/command_handler.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lifecycle/expiry_sweeper.hpp"
#include "internal/lifecycle/in_flight_recovery.hpp"
#include "internal/node/lightning_node.hpp"
#include "internal/projection/payment_status_view.hpp"
#include "internal/projection/projection_runner.hpp"
#include "internal/reconcile/node_reconciler.hpp"

namespace payday::factory {

/*
  Application

  Owns all long-lived components used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  std::shared_ptr<node::LightningNode> node;
  // null when on-chain payment is not configured
  std::shared_ptr<chain::OnChainMonitor> chain;
  std::shared_ptr<command::CommandHandler> handler;

  std::shared_ptr<reconcile::NodeReconciler> reconciler;
  std::shared_ptr<projection::ProjectionRunner> projections;
  std::shared_ptr<projection::PaymentStatusView> status_view;
  std::shared_ptr<lifecycle::ExpirySweeper> expiry;
  std::shared_ptr<lifecycle::InFlightRecovery> recovery;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB, node and chain types.
*/
Application Build(const payday::runtime::config::RuntimeConfig& config);

// Recovery pass, then the reconciler, projection and expiry workers.
void StartBackground(Application& app);

// Stops workers in reverse start order.
void StopBackground(Application& app);

} // namespace payday::factory
