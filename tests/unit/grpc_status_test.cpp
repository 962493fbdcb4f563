#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/command/command_handler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/payment_server.hpp"
#include "internal/node/simulated_node.hpp"
#include "internal/service/payment_service.hpp"
#include "internal/service/service_context.hpp"
#include "payday/v1.hpp"

namespace {

struct Harness {
  std::shared_ptr<payday::node::SimulatedNode>     node;
  std::shared_ptr<payday::command::CommandHandler> handler;
  std::shared_ptr<payday::grpc::PaymentServer>     server;
};

Harness BuildServer() {
  auto repository = std::make_shared<payday::db::memory::MemoryRepository>();

  Harness harness;
  harness.node = std::make_shared<payday::node::SimulatedNode>(payday::node::SimulatedNodeOptions{});

  payday::service::ServiceContext ctx;
  ctx.events  = std::make_shared<payday::eventstore::EventStore>(repository);
  ctx.handler = std::make_shared<payday::command::CommandHandler>(
      ctx.events, std::make_shared<payday::eventstore::SnapshotStore>(repository), harness.node);

  harness.handler = ctx.handler;
  harness.server  = std::make_shared<payday::grpc::PaymentServer>(std::make_shared<payday::service::PaymentService>(ctx));
  return harness;
}

::grpc::Status CreateInvoice(payday::grpc::PaymentServer& server, const std::string& id) {
  payday::v1::CreateInvoiceRequest req;
  req.set_invoice_id(id);
  req.set_amount_sat(1000);
  req.set_expiry_seconds(3600);

  payday::v1::CreateInvoiceResponse resp;
  ::grpc::ServerContext             grpc_ctx;
  return server.CreateInvoice(&grpc_ctx, &req, &resp);
}

void TestGetMissingPaymentReturnsNotFound() {
  auto harness = BuildServer();

  payday::v1::GetPaymentRequest req;
  req.set_direction(payday::v1::DIRECTION_INCOMING);
  req.set_id("missing-invoice");
  payday::v1::GetPaymentResponse resp;
  ::grpc::ServerContext          grpc_ctx;

  const auto status = harness.server->GetPayment(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestDuplicateInvoiceReturnsAlreadyExists() {
  auto harness = BuildServer();

  assert(CreateInvoice(*harness.server, "inv-1").ok());
  assert(CreateInvoice(*harness.server, "inv-1").error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
}

void TestCancelSettledInvoiceReturnsFailedPrecondition() {
  auto harness = BuildServer();
  assert(CreateInvoice(*harness.server, "inv-1").ok());
  harness.handler->Handle(payday::command::SettleInvoice{"inv-1", 1000, 0});

  payday::v1::CancelInvoiceRequest req;
  req.set_invoice_id("inv-1");
  payday::v1::CancelInvoiceResponse resp;
  ::grpc::ServerContext             grpc_ctx;

  const auto status = harness.server->CancelInvoice(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestNodeFailureReturnsUnavailable() {
  auto harness = BuildServer();
  harness.node->FailNextCall("connection refused");

  assert(CreateInvoice(*harness.server, "inv-1").error_code() == ::grpc::StatusCode::UNAVAILABLE);
}

void TestMissingDirectionReturnsInvalidArgument() {
  auto harness = BuildServer();

  payday::v1::ListPaymentEventsRequest req;
  req.set_id("inv-1");
  payday::v1::ListPaymentEventsResponse resp;
  ::grpc::ServerContext                 grpc_ctx;

  const auto status = harness.server->ListPaymentEvents(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestErrorMapping() {
  using payday::grpc::ToStatus;

  assert(ToStatus(payday::util::InvalidTransition("pay-1", 3, "PaymentSucceeded", "terminal")).error_code() ==
         ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(payday::util::ConcurrencyConflict("inv-1", 1, "stale")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(payday::util::CommandConflict("gave up")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(payday::util::StorageError("disk full")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(payday::util::NotFound("payment not found: pay-1"));
  assert(status.error_message() == "payment not found: pay-1");
}

} // namespace

int main() {
  TestGetMissingPaymentReturnsNotFound();
  TestDuplicateInvoiceReturnsAlreadyExists();
  TestCancelSettledInvoiceReturnsFailedPrecondition();
  TestNodeFailureReturnsUnavailable();
  TestMissingDirectionReturnsInvalidArgument();
  TestErrorMapping();

  std::cout << "payday_unit_grpc_status: pass\n";
  return 0;
}
