#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/command/command_handler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/node/simulated_node.hpp"
#include "internal/service/payment_service.hpp"
#include "internal/util/errors.hpp"

namespace {

constexpr uint64_t kT = 1'700'000'000'000;

payday::service::ServiceContext BuildServiceContext() {
  auto repository = std::make_shared<payday::db::memory::MemoryRepository>();

  payday::service::ServiceContext ctx;
  ctx.events  = std::make_shared<payday::eventstore::EventStore>(repository);
  ctx.handler = std::make_shared<payday::command::CommandHandler>(
      ctx.events, std::make_shared<payday::eventstore::SnapshotStore>(repository),
      std::make_shared<payday::node::SimulatedNode>(payday::node::SimulatedNodeOptions{}, [] { return kT; }),
      payday::command::CommandHandlerOptions{}, [] { return kT; });
  return ctx;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCreateAndGetInvoice() {
  payday::service::PaymentService service(BuildServiceContext());

  payday::v1::CreateInvoiceRequest create;
  create.set_invoice_id("inv-1");
  create.set_amount_sat(1000);
  create.set_expiry_seconds(3600);
  create.set_memo("coffee");

  const auto created = service.CreateInvoice(create);
  assert(created.invoice().id() == "inv-1");
  assert(created.invoice().direction() == payday::v1::DIRECTION_INCOMING);
  assert(created.invoice().status() == payday::v1::PAYMENT_STATUS_AWAITING_PAYMENT);
  assert(created.invoice().expires_at_ms() == kT + 3'600'000);
  assert(created.invoice().memo() == "coffee");
  assert(!created.invoice().payment_request().empty());

  payday::v1::GetPaymentRequest get;
  get.set_direction(payday::v1::DIRECTION_INCOMING);
  get.set_id("inv-1");
  const auto fetched = service.GetPayment(get);
  assert(fetched.payment().last_sequence() == 1);
  assert(fetched.payment().payment_request() == created.invoice().payment_request());

  assert(Throws<payday::util::AlreadyExists>([&] { service.CreateInvoice(create); }));
}

void TestCreateInvoiceGeneratesId() {
  payday::service::PaymentService service(BuildServiceContext());

  payday::v1::CreateInvoiceRequest create;
  create.set_amount_sat(1000);
  create.set_expiry_seconds(60);

  const auto first  = service.CreateInvoice(create);
  const auto second = service.CreateInvoice(create);
  assert(!first.invoice().id().empty());
  assert(first.invoice().id() != second.invoice().id());
}

void TestCancelInvoiceIsIdempotent() {
  payday::service::PaymentService service(BuildServiceContext());

  payday::v1::CreateInvoiceRequest create;
  create.set_invoice_id("inv-1");
  create.set_amount_sat(1000);
  create.set_expiry_seconds(3600);
  service.CreateInvoice(create);

  payday::v1::CancelInvoiceRequest cancel;
  cancel.set_invoice_id("inv-1");
  cancel.set_reason("customer left");

  auto first = service.CancelInvoice(cancel);
  assert(first.invoice().status() == payday::v1::PAYMENT_STATUS_CANCELED);
  assert(!first.noop());

  auto second = service.CancelInvoice(cancel);
  assert(second.noop());
  assert(second.invoice().last_sequence() == first.invoice().last_sequence());

  cancel.set_invoice_id("inv-missing");
  assert(Throws<payday::util::NotFound>([&] { service.CancelInvoice(cancel); }));
}

void TestSendPaymentAndListEvents() {
  payday::service::PaymentService service(BuildServiceContext());

  payday::v1::SendPaymentRequest send;
  send.set_payment_id("pay-1");
  send.set_payment_request("lnbc500n1example");
  send.set_amount_sat(500);

  const auto sent = service.SendPayment(send);
  assert(sent.payment().status() == payday::v1::PAYMENT_STATUS_SETTLED);
  assert(sent.payment().fee_sat() == 1);

  payday::v1::ListPaymentEventsRequest list;
  list.set_direction(payday::v1::DIRECTION_OUTGOING);
  list.set_id("pay-1");

  const auto events = service.ListPaymentEvents(list);
  assert(events.events_size() == 3);
  assert(events.events(0).event_type() == "PaymentInitiated");
  assert(events.events(0).sequence() == 1);
  assert(events.events(0).event().payment_initiated().amount_sat() == 500);
  assert(events.events(1).event_type() == "PaymentInFlight");
  assert(events.events(2).event_type() == "PaymentSucceeded");
  assert(events.events(2).metadata_json().find("\"source\"") != std::string::npos);

  list.set_after_sequence(2);
  const auto tail = service.ListPaymentEvents(list);
  assert(tail.events_size() == 1);
  assert(tail.events(0).sequence() == 3);
}

void TestLookupErrors() {
  payday::service::PaymentService service(BuildServiceContext());

  payday::v1::GetPaymentRequest get;
  get.set_direction(payday::v1::DIRECTION_OUTGOING);
  get.set_id("pay-missing");
  assert(Throws<payday::util::NotFound>([&] { service.GetPayment(get); }));

  get.set_direction(payday::v1::DIRECTION_UNSPECIFIED);
  assert(Throws<payday::util::InvalidArgument>([&] { service.GetPayment(get); }));

  payday::v1::ListPaymentEventsRequest list;
  list.set_direction(payday::v1::DIRECTION_INCOMING);
  list.set_id("inv-missing");
  assert(Throws<payday::util::NotFound>([&] { service.ListPaymentEvents(list); }));

  payday::v1::SendPaymentRequest send;
  send.set_payment_id("pay-1");
  send.set_amount_sat(500);
  assert(Throws<payday::util::InvalidArgument>([&] { service.SendPayment(send); }));
}

} // namespace

int main() {
  TestCreateAndGetInvoice();
  TestCreateInvoiceGeneratesId();
  TestCancelInvoiceIsIdempotent();
  TestSendPaymentAndListEvents();
  TestLookupErrors();

  std::cout << "payday_unit_payment_service: pass\n";
  return 0;
}
