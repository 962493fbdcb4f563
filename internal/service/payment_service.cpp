#include "payment_service.hpp"

#include <string>
#include <string_view>

#include "internal/aggregate/payment_codec.hpp"
#include "internal/command/command_handler.hpp"
#include "internal/eventstore/event_codec.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace payday::service {

using namespace payday::v1;

namespace {

model::Direction RequireDirection(payday::v1::Direction direction) {
  const auto parsed = aggregate::FromProto(direction);
  if (parsed == model::Direction::kUnspecified) {
    throw util::InvalidArgument("direction is required");
  }
  return parsed;
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& id, Fn&& fn) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    PAYDAY_LOG_ERROR("RPC failed", {observability::StringField("route", route),
                                    observability::StringField("id", id),
                                    observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace

PaymentService::PaymentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateInvoiceResponse PaymentService::CreateInvoice(const CreateInvoiceRequest& req) {
  const auto id = req.invoice_id().empty() ? util::NewId() : req.invoice_id();
  return ObserveRpc("CreateInvoice", id, [&] {
    command::CreateInvoice cmd;
    cmd.invoice_id     = id;
    cmd.amount_sat     = req.amount_sat();
    cmd.expiry_seconds = req.expiry_seconds();
    cmd.memo           = req.memo();
    cmd.on_chain       = req.on_chain();

    auto result = ctx_.handler->Handle(cmd);

    CreateInvoiceResponse resp;
    *resp.mutable_invoice() = aggregate::ToProto(result.state);
    return resp;
  });
}

CancelInvoiceResponse PaymentService::CancelInvoice(const CancelInvoiceRequest& req) {
  return ObserveRpc("CancelInvoice", req.invoice_id(), [&] {
    auto result = ctx_.handler->Handle(command::CancelInvoice{req.invoice_id(), req.reason()});

    CancelInvoiceResponse resp;
    *resp.mutable_invoice() = aggregate::ToProto(result.state);
    resp.set_noop(result.noop);
    return resp;
  });
}

SendPaymentResponse PaymentService::SendPayment(const SendPaymentRequest& req) {
  const auto id = req.payment_id().empty() ? util::NewId() : req.payment_id();
  return ObserveRpc("SendPayment", id, [&] {
    auto result = ctx_.handler->Handle(command::SendPayment{id, req.payment_request(), req.amount_sat()});

    SendPaymentResponse resp;
    *resp.mutable_payment() = aggregate::ToProto(result.state);
    return resp;
  });
}

GetPaymentResponse PaymentService::GetPayment(const GetPaymentRequest& req) {
  return ObserveRpc("GetPayment", req.id(), [&] {
    auto payment = ctx_.handler->Load(RequireDirection(req.direction()), req.id());
    if (!payment.Exists()) {
      throw util::NotFound("payment not found: " + req.id());
    }

    GetPaymentResponse resp;
    *resp.mutable_payment() = aggregate::ToProto(payment);
    return resp;
  });
}

ListPaymentEventsResponse PaymentService::ListPaymentEvents(const ListPaymentEventsRequest& req) {
  return ObserveRpc("ListPaymentEvents", req.id(), [&] {
    const auto direction = RequireDirection(req.direction());
    if (req.id().empty()) {
      throw util::InvalidArgument("id is required");
    }

    const auto aggregate_type = model::AggregateType(direction);
    if (ctx_.events->LastSequence(aggregate_type, req.id()) == 0) {
      throw util::NotFound("payment not found: " + req.id());
    }

    ListPaymentEventsResponse resp;
    auto cursor = ctx_.events->Load(aggregate_type, req.id(), req.after_sequence());
    while (auto record = cursor.Next()) {
      auto* out = resp.add_events();
      out->set_aggregate_type(record->aggregate_type);
      out->set_aggregate_id(record->aggregate_id);
      out->set_sequence(record->sequence);
      out->set_global_position(record->global_position);
      out->set_event_type(record->event_type);
      out->set_event_version(record->event_version);
      *out->mutable_event() = eventstore::DecodeEvent(*record);
      out->set_metadata_json(record->metadata);
    }
    return resp;
  });
}

}
