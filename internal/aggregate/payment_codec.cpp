#include "internal/aggregate/payment_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace payday::aggregate {

payday::v1::PaymentStatus ToProto(model::PaymentStatus status) {
  switch (status) {
    case model::PaymentStatus::kAwaitingPayment:
      return payday::v1::PAYMENT_STATUS_AWAITING_PAYMENT;
    case model::PaymentStatus::kInFlight:
      return payday::v1::PAYMENT_STATUS_IN_FLIGHT;
    case model::PaymentStatus::kSettled:
      return payday::v1::PAYMENT_STATUS_SETTLED;
    case model::PaymentStatus::kExpired:
      return payday::v1::PAYMENT_STATUS_EXPIRED;
    case model::PaymentStatus::kFailed:
      return payday::v1::PAYMENT_STATUS_FAILED;
    case model::PaymentStatus::kCanceled:
      return payday::v1::PAYMENT_STATUS_CANCELED;
    default:
      return payday::v1::PAYMENT_STATUS_UNSPECIFIED;
  }
}

static model::PaymentStatus StatusFromProto(payday::v1::PaymentStatus status) {
  switch (status) {
    case payday::v1::PAYMENT_STATUS_AWAITING_PAYMENT:
      return model::PaymentStatus::kAwaitingPayment;
    case payday::v1::PAYMENT_STATUS_IN_FLIGHT:
      return model::PaymentStatus::kInFlight;
    case payday::v1::PAYMENT_STATUS_SETTLED:
      return model::PaymentStatus::kSettled;
    case payday::v1::PAYMENT_STATUS_EXPIRED:
      return model::PaymentStatus::kExpired;
    case payday::v1::PAYMENT_STATUS_FAILED:
      return model::PaymentStatus::kFailed;
    case payday::v1::PAYMENT_STATUS_CANCELED:
      return model::PaymentStatus::kCanceled;
    default:
      return model::PaymentStatus::kUnspecified;
  }
}

payday::v1::FailureReason ToProto(model::FailureReason reason) {
  switch (reason) {
    case model::FailureReason::kUnderpaid:
      return payday::v1::FAILURE_REASON_UNDERPAID;
    case model::FailureReason::kRouteNotFound:
      return payday::v1::FAILURE_REASON_ROUTE_NOT_FOUND;
    case model::FailureReason::kInsufficientBalance:
      return payday::v1::FAILURE_REASON_INSUFFICIENT_BALANCE;
    case model::FailureReason::kTimeout:
      return payday::v1::FAILURE_REASON_TIMEOUT;
    case model::FailureReason::kNodeError:
      return payday::v1::FAILURE_REASON_NODE_ERROR;
    default:
      return payday::v1::FAILURE_REASON_UNSPECIFIED;
  }
}

model::FailureReason FromProto(payday::v1::FailureReason reason) {
  switch (reason) {
    case payday::v1::FAILURE_REASON_UNDERPAID:
      return model::FailureReason::kUnderpaid;
    case payday::v1::FAILURE_REASON_ROUTE_NOT_FOUND:
      return model::FailureReason::kRouteNotFound;
    case payday::v1::FAILURE_REASON_INSUFFICIENT_BALANCE:
      return model::FailureReason::kInsufficientBalance;
    case payday::v1::FAILURE_REASON_TIMEOUT:
      return model::FailureReason::kTimeout;
    case payday::v1::FAILURE_REASON_NODE_ERROR:
      return model::FailureReason::kNodeError;
    default:
      return model::FailureReason::kUnspecified;
  }
}

model::SettlementSource FromProto(payday::v1::SettlementSource source) {
  switch (source) {
    case payday::v1::SETTLEMENT_SOURCE_LIGHTNING:
      return model::SettlementSource::kLightning;
    case payday::v1::SETTLEMENT_SOURCE_ONCHAIN:
      return model::SettlementSource::kOnChain;
    default:
      return model::SettlementSource::kUnspecified;
  }
}

static payday::v1::SettlementSource SourceToProto(model::SettlementSource source) {
  switch (source) {
    case model::SettlementSource::kLightning:
      return payday::v1::SETTLEMENT_SOURCE_LIGHTNING;
    case model::SettlementSource::kOnChain:
      return payday::v1::SETTLEMENT_SOURCE_ONCHAIN;
    default:
      return payday::v1::SETTLEMENT_SOURCE_UNSPECIFIED;
  }
}

model::Direction FromProto(payday::v1::Direction direction) {
  switch (direction) {
    case payday::v1::DIRECTION_INCOMING:
      return model::Direction::kIncoming;
    case payday::v1::DIRECTION_OUTGOING:
      return model::Direction::kOutgoing;
    default:
      return model::Direction::kUnspecified;
  }
}

payday::v1::Payment ToProto(const model::Payment& payment) {
  payday::v1::Payment proto;
  proto.set_id(payment.id);
  switch (payment.direction) {
    case model::Direction::kIncoming:
      proto.set_direction(payday::v1::DIRECTION_INCOMING);
      break;
    case model::Direction::kOutgoing:
      proto.set_direction(payday::v1::DIRECTION_OUTGOING);
      break;
    default:
      proto.set_direction(payday::v1::DIRECTION_UNSPECIFIED);
      break;
  }
  proto.set_status(ToProto(payment.status));
  proto.set_amount_requested(payment.amount_requested);
  proto.set_amount_settled(payment.amount_settled);
  proto.set_node_id(payment.node_id);
  proto.set_node_reference(payment.node_reference);
  proto.set_payment_request(payment.payment_request);
  proto.set_memo(payment.memo);
  proto.set_expires_at_ms(payment.expires_at_ms);
  proto.set_created_at_ms(payment.created_at_ms);
  proto.set_settled_at_ms(payment.settled_at_ms.value_or(0));
  proto.set_failure_reason(ToProto(payment.failure_reason.value_or(model::FailureReason::kUnspecified)));
  proto.set_overpaid(payment.overpaid);
  proto.set_fee_sat(payment.fee_sat);
  proto.set_preimage(payment.preimage);
  proto.set_settled_via(SourceToProto(payment.settled_via));
  proto.set_transaction_id(payment.transaction_id);
  proto.set_last_sequence(payment.last_sequence);
  proto.set_onchain_address(payment.onchain_address);
  proto.set_pending_amount_sat(payment.pending_amount_sat);
  proto.set_pending_transaction_id(payment.pending_transaction_id);
  return proto;
}

model::Payment FromProto(const payday::v1::Payment& proto) {
  model::Payment payment;
  payment.id               = proto.id();
  payment.direction        = FromProto(proto.direction());
  payment.status           = StatusFromProto(proto.status());
  payment.amount_requested = proto.amount_requested();
  payment.amount_settled   = proto.amount_settled();
  payment.node_id          = proto.node_id();
  payment.node_reference   = proto.node_reference();
  payment.payment_request  = proto.payment_request();
  payment.memo             = proto.memo();
  payment.expires_at_ms    = proto.expires_at_ms();
  payment.created_at_ms    = proto.created_at_ms();
  if (proto.settled_at_ms() != 0) {
    payment.settled_at_ms = proto.settled_at_ms();
  }
  if (proto.failure_reason() != payday::v1::FAILURE_REASON_UNSPECIFIED) {
    payment.failure_reason = FromProto(proto.failure_reason());
  }
  payment.overpaid       = proto.overpaid();
  payment.fee_sat        = proto.fee_sat();
  payment.preimage       = proto.preimage();
  payment.settled_via    = FromProto(proto.settled_via());
  payment.transaction_id = proto.transaction_id();
  payment.last_sequence  = proto.last_sequence();

  payment.onchain_address        = proto.onchain_address();
  payment.pending_amount_sat     = proto.pending_amount_sat();
  payment.pending_transaction_id = proto.pending_transaction_id();
  return payment;
}

std::string EncodeSnapshot(const model::Payment& payment) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(payment), &json, options);
  if (!status.ok()) {
    throw util::StorageError("encode snapshot for " + payment.id + ": " + std::string(status.message()));
  }
  return json;
}

model::Payment DecodeSnapshot(const std::string& payload) {
  payday::v1::Payment proto;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(payload, &proto, options);
  if (!status.ok()) {
    throw util::StorageError("malformed snapshot payload: " + std::string(status.message()));
  }
  return FromProto(proto);
}

} // namespace payday::aggregate
