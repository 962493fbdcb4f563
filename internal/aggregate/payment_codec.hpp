#pragma once

#include <string>

#include "internal/model/payment.hpp"
#include "payday/v1.hpp"

namespace payday::aggregate {

payday::v1::Payment ToProto(const model::Payment& payment);
model::Payment FromProto(const payday::v1::Payment& proto);

payday::v1::PaymentStatus ToProto(model::PaymentStatus status);
payday::v1::FailureReason ToProto(model::FailureReason reason);
model::FailureReason FromProto(payday::v1::FailureReason reason);
model::SettlementSource FromProto(payday::v1::SettlementSource source);
model::Direction FromProto(payday::v1::Direction direction);

// Snapshot payload: the Payment message as JSON.
std::string EncodeSnapshot(const model::Payment& payment);

// Throws util::StorageError on a malformed payload.
model::Payment DecodeSnapshot(const std::string& payload);

} // namespace payday::aggregate
