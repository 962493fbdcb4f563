#pragma once

#include <string>

#include "internal/db/model/event_record.hpp"
#include "payday/v1.hpp"

namespace payday::eventstore {

inline constexpr const char* kEventVersion = "1.0.0";

struct EventMetadata {
  std::string source;
  std::string correlation_id;
};

/*
  Stored event encoding.

  event_type is the name of the message held in the PaymentEvent oneof
  ("InvoiceCreated", "PaymentFailed", ...); payload is that message as JSON.
*/

// Throws util::InvalidArgument when no event kind is set.
std::string EventTypeName(const payday::v1::PaymentEvent& event);

// Record ready for append; sequence and positions are assigned by the store.
db::model::EventRecord EncodeEvent(const payday::v1::PaymentEvent& event, const EventMetadata& metadata);

// Throws util::StorageError for an unknown event_type or a malformed payload.
payday::v1::PaymentEvent DecodeEvent(const db::model::EventRecord& record);

EventMetadata DecodeMetadata(const std::string& json);

} // namespace payday::eventstore
