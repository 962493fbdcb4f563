#include "internal/eventstore/event_codec.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace payday::eventstore {

namespace {

using google::protobuf::FieldDescriptor;

const google::protobuf::OneofDescriptor* KindOneof() {
  return payday::v1::PaymentEvent::descriptor()->FindOneofByName("kind");
}

const FieldDescriptor* FieldForType(const std::string& event_type) {
  const auto* oneof = KindOneof();
  for (int i = 0; i < oneof->field_count(); ++i) {
    const auto* field = oneof->field(i);
    if (field->message_type()->name() == event_type) {
      return field;
    }
  }
  return nullptr;
}

const FieldDescriptor* SetField(const payday::v1::PaymentEvent& event) {
  return event.GetReflection()->GetOneofFieldDescriptor(event, KindOneof());
}

} // namespace

std::string EventTypeName(const payday::v1::PaymentEvent& event) {
  const auto* field = SetField(event);
  if (field == nullptr) {
    throw util::InvalidArgument("event has no kind set");
  }
  return std::string(field->message_type()->name());
}

db::model::EventRecord EncodeEvent(const payday::v1::PaymentEvent& event, const EventMetadata& metadata) {
  const auto* field = SetField(event);
  if (field == nullptr) {
    throw util::InvalidArgument("event has no kind set");
  }

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  db::model::EventRecord record;
  record.event_type    = std::string(field->message_type()->name());
  record.event_version = kEventVersion;

  const auto& inner  = event.GetReflection()->GetMessage(event, field);
  auto        status = google::protobuf::util::MessageToJsonString(inner, &record.payload, options);
  if (!status.ok()) {
    throw util::InvalidArgument("encode " + record.event_type + ": " + std::string(status.message()));
  }

  google::protobuf::Struct meta;
  (*meta.mutable_fields())["source"].set_string_value(metadata.source);
  (*meta.mutable_fields())["correlation_id"].set_string_value(metadata.correlation_id);
  status = google::protobuf::util::MessageToJsonString(meta, &record.metadata);
  if (!status.ok()) {
    throw util::InvalidArgument("encode metadata: " + std::string(status.message()));
  }
  return record;
}

payday::v1::PaymentEvent DecodeEvent(const db::model::EventRecord& record) {
  const auto* field = FieldForType(record.event_type);
  if (field == nullptr) {
    throw util::StorageError("unknown event type '" + record.event_type + "' at " + record.aggregate_type + "/" +
                             record.aggregate_id + "#" + std::to_string(record.sequence));
  }

  payday::v1::PaymentEvent event;
  auto* inner = event.GetReflection()->MutableMessage(&event, field);

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(record.payload, inner, options);
  if (!status.ok()) {
    throw util::StorageError("malformed " + record.event_type + " payload at " + record.aggregate_type + "/" +
                             record.aggregate_id + "#" + std::to_string(record.sequence) + ": " +
                             std::string(status.message()));
  }
  return event;
}

EventMetadata DecodeMetadata(const std::string& json) {
  EventMetadata metadata;
  if (json.empty()) {
    return metadata;
  }

  google::protobuf::Struct meta;
  if (!google::protobuf::util::JsonStringToMessage(json, &meta).ok()) {
    return metadata;
  }

  const auto& fields = meta.fields();
  if (auto it = fields.find("source"); it != fields.end()) {
    metadata.source = it->second.string_value();
  }
  if (auto it = fields.find("correlation_id"); it != fields.end()) {
    metadata.correlation_id = it->second.string_value();
  }
  return metadata;
}

} // namespace payday::eventstore
