#include "internal/eventstore/event_store.hpp"

#include "internal/eventstore/store_errors.hpp"
#include "internal/observability/logging.hpp"

namespace payday::eventstore {

namespace {

uint64_t SequenceOf(const db::model::EventRecord& record) {
  return record.sequence;
}

uint64_t PositionOf(const db::model::EventRecord& record) {
  return record.global_position;
}

} // namespace

EventStore::EventStore(std::shared_ptr<db::Repository> repository, std::size_t batch_size)
    : repository_(std::move(repository)), batch_size_(batch_size == 0 ? 256 : batch_size) {
}

std::vector<db::model::EventRecord> EventStore::Append(const std::string& aggregate_type,
                                                       const std::string& aggregate_id,
                                                       uint64_t expected_last_sequence,
                                                       std::vector<db::model::EventRecord> events,
                                                       const std::vector<std::string>& node_references) {
  if (events.empty()) {
    throw util::InvalidArgument("append " + aggregate_type + "/" + aggregate_id + ": no events");
  }

  const std::string what = "append " + aggregate_type + "/" + aggregate_id;
  return GuardStorage(what, [&] {
    auto tx = repository_->Begin();

    auto result = repository_->AppendEvents(*tx, aggregate_type, aggregate_id, expected_last_sequence, events);
    if (result.code == db::ErrorCode::Conflict) {
      throw util::ConcurrencyConflict(aggregate_id, expected_last_sequence, what + ": " + result.message);
    }
    ThrowIfError(result, what);

    for (const auto& reference : node_references) {
      if (reference.empty()) {
        continue;
      }
      ThrowIfError(repository_->PutReference(*tx, {reference, aggregate_type, aggregate_id}), what + " reference");
    }

    try {
      tx->Commit();
    } catch (const db::CommitConflict& e) {
      throw util::ConcurrencyConflict(aggregate_id, expected_last_sequence, what + ": " + e.what());
    }

    PAYDAY_LOG_DEBUG("events appended", {observability::StringField("aggregate_type", aggregate_type),
                                         observability::StringField("aggregate_id", aggregate_id),
                                         observability::IntField("first_sequence", static_cast<int64_t>(events.front().sequence)),
                                         observability::IntField("count", static_cast<int64_t>(events.size()))});
    return events;
  });
}

EventCursor EventStore::Load(const std::string& aggregate_type, const std::string& aggregate_id,
                             uint64_t after_sequence) const {
  auto repository = repository_;
  auto fetch = [repository, aggregate_type, aggregate_id](uint64_t after, uint64_t limit) {
    return GuardStorage("load " + aggregate_type + "/" + aggregate_id, [&] {
      auto tx     = repository->Begin();
      auto events = repository->LoadEvents(*tx, aggregate_type, aggregate_id, after, limit);
      tx->Commit();
      return events;
    });
  };
  return EventCursor(std::move(fetch), &SequenceOf, after_sequence, batch_size_);
}

EventCursor EventStore::LoadAllSince(uint64_t global_position) const {
  auto repository = repository_;
  auto fetch = [repository](uint64_t after, uint64_t limit) {
    return GuardStorage("load log", [&] {
      auto tx     = repository->Begin();
      auto events = repository->LoadEventsSince(*tx, after, limit);
      tx->Commit();
      return events;
    });
  };
  return EventCursor(std::move(fetch), &PositionOf, global_position, batch_size_);
}

uint64_t EventStore::LastSequence(const std::string& aggregate_type, const std::string& aggregate_id) const {
  return GuardStorage("last sequence " + aggregate_type + "/" + aggregate_id, [&] {
    auto tx   = repository_->Begin();
    auto last = repository_->LastSequence(*tx, aggregate_type, aggregate_id);
    tx->Commit();
    return last;
  });
}

std::optional<db::model::ReferenceRecord> EventStore::FindReference(const std::string& node_reference) const {
  return GuardStorage("find reference " + node_reference, [&] {
    auto tx        = repository_->Begin();
    auto reference = repository_->FindReference(*tx, node_reference);
    tx->Commit();
    return reference;
  });
}

} // namespace payday::eventstore
