#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/eventstore/event_cursor.hpp"

namespace payday::eventstore {

/*
  Append-only event log over a db::Repository.

  Append is the only serialization point for an aggregate: it succeeds only
  if the stream is still at expected_last_sequence, otherwise it throws
  util::ConcurrencyConflict and nothing is written. Other backend failures
  throw util::StorageError.
*/
class EventStore {
 public:
  explicit EventStore(std::shared_ptr<db::Repository> repository, std::size_t batch_size = 256);

  // Returns the events with sequence, global_position and recorded_at_ms
  // filled in. node_references are routed to this aggregate in the same
  // transaction.
  std::vector<db::model::EventRecord> Append(const std::string& aggregate_type, const std::string& aggregate_id,
                                             uint64_t expected_last_sequence,
                                             std::vector<db::model::EventRecord> events,
                                             const std::vector<std::string>& node_references = {});

  // Events with sequence > after_sequence, ascending.
  EventCursor Load(const std::string& aggregate_type, const std::string& aggregate_id,
                   uint64_t after_sequence = 0) const;

  // Events with global_position > global_position, ascending.
  EventCursor LoadAllSince(uint64_t global_position) const;

  uint64_t LastSequence(const std::string& aggregate_type, const std::string& aggregate_id) const;

  // Aggregate a node reference (payment hash, invoice address, ...) was routed to.
  std::optional<db::model::ReferenceRecord> FindReference(const std::string& node_reference) const;

 private:
  std::shared_ptr<db::Repository> repository_;
  std::size_t                     batch_size_;
};

} // namespace payday::eventstore
