#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/offset_record.hpp"
#include "internal/db/model/reference_record.hpp"
#include "internal/db/model/snapshot_record.hpp"

namespace payday::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - An append either writes every event or none
  - (aggregate_type, aggregate_id, sequence) is unique
  - global_position is strictly increasing in commit order
  - writers on different aggregates never block or conflict with each other

  The DB is the source of truth for:
    event streams
    snapshots
    consumer offsets
    node reference routing
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Event log
  // ---------------------------------------------------------------------

  // Assigns sequence (expected_last_sequence + 1 ...), global_position and
  // recorded_at_ms on each record. Returns Conflict when the stream's last
  // sequence differs from expected_last_sequence. A backend may settle
  // global_position at Commit(), so `events` must outlive the commit.
  virtual Result AppendEvents(Transaction&, const std::string& aggregate_type, const std::string& aggregate_id,
                              uint64_t expected_last_sequence, std::vector<model::EventRecord>& events) = 0;

  virtual std::vector<model::EventRecord> LoadEvents(Transaction&, const std::string& aggregate_type,
                                                     const std::string& aggregate_id, uint64_t after_sequence,
                                                     std::optional<uint64_t> max_events) = 0;

  // 0 when the stream is empty.
  virtual uint64_t LastSequence(Transaction&, const std::string& aggregate_type, const std::string& aggregate_id) = 0;

  virtual std::vector<model::EventRecord> LoadEventsSince(Transaction&, uint64_t after_position,
                                                          std::optional<uint64_t> max_events) = 0;

  // ---------------------------------------------------------------------
  // Snapshots
  // ---------------------------------------------------------------------

  // Assigns current_snapshot. A snapshot at an existing last_sequence is AlreadyExists.
  virtual Result InsertSnapshot(Transaction&, model::SnapshotRecord&) = 0;

  virtual std::optional<model::SnapshotRecord> GetLatestSnapshot(Transaction&, const std::string& aggregate_type,
                                                                 const std::string& aggregate_id) = 0;

  // ---------------------------------------------------------------------
  // Offsets
  // ---------------------------------------------------------------------

  // Never moves an offset backwards; a lower value is ignored.
  virtual Result CommitOffset(Transaction&, const model::OffsetRecord&) = 0;

  virtual std::optional<model::OffsetRecord> GetOffset(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Node references
  // ---------------------------------------------------------------------

  // Insert or repoint a reference to the given aggregate.
  virtual Result PutReference(Transaction&, const model::ReferenceRecord&) = 0;

  virtual std::optional<model::ReferenceRecord> FindReference(Transaction&, const std::string& node_reference) = 0;
};

} // namespace payday::db
