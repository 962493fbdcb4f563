#include "memory_repository.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace payday::db::memory {

namespace {

std::string StreamKey(const std::string& aggregate_type, const std::string& aggregate_id) {
  return aggregate_type + "#" + aggregate_id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvents(Transaction& t, const std::string& aggregate_type,
                                      const std::string& aggregate_id, uint64_t expected_last_sequence,
                                      std::vector<model::EventRecord>& events) {
  auto&       tx     = TX(t);
  auto&       s      = tx.Mutable();
  const auto  key    = StreamKey(aggregate_type, aggregate_id);
  auto&       stream = s.streams[key];
  const auto  last   = static_cast<uint64_t>(stream.size());
  if (last != expected_last_sequence) {
    return Result::Err(ErrorCode::Conflict, "expected sequence " + std::to_string(expected_last_sequence) +
                                                " but stream is at " + std::to_string(last));
  }

  for (const auto& event : events) {
    if (event.event_type.empty()) {
      return Result::Err(ErrorCode::ConstraintViolation, "event_type is required");
    }
  }

  const uint64_t      now      = util::NowMs();
  uint64_t            sequence = expected_last_sequence;
  std::vector<size_t> indices;
  indices.reserve(events.size());
  for (auto& event : events) {
    event.aggregate_type  = aggregate_type;
    event.aggregate_id    = aggregate_id;
    event.sequence        = ++sequence;
    // provisional; Commit() assigns the final position
    event.global_position = static_cast<uint64_t>(s.log.size()) + 1;
    if (event.recorded_at_ms == 0) {
      event.recorded_at_ms = now;
    }
    indices.push_back(s.log.size());
    stream.push_back(s.log.size());
    s.log.push_back(event);
  }
  tx.TrackAppend(key, static_cast<size_t>(last), events, std::move(indices));
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::LoadEvents(Transaction& t, const std::string& aggregate_type,
                                                             const std::string& aggregate_id, uint64_t after_sequence,
                                                             std::optional<uint64_t> max_events) {
  std::vector<model::EventRecord> out;
  const auto&                     s  = TX(t).View();
  const auto                      it = s.streams.find(StreamKey(aggregate_type, aggregate_id));
  if (it == s.streams.end()) {
    return out;
  }

  // stream index i holds sequence i + 1
  for (size_t i = after_sequence; i < it->second.size(); ++i) {
    if (max_events.has_value() && out.size() >= *max_events) {
      break;
    }
    out.push_back(s.log[it->second[i]]);
  }
  return out;
}

uint64_t MemoryRepository::LastSequence(Transaction& t, const std::string& aggregate_type,
                                        const std::string& aggregate_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.streams.find(StreamKey(aggregate_type, aggregate_id));
  return it == s.streams.end() ? 0 : static_cast<uint64_t>(it->second.size());
}

std::vector<model::EventRecord> MemoryRepository::LoadEventsSince(Transaction& t, uint64_t after_position,
                                                                  std::optional<uint64_t> max_events) {
  std::vector<model::EventRecord> out;
  const auto&                     s = TX(t).View();
  for (size_t i = after_position; i < s.log.size(); ++i) {
    if (max_events.has_value() && out.size() >= *max_events) {
      break;
    }
    out.push_back(s.log[i]);
  }
  return out;
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result MemoryRepository::InsertSnapshot(Transaction& t, model::SnapshotRecord& record) {
  auto&      tx        = TX(t);
  const auto key       = StreamKey(record.aggregate_type, record.aggregate_id);
  auto&      snapshots = tx.Mutable().snapshots[key];
  for (const auto& existing : snapshots) {
    if (existing.last_sequence == record.last_sequence) {
      return Result::Err(ErrorCode::AlreadyExists, "snapshot exists at sequence " + std::to_string(record.last_sequence));
    }
  }

  record.current_snapshot = static_cast<uint64_t>(snapshots.size()) + 1;
  if (record.created_at_ms == 0) {
    record.created_at_ms = util::NowMs();
  }
  snapshots.push_back(record);
  tx.TrackSnapshot(key, record);
  return Result::Ok();
}

std::optional<model::SnapshotRecord> MemoryRepository::GetLatestSnapshot(Transaction& t,
                                                                         const std::string& aggregate_type,
                                                                         const std::string& aggregate_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.snapshots.find(StreamKey(aggregate_type, aggregate_id));
  if (it == s.snapshots.end() || it->second.empty()) {
    return std::nullopt;
  }

  return *std::max_element(it->second.begin(), it->second.end(),
                           [](const auto& a, const auto& b) { return a.last_sequence < b.last_sequence; });
}

// ------------------------------------------------------------------
// Offsets
// ------------------------------------------------------------------

Result MemoryRepository::CommitOffset(Transaction& t, const model::OffsetRecord& record) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  auto  it = s.offsets.find(record.id);
  if (it != s.offsets.end() && it->second.current_offset >= record.current_offset) {
    return Result::Ok();
  }

  auto updated = record;
  if (updated.updated_at_ms == 0) {
    updated.updated_at_ms = util::NowMs();
  }
  tx.TrackOffset(updated);
  s.offsets[updated.id] = std::move(updated);
  return Result::Ok();
}

std::optional<model::OffsetRecord> MemoryRepository::GetOffset(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  const auto  it = s.offsets.find(id);
  if (it == s.offsets.end()) {
    return std::nullopt;
  }
  return it->second;
}

// ------------------------------------------------------------------
// Node references
// ------------------------------------------------------------------

Result MemoryRepository::PutReference(Transaction& t, const model::ReferenceRecord& record) {
  if (record.node_reference.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "empty node reference");
  }
  auto& tx                                      = TX(t);
  tx.Mutable().references[record.node_reference] = record;
  tx.TrackReference(record);
  return Result::Ok();
}

std::optional<model::ReferenceRecord> MemoryRepository::FindReference(Transaction& t,
                                                                      const std::string& node_reference) {
  const auto& s  = TX(t).View();
  const auto  it = s.references.find(node_reference);
  if (it == s.references.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace payday::db::memory
