#include "memory_tx.hpp"

#include <utility>

namespace payday::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::TrackAppend(const std::string& stream_key, std::size_t base,
                                    std::vector<model::EventRecord>& records, std::vector<std::size_t> log_indices) {
  stream_bases_.try_emplace(stream_key, base);
  appends_.push_back(PendingAppend{stream_key, &records, std::move(log_indices)});
}

void MemoryTransaction::TrackSnapshot(const std::string& stream_key, const model::SnapshotRecord& record) {
  snapshots_.emplace_back(stream_key, record);
}

void MemoryTransaction::TrackOffset(const model::OffsetRecord& record) {
  offsets_[record.id] = record;
}

void MemoryTransaction::TrackReference(const model::ReferenceRecord& record) {
  references_[record.node_reference] = record;
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::runtime_error("commit after rollback");
  }
  if (Empty()) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  auto&            state = repo_.committed_;

  // validate everything before touching the committed state
  for (const auto& [key, base] : stream_bases_) {
    const auto        it     = state.streams.find(key);
    const std::size_t length = it == state.streams.end() ? 0 : it->second.size();
    if (length != base) {
      throw CommitConflict("transaction conflict: stream " + key + " moved from " + std::to_string(base) + " to " +
                           std::to_string(length) + " events");
    }
  }
  for (const auto& [key, snapshot] : snapshots_) {
    const auto it = state.snapshots.find(key);
    if (it == state.snapshots.end()) {
      continue;
    }
    for (const auto& existing : it->second) {
      if (existing.last_sequence == snapshot.last_sequence) {
        throw CommitConflict("transaction conflict: snapshot " + key + "@" + std::to_string(snapshot.last_sequence) +
                             " was written concurrently");
      }
    }
  }

  for (auto& append : appends_) {
    auto& stream = state.streams[append.stream_key];
    for (std::size_t i = 0; i < append.log_indices.size(); ++i) {
      auto record            = working_.log[append.log_indices[i]];
      record.global_position = static_cast<uint64_t>(state.log.size()) + 1;
      stream.push_back(state.log.size());
      state.log.push_back(record);
      (*append.records)[i].global_position = record.global_position;
    }
  }

  for (auto& [key, snapshot] : snapshots_) {
    auto& existing            = state.snapshots[key];
    snapshot.current_snapshot = static_cast<uint64_t>(existing.size()) + 1;
    existing.push_back(snapshot);
  }

  for (const auto& [id, offset] : offsets_) {
    auto it = state.offsets.find(id);
    if (it == state.offsets.end() || it->second.current_offset < offset.current_offset) {
      state.offsets[id] = offset;
    }
  }

  for (const auto& [reference, record] : references_) {
    state.references[reference] = record;
  }

  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace payday::db::memory
