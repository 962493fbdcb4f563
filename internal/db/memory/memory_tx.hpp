#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace payday::db::memory {

/*
  Transaction = snapshot + write set

  Reads see the snapshot taken at Begin() plus this transaction's writes.
  Commit() replays the write set onto the committed state. It fails only
  when a stream this transaction appended to grew after the snapshot, or
  a snapshot it inserted was taken by someone else; writers on different
  aggregates never conflict.

  Events get their final global_position at Commit(), in commit order,
  and the records passed to AppendEvents are updated in place.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  // base is the stream length this transaction saw before its first append.
  void TrackAppend(const std::string& stream_key, std::size_t base, std::vector<model::EventRecord>& records,
                   std::vector<std::size_t> log_indices);
  void TrackSnapshot(const std::string& stream_key, const model::SnapshotRecord& record);
  void TrackOffset(const model::OffsetRecord& record);
  void TrackReference(const model::ReferenceRecord& record);

 private:
  struct PendingAppend {
    std::string                      stream_key;
    std::vector<model::EventRecord>* records = nullptr;
    std::vector<std::size_t>         log_indices;
  };

  bool Empty() const {
    return appends_.empty() && snapshots_.empty() && offsets_.empty() && references_.empty();
  }

  MemoryRepository&       repo_;
  MemoryRepository::State working_;

  std::map<std::string, std::size_t>                         stream_bases_;
  std::vector<PendingAppend>                                 appends_;
  std::vector<std::pair<std::string, model::SnapshotRecord>> snapshots_;
  std::map<std::string, model::OffsetRecord>                 offsets_;
  std::map<std::string, model::ReferenceRecord>              references_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace payday::db::memory
