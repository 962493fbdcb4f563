#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace payday::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result AppendEvents(Transaction&, const std::string& aggregate_type, const std::string& aggregate_id,
                      uint64_t expected_last_sequence, std::vector<model::EventRecord>& events) override;
  std::vector<model::EventRecord> LoadEvents(Transaction&, const std::string& aggregate_type,
                                             const std::string& aggregate_id, uint64_t after_sequence,
                                             std::optional<uint64_t> max_events) override;
  uint64_t LastSequence(Transaction&, const std::string& aggregate_type, const std::string& aggregate_id) override;
  std::vector<model::EventRecord> LoadEventsSince(Transaction&, uint64_t after_position,
                                                  std::optional<uint64_t> max_events) override;

  Result InsertSnapshot(Transaction&, model::SnapshotRecord&) override;
  std::optional<model::SnapshotRecord> GetLatestSnapshot(Transaction&, const std::string& aggregate_type,
                                                         const std::string& aggregate_id) override;

  Result CommitOffset(Transaction&, const model::OffsetRecord&) override;
  std::optional<model::OffsetRecord> GetOffset(Transaction&, const std::string& id) override;

  Result PutReference(Transaction&, const model::ReferenceRecord&) override;
  std::optional<model::ReferenceRecord> FindReference(Transaction&, const std::string& node_reference) override;

private:
  friend class MemoryTransaction;

  struct State {
    // index = global_position - 1
    std::vector<model::EventRecord> log;
    std::unordered_map<std::string, std::vector<size_t>> streams;
    std::unordered_map<std::string, std::vector<model::SnapshotRecord>> snapshots;
    std::unordered_map<std::string, model::OffsetRecord> offsets;
    std::unordered_map<std::string, model::ReferenceRecord> references;
  };

  std::mutex mutex_;
  State committed_;
};

}
