#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace payday::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
