#include "internal/eventstore/snapshot_store.hpp"

#include "internal/eventstore/store_errors.hpp"

namespace payday::eventstore {

SnapshotStore::SnapshotStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::SnapshotRecord SnapshotStore::Save(db::model::SnapshotRecord snapshot) {
  const std::string what = "snapshot " + snapshot.aggregate_type + "/" + snapshot.aggregate_id;
  return GuardStorage(what, [&] {
    auto tx     = repository_->Begin();
    auto result = repository_->InsertSnapshot(*tx, snapshot);
    if (result.code == db::ErrorCode::AlreadyExists) {
      throw util::AlreadyExists(what + " at sequence " + std::to_string(snapshot.last_sequence));
    }
    ThrowIfError(result, what);
    tx->Commit();
    return snapshot;
  });
}

std::optional<db::model::SnapshotRecord> SnapshotStore::Latest(const std::string& aggregate_type,
                                                               const std::string& aggregate_id) const {
  return GuardStorage("latest snapshot " + aggregate_type + "/" + aggregate_id, [&] {
    auto tx       = repository_->Begin();
    auto snapshot = repository_->GetLatestSnapshot(*tx, aggregate_type, aggregate_id);
    tx->Commit();
    return snapshot;
  });
}

} // namespace payday::eventstore
