#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"

namespace payday::eventstore {

// Optional cache of folded aggregate state. A snapshot is only a starting
// point for events with sequence > last_sequence.
class SnapshotStore {
 public:
  explicit SnapshotStore(std::shared_ptr<db::Repository> repository);

  // Returns the stored record with current_snapshot filled in.
  // Throws util::AlreadyExists for a second snapshot at the same sequence.
  db::model::SnapshotRecord Save(db::model::SnapshotRecord snapshot);

  std::optional<db::model::SnapshotRecord> Latest(const std::string& aggregate_type,
                                                  const std::string& aggregate_id) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace payday::eventstore
