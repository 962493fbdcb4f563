#include "internal/eventstore/offset_store.hpp"

#include "internal/eventstore/store_errors.hpp"

namespace payday::eventstore {

namespace {

constexpr int kCommitAttempts = 3;

} // namespace

OffsetStore::OffsetStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

uint64_t OffsetStore::Get(const std::string& id) const {
  return GuardStorage("get offset " + id, [&] {
    auto tx     = repository_->Begin();
    auto record = repository_->GetOffset(*tx, id);
    tx->Commit();
    return record.has_value() ? record->current_offset : uint64_t{0};
  });
}

void OffsetStore::Commit(const std::string& id, uint64_t offset) {
  const std::string what = "commit offset " + id;
  GuardStorage(what, [&] {
    // commits only ever raise the stored value, so a lost race is safe to rerun
    for (int attempt = 1;; ++attempt) {
      auto tx = repository_->Begin();
      ThrowIfError(repository_->CommitOffset(*tx, {id, offset, 0}), what);
      try {
        tx->Commit();
        return;
      } catch (const db::CommitConflict&) {
        if (attempt >= kCommitAttempts) {
          throw;
        }
      }
    }
  });
}

} // namespace payday::eventstore
