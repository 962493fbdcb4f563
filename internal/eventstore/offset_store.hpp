#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace payday::eventstore {

// Durable cursor per named consumer. 0 means nothing processed yet.
class OffsetStore {
 public:
  explicit OffsetStore(std::shared_ptr<db::Repository> repository);

  uint64_t Get(const std::string& id) const;

  // Monotonic: committing a value below the stored one leaves it unchanged.
  void Commit(const std::string& id, uint64_t offset);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace payday::eventstore
