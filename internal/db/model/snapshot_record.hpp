#pragma once

#include <cstdint>
#include <string>

namespace payday::db::model {

struct SnapshotRecord {
  std::string aggregate_type;
  std::string aggregate_id;
  uint64_t    last_sequence    = 0;
  uint64_t    current_snapshot = 0;
  std::string payload;
  uint64_t    created_at_ms = 0;
};

} // namespace payday::db::model
