#pragma once

#include <cstdint>
#include <string>

namespace payday::db::model {

struct OffsetRecord {
  std::string id;
  uint64_t    current_offset = 0;
  uint64_t    updated_at_ms  = 0;
};

} // namespace payday::db::model
