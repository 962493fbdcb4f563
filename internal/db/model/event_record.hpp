#pragma once

#include <cstdint>
#include <string>

namespace payday::db::model {

struct EventRecord {
  uint64_t    global_position = 0;
  std::string aggregate_type;
  std::string aggregate_id;
  uint64_t    sequence = 0;
  std::string event_type;
  std::string event_version;
  std::string payload;
  std::string metadata;
  uint64_t    recorded_at_ms = 0;
};

} // namespace payday::db::model
