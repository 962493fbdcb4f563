#pragma once

#include <string>

namespace payday::db::model {

struct ReferenceRecord {
  std::string node_reference;
  std::string aggregate_type;
  std::string aggregate_id;
};

} // namespace payday::db::model
