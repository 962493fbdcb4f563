#pragma once

#include <string>
#include <vector>

namespace payday::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs statements in order. Every statement is idempotent
  (CREATE ... IF NOT EXISTS) so startup can rerun them.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace payday::db::sql
