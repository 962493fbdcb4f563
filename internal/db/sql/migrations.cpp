#include "internal/db/sql/migrations.hpp"

namespace payday::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS events ("
      "global_position INTEGER PRIMARY KEY AUTOINCREMENT, "
      "aggregate_type TEXT NOT NULL, aggregate_id TEXT NOT NULL, sequence INTEGER NOT NULL CHECK(sequence > 0), "
      "event_type TEXT NOT NULL CHECK(event_type <> ''), event_version TEXT NOT NULL, payload TEXT NOT NULL, "
      "metadata TEXT NOT NULL, recorded_at_ms INTEGER NOT NULL, "
      "UNIQUE(aggregate_type, aggregate_id, sequence));",
      "CREATE TABLE IF NOT EXISTS snapshots ("
      "aggregate_type TEXT NOT NULL, aggregate_id TEXT NOT NULL, last_sequence INTEGER NOT NULL, "
      "current_snapshot INTEGER NOT NULL, payload TEXT NOT NULL, created_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY(aggregate_type, aggregate_id, last_sequence));",
      "CREATE TABLE IF NOT EXISTS offsets ("
      "id TEXT PRIMARY KEY, current_offset INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS payment_references ("
      "node_reference TEXT PRIMARY KEY, aggregate_type TEXT NOT NULL, aggregate_id TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES(1, unixepoch() * 1000);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS events ("
      "global_position BIGSERIAL PRIMARY KEY, "
      "aggregate_type TEXT NOT NULL, aggregate_id TEXT NOT NULL, sequence BIGINT NOT NULL CHECK(sequence > 0), "
      "event_type TEXT NOT NULL CHECK(event_type <> ''), event_version TEXT NOT NULL, payload JSONB NOT NULL, "
      "metadata JSONB NOT NULL, recorded_at_ms BIGINT NOT NULL, "
      "transaction_id XID8 NOT NULL DEFAULT pg_current_xact_id(), "
      "UNIQUE(aggregate_type, aggregate_id, sequence));",
      "ALTER TABLE events ADD COLUMN IF NOT EXISTS transaction_id XID8 NOT NULL DEFAULT pg_current_xact_id();",
      "CREATE TABLE IF NOT EXISTS snapshots ("
      "aggregate_type TEXT NOT NULL, aggregate_id TEXT NOT NULL, last_sequence BIGINT NOT NULL, "
      "current_snapshot BIGINT NOT NULL, payload JSONB NOT NULL, created_at_ms BIGINT NOT NULL, "
      "PRIMARY KEY(aggregate_type, aggregate_id, last_sequence));",
      "CREATE TABLE IF NOT EXISTS offsets ("
      "id TEXT PRIMARY KEY, current_offset BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS payment_references ("
      "node_reference TEXT PRIMARY KEY, aggregate_type TEXT NOT NULL, aggregate_id TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",
      "INSERT INTO schema_migrations(version) VALUES(1) ON CONFLICT DO NOTHING;"};
  return kSchema;
}

} // namespace payday::db::sql
