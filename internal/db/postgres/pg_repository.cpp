#include "pg_repository.hpp"

#include "internal/util/time.hpp"

namespace payday::db::postgres {

namespace {

constexpr const char* kEventColumns =
    "global_position,aggregate_type,aggregate_id,sequence,event_type,event_version,"
    "payload::text,metadata::text,recorded_at_ms";

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord r;
  r.global_position = row[0].as<uint64_t>();
  r.aggregate_type  = row[1].c_str();
  r.aggregate_id    = row[2].c_str();
  r.sequence        = row[3].as<uint64_t>();
  r.event_type      = row[4].c_str();
  r.event_version   = row[5].c_str();
  r.payload         = row[6].c_str();
  r.metadata        = row[7].c_str();
  r.recorded_at_ms  = row[8].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ---------------------------------------------------------------------
// Event log
// ---------------------------------------------------------------------

Result PgRepository::AppendEvents(Transaction& t, const std::string& aggregate_type, const std::string& aggregate_id,
                                  uint64_t expected_last_sequence, std::vector<model::EventRecord>& events) {
  try {
    auto& work = TX(t).Work();
    // one writer per stream; other aggregates append in parallel
    work.exec_params("SELECT pg_advisory_xact_lock(hashtext($1), hashtext($2));", aggregate_type, aggregate_id);

    auto last_res = work.exec_prepared("last_sequence", aggregate_type, aggregate_id);
    const auto last = last_res[0][0].as<uint64_t>();
    if (last != expected_last_sequence) {
      return Result::Err(ErrorCode::Conflict, "expected sequence " + std::to_string(expected_last_sequence) +
                                                  " but stream is at " + std::to_string(last));
    }

    const uint64_t now      = util::NowMs();
    uint64_t       sequence = expected_last_sequence;
    for (auto& e : events) {
      e.aggregate_type = aggregate_type;
      e.aggregate_id   = aggregate_id;
      e.sequence       = ++sequence;
      if (e.recorded_at_ms == 0) {
        e.recorded_at_ms = now;
      }

      auto res = work.exec_prepared("insert_event", e.aggregate_type, e.aggregate_id, e.sequence, e.event_type,
                                    e.event_version, e.payload, e.metadata.empty() ? "{}" : e.metadata,
                                    e.recorded_at_ms);
      e.global_position = res[0][0].as<uint64_t>();
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::LoadEvents(Transaction& t, const std::string& aggregate_type,
                                                         const std::string& aggregate_id, uint64_t after_sequence,
                                                         std::optional<uint64_t> max_events) {
  std::string sql = std::string("SELECT ") + kEventColumns +
                    " FROM events WHERE aggregate_type=$1 AND aggregate_id=$2 AND sequence>$3 ORDER BY sequence ASC";
  if (max_events.has_value()) {
    sql += " LIMIT " + std::to_string(*max_events);
  }
  sql += ";";

  auto res = TX(t).Work().exec_params(sql, aggregate_type, aggregate_id, after_sequence);

  std::vector<model::EventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadEvent(row));
  }
  return out;
}

uint64_t PgRepository::LastSequence(Transaction& t, const std::string& aggregate_type, const std::string& aggregate_id) {
  auto res = TX(t).Work().exec_prepared("last_sequence", aggregate_type, aggregate_id);
  return res[0][0].as<uint64_t>();
}

std::vector<model::EventRecord> PgRepository::LoadEventsSince(Transaction& t, uint64_t after_position,
                                                              std::optional<uint64_t> max_events) {
  // Positions are drawn at insert, so a later position can commit first. Rows
  // from transactions at or above the snapshot's xmin are held back until every
  // earlier writer has finished, which keeps the tail free of gaps.
  std::string sql = std::string("SELECT ") + kEventColumns +
                    " FROM events WHERE global_position>$1"
                    " AND transaction_id < pg_snapshot_xmin(pg_current_snapshot())"
                    " ORDER BY global_position ASC";
  if (max_events.has_value()) {
    sql += " LIMIT " + std::to_string(*max_events);
  }
  sql += ";";

  auto res = TX(t).Work().exec_params(sql, after_position);

  std::vector<model::EventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadEvent(row));
  }
  return out;
}

// ---------------------------------------------------------------------
// Snapshots
// ---------------------------------------------------------------------

Result PgRepository::InsertSnapshot(Transaction& t, model::SnapshotRecord& r) {
  try {
    auto& work = TX(t).Work();
    auto  count =
        work.exec_params("SELECT COUNT(*) FROM snapshots WHERE aggregate_type=$1 AND aggregate_id=$2;",
                         r.aggregate_type, r.aggregate_id);
    r.current_snapshot = count[0][0].as<uint64_t>() + 1;
    if (r.created_at_ms == 0) {
      r.created_at_ms = util::NowMs();
    }

    work.exec_params(
        "INSERT INTO snapshots(aggregate_type,aggregate_id,last_sequence,current_snapshot,payload,created_at_ms) "
        "VALUES($1,$2,$3,$4,$5::jsonb,$6);",
        r.aggregate_type, r.aggregate_id, r.last_sequence, r.current_snapshot, r.payload, r.created_at_ms);
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SnapshotRecord> PgRepository::GetLatestSnapshot(Transaction& t, const std::string& aggregate_type,
                                                                     const std::string& aggregate_id) {
  auto res = TX(t).Work().exec_prepared("latest_snapshot", aggregate_type, aggregate_id);
  if (res.empty()) return std::nullopt;

  model::SnapshotRecord r;
  r.aggregate_type   = res[0][0].c_str();
  r.aggregate_id     = res[0][1].c_str();
  r.last_sequence    = res[0][2].as<uint64_t>();
  r.current_snapshot = res[0][3].as<uint64_t>();
  r.payload          = res[0][4].c_str();
  r.created_at_ms    = res[0][5].as<uint64_t>();
  return r;
}

// ---------------------------------------------------------------------
// Offsets
// ---------------------------------------------------------------------

Result PgRepository::CommitOffset(Transaction& t, const model::OffsetRecord& record) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO offsets(id,current_offset,updated_at_ms) VALUES($1,$2,$3) "
        "ON CONFLICT(id) DO UPDATE SET current_offset=excluded.current_offset, updated_at_ms=excluded.updated_at_ms "
        "WHERE excluded.current_offset > offsets.current_offset;",
        record.id, record.current_offset, record.updated_at_ms == 0 ? util::NowMs() : record.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::OffsetRecord> PgRepository::GetOffset(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_offset", id);
  if (res.empty()) return std::nullopt;

  model::OffsetRecord r;
  r.id             = res[0][0].c_str();
  r.current_offset = res[0][1].as<uint64_t>();
  r.updated_at_ms  = res[0][2].as<uint64_t>();
  return r;
}

// ---------------------------------------------------------------------
// Node references
// ---------------------------------------------------------------------

Result PgRepository::PutReference(Transaction& t, const model::ReferenceRecord& record) {
  if (record.node_reference.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "empty node reference");
  }

  try {
    TX(t).Work().exec_params(
        "INSERT INTO payment_references(node_reference,aggregate_type,aggregate_id) VALUES($1,$2,$3) "
        "ON CONFLICT(node_reference) DO UPDATE SET "
        "aggregate_type=excluded.aggregate_type, aggregate_id=excluded.aggregate_id;",
        record.node_reference, record.aggregate_type, record.aggregate_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ReferenceRecord> PgRepository::FindReference(Transaction& t, const std::string& node_reference) {
  auto res = TX(t).Work().exec_prepared("find_reference", node_reference);
  if (res.empty()) return std::nullopt;

  model::ReferenceRecord r;
  r.node_reference = res[0][0].c_str();
  r.aggregate_type = res[0][1].c_str();
  r.aggregate_id   = res[0][2].c_str();
  return r;
}

} // namespace payday::db::postgres
