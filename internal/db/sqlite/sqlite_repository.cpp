#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/util/time.hpp"

namespace payday::db::sqlite {

using payday::db::ErrorCode;
using payday::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static constexpr const char* kEventColumns =
    "global_position,aggregate_type,aggregate_id,sequence,event_type,event_version,payload,metadata,recorded_at_ms";

static model::EventRecord ReadEvent(sqlite3_stmt* st) {
    model::EventRecord r;
    r.global_position = ColU64(st, 0);
    r.aggregate_type = ColText(st, 1);
    r.aggregate_id = ColText(st, 2);
    r.sequence = ColU64(st, 3);
    r.event_type = ColText(st, 4);
    r.event_version = ColText(st, 5);
    r.payload = ColText(st, 6);
    r.metadata = ColText(st, 7);
    r.recorded_at_ms = ColU64(st, 8);
    return r;
}

// Read failures surface as exceptions; an empty result must mean "no rows".
static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return st;
}

static std::vector<model::EventRecord> CollectEvents(sqlite3* db, sqlite3_stmt* st) {
    std::vector<model::EventRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadEvent(st));
    }
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite read events: ") + sqlite3_errmsg(db));
    }
    return out;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvents(Transaction& t, const std::string& aggregate_type,
                                      const std::string& aggregate_id, uint64_t expected_last_sequence,
                                      std::vector<model::EventRecord>& events) {
    auto* db = TX(t).Handle();

    const uint64_t last = LastSequence(t, aggregate_type, aggregate_id);
    if (last != expected_last_sequence) {
        return Result::Err(ErrorCode::Conflict, "expected sequence " + std::to_string(expected_last_sequence) +
                                                    " but stream is at " + std::to_string(last));
    }

    const char* ins_sql =
        "INSERT INTO events(aggregate_type,aggregate_id,sequence,event_type,event_version,payload,metadata,recorded_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?);";

    sqlite3_stmt* ins_st = nullptr;
    if (sqlite3_prepare_v2(db, ins_sql, -1, &ins_st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    const uint64_t now = util::NowMs();
    uint64_t sequence = expected_last_sequence;
    for (auto& e : events) {
        e.aggregate_type = aggregate_type;
        e.aggregate_id = aggregate_id;
        e.sequence = ++sequence;
        if (e.recorded_at_ms == 0) {
            e.recorded_at_ms = now;
        }

        sqlite3_reset(ins_st);
        sqlite3_clear_bindings(ins_st);

        BindText(ins_st, 1, e.aggregate_type);
        BindText(ins_st, 2, e.aggregate_id);
        BindU64(ins_st, 3, e.sequence);
        BindText(ins_st, 4, e.event_type);
        BindText(ins_st, 5, e.event_version);
        BindText(ins_st, 6, e.payload);
        BindText(ins_st, 7, e.metadata);
        BindU64(ins_st, 8, e.recorded_at_ms);

        int rc = sqlite3_step(ins_st);
        if (rc != SQLITE_DONE) {
            auto result = Translate(db, rc);
            // only the stream key means another writer won; NOT NULL and CHECK failures stay constraint errors
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
                result.code = ErrorCode::Conflict;
            }
            sqlite3_finalize(ins_st);
            return result;
        }
        e.global_position = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    }

    sqlite3_finalize(ins_st);
    return Result::Ok();
}

std::vector<model::EventRecord> SqliteRepository::LoadEvents(Transaction& t, const std::string& aggregate_type,
                                                             const std::string& aggregate_id, uint64_t after_sequence,
                                                             std::optional<uint64_t> max_events) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kEventColumns +
                      " FROM events WHERE aggregate_type=? AND aggregate_id=? AND sequence>? ORDER BY sequence ASC";
    if (max_events.has_value()) {
        sql += " LIMIT " + std::to_string(*max_events);
    }
    sql += ";";

    sqlite3_stmt* st = PrepareOrThrow(db, sql);
    BindText(st, 1, aggregate_type);
    BindText(st, 2, aggregate_id);
    BindU64(st, 3, after_sequence);
    return CollectEvents(db, st);
}

uint64_t SqliteRepository::LastSequence(Transaction& t, const std::string& aggregate_type,
                                        const std::string& aggregate_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(
        db, "SELECT COALESCE(MAX(sequence), 0) FROM events WHERE aggregate_type=? AND aggregate_id=?;");
    BindText(st, 1, aggregate_type);
    BindText(st, 2, aggregate_id);

    uint64_t last = 0;
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) {
        last = ColU64(st, 0);
    }
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW) {
        throw std::runtime_error(std::string("sqlite last sequence: ") + sqlite3_errmsg(db));
    }
    return last;
}

std::vector<model::EventRecord> SqliteRepository::LoadEventsSince(Transaction& t, uint64_t after_position,
                                                                  std::optional<uint64_t> max_events) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kEventColumns +
                      " FROM events WHERE global_position>? ORDER BY global_position ASC";
    if (max_events.has_value()) {
        sql += " LIMIT " + std::to_string(*max_events);
    }
    sql += ";";

    sqlite3_stmt* st = PrepareOrThrow(db, sql);
    BindU64(st, 1, after_position);
    return CollectEvents(db, st);
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result SqliteRepository::InsertSnapshot(Transaction& t, model::SnapshotRecord& r) {
    auto* db = TX(t).Handle();

    const char* count_sql = "SELECT COUNT(*) FROM snapshots WHERE aggregate_type=? AND aggregate_id=?;";
    sqlite3_stmt* count_st = nullptr;
    if (sqlite3_prepare_v2(db, count_sql, -1, &count_st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(count_st, 1, r.aggregate_type);
    BindText(count_st, 2, r.aggregate_id);
    uint64_t existing = 0;
    if (sqlite3_step(count_st) == SQLITE_ROW) {
        existing = ColU64(count_st, 0);
    }
    sqlite3_finalize(count_st);

    r.current_snapshot = existing + 1;
    if (r.created_at_ms == 0) {
        r.created_at_ms = util::NowMs();
    }

    const char* sql =
        "INSERT INTO snapshots(aggregate_type,aggregate_id,last_sequence,current_snapshot,payload,created_at_ms) "
        "VALUES(?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.aggregate_type);
    BindText(st, 2, r.aggregate_id);
    BindU64(st, 3, r.last_sequence);
    BindU64(st, 4, r.current_snapshot);
    BindText(st, 5, r.payload);
    BindU64(st, 6, r.created_at_ms);

    int rc = sqlite3_step(st);
    auto result = Translate(db, rc);
    sqlite3_finalize(st);

    if (result.code == ErrorCode::ConstraintViolation) {
        result.code = ErrorCode::AlreadyExists;
    }
    return result;
}

std::optional<model::SnapshotRecord> SqliteRepository::GetLatestSnapshot(Transaction& t,
                                                                         const std::string& aggregate_type,
                                                                         const std::string& aggregate_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(
        db,
        "SELECT aggregate_type,aggregate_id,last_sequence,current_snapshot,payload,created_at_ms "
        "FROM snapshots WHERE aggregate_type=? AND aggregate_id=? ORDER BY last_sequence DESC LIMIT 1;");
    BindText(st, 1, aggregate_type);
    BindText(st, 2, aggregate_id);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::SnapshotRecord r;
    r.aggregate_type = ColText(st, 0);
    r.aggregate_id = ColText(st, 1);
    r.last_sequence = ColU64(st, 2);
    r.current_snapshot = ColU64(st, 3);
    r.payload = ColText(st, 4);
    r.created_at_ms = ColU64(st, 5);

    sqlite3_finalize(st);
    return r;
}

// ------------------------------------------------------------------
// Offsets
// ------------------------------------------------------------------

Result SqliteRepository::CommitOffset(Transaction& t, const model::OffsetRecord& record) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO offsets(id,current_offset,updated_at_ms) VALUES(?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET "
        "current_offset=excluded.current_offset, updated_at_ms=excluded.updated_at_ms "
        "WHERE excluded.current_offset > offsets.current_offset;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, record.id);
    BindU64(st, 2, record.current_offset);
    BindU64(st, 3, record.updated_at_ms == 0 ? util::NowMs() : record.updated_at_ms);

    int rc = sqlite3_step(st);
    auto result = Translate(db, rc);
    sqlite3_finalize(st);
    return result;
}

std::optional<model::OffsetRecord> SqliteRepository::GetOffset(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(db, "SELECT id,current_offset,updated_at_ms FROM offsets WHERE id=?;");
    BindText(st, 1, id);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::OffsetRecord out;
    out.id = ColText(st, 0);
    out.current_offset = ColU64(st, 1);
    out.updated_at_ms = ColU64(st, 2);

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Node references
// ------------------------------------------------------------------

Result SqliteRepository::PutReference(Transaction& t, const model::ReferenceRecord& record) {
    if (record.node_reference.empty()) {
        return Result::Err(ErrorCode::ConstraintViolation, "empty node reference");
    }

    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO payment_references(node_reference,aggregate_type,aggregate_id) VALUES(?,?,?) "
        "ON CONFLICT(node_reference) DO UPDATE SET "
        "aggregate_type=excluded.aggregate_type, aggregate_id=excluded.aggregate_id;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, record.node_reference);
    BindText(st, 2, record.aggregate_type);
    BindText(st, 3, record.aggregate_id);

    int rc = sqlite3_step(st);
    auto result = Translate(db, rc);
    sqlite3_finalize(st);
    return result;
}

std::optional<model::ReferenceRecord> SqliteRepository::FindReference(Transaction& t,
                                                                      const std::string& node_reference) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(
        db, "SELECT node_reference,aggregate_type,aggregate_id FROM payment_references WHERE node_reference=?;");
    BindText(st, 1, node_reference);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::ReferenceRecord out;
    out.node_reference = ColText(st, 0);
    out.aggregate_type = ColText(st, 1);
    out.aggregate_id = ColText(st, 2);

    sqlite3_finalize(st);
    return out;
}

}
