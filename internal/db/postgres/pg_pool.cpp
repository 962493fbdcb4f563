#include "pg_pool.hpp"

namespace payday::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("last_sequence",
               "SELECT COALESCE(MAX(sequence), 0) FROM events "
               "WHERE aggregate_type=$1 AND aggregate_id=$2");

  conn.prepare("insert_event",
               "INSERT INTO events(aggregate_type,aggregate_id,sequence,event_type,event_version,payload,metadata,recorded_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6::jsonb,$7::jsonb,$8) RETURNING global_position");

  conn.prepare("latest_snapshot",
               "SELECT aggregate_type,aggregate_id,last_sequence,current_snapshot,payload::text,created_at_ms "
               "FROM snapshots WHERE aggregate_type=$1 AND aggregate_id=$2 "
               "ORDER BY last_sequence DESC LIMIT 1");

  conn.prepare("get_offset", "SELECT id,current_offset,updated_at_ms FROM offsets WHERE id=$1");

  conn.prepare("find_reference",
               "SELECT node_reference,aggregate_type,aggregate_id FROM payment_references WHERE node_reference=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace payday::db::postgres
