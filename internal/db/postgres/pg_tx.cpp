#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace payday::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      PAYDAY_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must be gone before its connection goes back to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    finished_ = true;
    throw CommitConflict(e.what());
  } catch (const pqxx::unique_violation& e) {
    finished_ = true;
    throw CommitConflict(e.what());
  }
  committed_ = true;
  finished_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
