#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/chain/simulated_chain.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/eventstore/offset_store.hpp"
#include "internal/eventstore/snapshot_store.hpp"
#include "internal/grpc/payment_server.hpp"
#include "internal/node/simulated_node.hpp"
#include "internal/observability/logging.hpp"
#include "internal/projection/settlement_publisher.hpp"
#include "internal/reconcile/notification_queue.hpp"
#include "internal/service/payment_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if PAYDAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if PAYDAY_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace payday::factory {

using namespace payday;

namespace {

#if PAYDAY_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};

void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  SqliteMigrationExecutor executor(*sqlite_db);
  db::sql::RunMigrations(executor, db::sql::SqliteSchema());

  sqlite_db->Exec("SELECT global_position,aggregate_type,aggregate_id,sequence,event_type,payload FROM events LIMIT 1;");
  sqlite_db->Exec("SELECT aggregate_type,aggregate_id,last_sequence,current_snapshot FROM snapshots LIMIT 1;");
  sqlite_db->Exec("SELECT id,current_offset FROM offsets LIMIT 1;");
  sqlite_db->Exec("SELECT node_reference,aggregate_type,aggregate_id FROM payment_references LIMIT 1;");
}
#endif

#if PAYDAY_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

// Runs on its own connection: pooled connections prepare statements
// against these tables when they open.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection conn(connection_uri);
  pqxx::work       tx(conn);

  PostgresMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresSchema());

  tx.exec("SELECT global_position,aggregate_type,aggregate_id,sequence,event_type,payload FROM events LIMIT 1;");
  tx.exec("SELECT aggregate_type,aggregate_id,last_sequence,current_snapshot FROM snapshots LIMIT 1;");
  tx.exec("SELECT id,current_offset FROM offsets LIMIT 1;");
  tx.exec("SELECT node_reference,aggregate_type,aggregate_id FROM payment_references LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const payday::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if PAYDAY_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    PAYDAY_LOG_INFO("using sqlite event store", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if PAYDAY_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                       database.postgres().pool_size());
    PAYDAY_LOG_INFO("using postgres event store");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  PAYDAY_LOG_WARN("using in-memory event store; events are lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<node::LightningNode> BuildNode(const payday::runtime::config::RuntimeConfig& config) {
  node::SimulatedNodeOptions options;
  if (config.node().has_simulated()) {
    const auto& simulated = config.node().simulated();
    if (!simulated.node_id().empty()) {
      options.node_id = simulated.node_id();
    }
    options.async_payments = simulated.async_payments();
    options.fee_sat        = simulated.fee_sat();
  }

  PAYDAY_LOG_INFO("using simulated lightning node", {observability::StringField("node_id", options.node_id),
                                                     observability::BoolField("async_payments", options.async_payments)});
  return std::make_shared<node::SimulatedNode>(options);
}

std::shared_ptr<chain::OnChainMonitor> BuildChain(const payday::runtime::config::RuntimeConfig& config) {
  if (!config.chain().has_simulated()) {
    PAYDAY_LOG_INFO("no chain monitor configured; invoices take lightning payment only");
    return nullptr;
  }

  chain::SimulatedChainOptions options;
  const auto&                  simulated = config.chain().simulated();
  if (!simulated.monitor_id().empty()) {
    options.monitor_id = simulated.monitor_id();
  }
  if (simulated.start_height() != 0) {
    options.start_height = simulated.start_height();
  }

  PAYDAY_LOG_INFO("using simulated chain", {observability::StringField("monitor_id", options.monitor_id),
                                            observability::IntField("start_height", static_cast<int64_t>(options.start_height))});
  return std::make_shared<chain::SimulatedChain>(options);
}

void PublishSettlement(const projection::Settlement& settlement) {
  PAYDAY_LOG_INFO("settlement", {observability::StringField("aggregate_id", settlement.aggregate_id),
                                 observability::StringField("aggregate_type", model::AggregateType(settlement.direction)),
                                 observability::IntField("amount_sat", static_cast<int64_t>(settlement.amount_sat)),
                                 observability::IntField("fee_sat", static_cast<int64_t>(settlement.fee_sat)),
                                 observability::IntField("global_position", static_cast<int64_t>(settlement.global_position))});
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const payday::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage and node backends
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.node       = BuildNode(config);
  app.chain      = BuildChain(config);

  auto events    = std::make_shared<eventstore::EventStore>(app.repository, config.engine().replay_batch_size());
  auto snapshots = std::make_shared<eventstore::SnapshotStore>(app.repository);
  auto offsets   = std::make_shared<eventstore::OffsetStore>(app.repository);

  // ------------------------------------------------------------------
  // Command path
  // ------------------------------------------------------------------
  command::CommandHandlerOptions handler_options;
  handler_options.max_append_attempts = config.engine().max_append_attempts();
  handler_options.snapshot_every      = config.engine().snapshot_every();
  app.handler = std::make_shared<command::CommandHandler>(events, snapshots, app.node, handler_options, util::NowMs,
                                                          app.chain);

  // ------------------------------------------------------------------
  // Reconciliation
  // ------------------------------------------------------------------
  auto queue = std::make_shared<reconcile::NotificationQueue>(config.reconciler().queue_capacity());

  reconcile::NodeReconcilerOptions reconciler_options;
  reconciler_options.min_confirmations = config.reconciler().min_confirmations();
  reconciler_options.retry_interval_ms = config.reconciler().retry_interval_ms();
  app.reconciler = std::make_shared<reconcile::NodeReconciler>(queue, app.handler, events, offsets, reconciler_options);

  // ------------------------------------------------------------------
  // Projections
  // ------------------------------------------------------------------
  projection::ProjectionRunnerOptions runner_options;
  runner_options.poll_interval_ms = static_cast<uint32_t>(config.projections().poll_interval_ms());
  runner_options.commit_every     = config.projections().batch_size();
  app.projections = std::make_shared<projection::ProjectionRunner>(events, offsets, runner_options);

  app.status_view = std::make_shared<projection::PaymentStatusView>();
  app.projections->Add(app.status_view);
  app.projections->Add(std::make_shared<projection::SettlementPublisher>(PublishSettlement));

  // ------------------------------------------------------------------
  // Lifecycle workers
  // ------------------------------------------------------------------
  app.expiry = std::make_shared<lifecycle::ExpirySweeper>(app.projections, app.status_view, app.handler,
                                                          static_cast<uint32_t>(config.expiry().sweep_interval_ms()));
  app.recovery = std::make_shared<lifecycle::InFlightRecovery>(app.projections, app.status_view, app.handler, app.node);

  // ------------------------------------------------------------------
  // Services and gRPC servers
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.handler = app.handler;
  ctx.events  = events;

  auto payment_service = std::make_shared<service::PaymentService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::PaymentServer>(payment_service));

  return app;
}

void StartBackground(Application& app) {
  app.recovery->Run();

  app.reconciler->Start();
  app.reconciler->Attach(*app.node);
  if (app.chain) {
    app.reconciler->AttachChain(*app.chain);
  }

  app.projections->Start();
  app.expiry->Start();
}

void StopBackground(Application& app) {
  app.expiry->Stop();
  app.projections->Stop();
  app.reconciler->Stop();
}

} // namespace payday::factory
