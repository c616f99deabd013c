#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/dedup/rules.hpp"
#include "internal/names/protected_names.hpp"
#include "internal/observability/logging.hpp"
#if ROSTER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ROSTER_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace roster::factory {

using observability::IntField;
using observability::StringField;

namespace {

#if ROSTER_DB_SQLITE
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

  sqlite_db->Exec("SELECT id,name,aliases,document_count,connection_count FROM persons LIMIT 1;");
  sqlite_db->Exec("SELECT id,person_id,document_id FROM person_documents LIMIT 1;");
  sqlite_db->Exec("SELECT id,person_id_1,person_id_2,description,strength FROM connections LIMIT 1;");
  sqlite_db->Exec("SELECT id,person_ids FROM timeline_events LIMIT 1;");
}
#endif

#if ROSTER_DB_POSTGRES
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

// Runs on a plain connection: pooled connections prepare statements
// against tables that may not exist yet.
void BootstrapPostgresSchema(const std::string& conninfo) {
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);

  PostgresMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresSchema());

  tx.exec("SELECT id,name,aliases,document_count,connection_count FROM persons LIMIT 1;");
  tx.exec("SELECT id,person_ids FROM timeline_events LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const roster::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  const auto& backend  = database.backend();

  if (backend == "sqlite") {
#if ROSTER_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    ROSTER_LOG_INFO("sqlite store opened", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (backend == "postgres") {
#if ROSTER_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().conninfo());
    const auto pool_size = database.postgres().pool_size() > 0 ? database.postgres().pool_size() : 4U;
    auto       pool      = std::make_shared<db::postgres::PgPool>(database.postgres().conninfo(), pool_size);
    ROSTER_LOG_INFO("postgres store opened", {IntField("pool_size", pool_size)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ROSTER_LOG_WARN("using in-memory store, changes are not persisted");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const roster::runtime::config::RuntimeConfig& config, const util::CancellationToken* cancel) {
  const auto& settings = config.dedup();

  // ------------------------------------------------------------------
  // Curated inputs
  // ------------------------------------------------------------------
  auto protected_names = names::ProtectedNames::LoadFromFile(settings.protected_names_path());
  ROSTER_LOG_INFO("protected names loaded", {IntField("count", static_cast<std::int64_t>(protected_names.Size()))});

  dedup::DedupRules rules;
  if (settings.rules_path().empty()) {
    ROSTER_LOG_WARN("no rules_path configured, key figure and nickname passes have no rules");
  } else {
    rules = dedup::DedupRules::LoadFromFile(settings.rules_path());
    ROSTER_LOG_INFO("merge rules loaded",
                    {StringField("path", settings.rules_path()),
                     IntField("key_figures", static_cast<std::int64_t>(rules.key_figures.size())),
                     IntField("ocr_nicknames", static_cast<std::int64_t>(rules.ocr_nicknames.size()))});
  }

  // ------------------------------------------------------------------
  // Store + coordinator
  // ------------------------------------------------------------------
  Application app;
  app.repository = BuildRepository(config);

  dedup::CoordinatorOptions options;
  options.plan_path = settings.plan_path().empty() ? roster::config::kDefaultPlanPath : settings.plan_path();
  options.execution.batch_pause =
      std::chrono::milliseconds(settings.has_batch_pause_ms() ? settings.batch_pause_ms() : roster::config::kDefaultBatchPauseMs);
  options.execution.drift_warning_threshold =
      settings.has_drift_warning_threshold() ? settings.drift_warning_threshold() : roster::config::kDefaultDriftThreshold;
  options.execution.delete_chunk_size =
      settings.has_delete_chunk_size() ? settings.delete_chunk_size() : roster::config::kDefaultDeleteChunkSize;

  app.coordinator = std::make_unique<dedup::Coordinator>(app.repository, std::move(protected_names), std::move(rules),
                                                         std::move(options), cancel);
  return app;
}

} // namespace roster::factory
