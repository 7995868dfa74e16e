#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/catalog/catalog_store.hpp"
#include "internal/content/content_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/embedding/embed_scheduler.hpp"
#include "internal/embedding/embed_worker.hpp"
#include "internal/embedding/embedding_index.hpp"
#include "internal/embedding/hashing_embedder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/query/query_views.hpp"
#include "internal/signal/signal_engine.hpp"
#include "internal/signal/staleness_sweeper.hpp"
#if OMNI_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if OMNI_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace omni::factory {

namespace {

// Unprocessed articles re-queued per start.
constexpr std::size_t kRequeueLimit = 10000;

#if OMNI_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  PgMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresSchemaStatements());
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const omni::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if OMNI_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteMigrationExecutor executor(*sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchemaStatements());
    OMNI_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if OMNI_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    OMNI_LOG_INFO("Using postgres repository", {observability::UintField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  OMNI_LOG_WARN("Using in-memory repository; data is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const omni::runtime::config::RuntimeConfig& config, std::shared_ptr<embedding::EmbeddingFunction> embedder) {
  Application app;
  app.signal_options    = omni::config::ResolveSignalOptions(config.signals());
  app.embedding_options = omni::config::ResolveEmbeddingOptions(config.embedding());

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Signal engine and catalog
  // ------------------------------------------------------------------
  app.engine  = std::make_shared<signal::SignalEngine>(app.repository, app.signal_options);
  app.catalog = std::make_shared<catalog::CatalogStore>(app.repository, app.signal_options.conflict_retry_limit);

  // ------------------------------------------------------------------
  // Embedding index and content
  // ------------------------------------------------------------------
  if (!embedder) {
    embedder = std::make_shared<embedding::HashingEmbedder>(app.embedding_options.dimension);
  }
  app.index           = std::make_shared<embedding::EmbeddingIndex>(app.repository, std::move(embedder), app.embedding_options);
  app.embed_scheduler = std::make_shared<embedding::EmbedScheduler>();
  app.content = std::make_shared<content::ContentStore>(app.repository, app.index, app.embed_scheduler, app.signal_options.conflict_retry_limit);
  app.views   = std::make_shared<query::QueryViews>(app.repository, app.engine, app.index);

  // ------------------------------------------------------------------
  // Background workers (not started)
  // ------------------------------------------------------------------
  for (std::size_t i = 0; i < app.embedding_options.workers; ++i) {
    app.embed_workers.push_back(std::make_shared<embedding::EmbedWorker>(app.embed_scheduler, app.index, app.embedding_options));
  }
  app.sweeper = std::make_shared<signal::StalenessSweeper>(app.engine, std::chrono::milliseconds(app.signal_options.sweep_interval_ms));

  OMNI_LOG_INFO("Runtime assembled", {observability::StringField("embedding_model", app.embedding_options.model),
                                      observability::UintField("embedding_dimension", app.embedding_options.dimension),
                                      observability::StringField("metric", omni::config::ToString(app.embedding_options.metric)),
                                      observability::UintField("signal_window", app.signal_options.window_size)});
  return app;
}

void Start(Application& app, const util::CancellationToken& token) {
  const auto resumed = app.engine->ResumeBackfills(token);
  if (resumed > 0) {
    OMNI_LOG_INFO("Pending backfills completed", {observability::UintField("assets", resumed)});
  }

  app.index->Hydrate();
  app.content->RequeueUnprocessed(kRequeueLimit);

  for (auto& worker : app.embed_workers) {
    worker->Start();
  }
  app.sweeper->Start();
}

void Stop(Application& app) {
  if (app.sweeper) {
    app.sweeper->Stop();
  }
  if (app.embed_scheduler) {
    app.embed_scheduler->Shutdown();
  }
  for (auto& worker : app.embed_workers) {
    worker->Stop();
  }
}

} // namespace omni::factory
