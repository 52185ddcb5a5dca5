#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/crypto/key_ring.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/sealed_export_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/storage_factory.hpp"
#if SEALER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SEALER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace sealer::factory {

using observability::IntField;
using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const sealer::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SEALER_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    SEALER_LOG_INFO("ledger backend ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SEALER_DB_POSTGRES
    const auto pool_size = database.postgres().pool_size() == 0 ? 4u : database.postgres().pool_size();
    auto       pool      = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), pool_size);
    db::postgres::BootstrapSchema(*pool);
    SEALER_LOG_INFO("ledger backend ready", {StringField("backend", "postgres"), IntField("pool_size", pool_size)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SEALER_LOG_WARN("ledger backend is in-memory; sealed exports will not survive a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const sealer::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Ledger, archive store and keys
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.store      = storage::StorageFactory::Build(config.storage());

  auto keys = std::make_shared<crypto::KeyRing>(crypto::KeyRing::FromConfig(config.signing()));
  if (!keys->HasActiveKey()) {
    SEALER_LOG_WARN("no active signing key configured; Seal will fail until one is provided");
  }
  SEALER_LOG_INFO("signing keys loaded", {StringField("active_key_id", keys->HasActiveKey() ? keys->ActiveKey().id : ""),
                                          IntField("legacy_keys", static_cast<int64_t>(keys->LegacyKeyCount()))});
  app.keys = keys;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.sealer   = std::make_shared<core::BundleSealer>(app.repository, app.store, keys, core::SealerOptions::FromConfig(config));
  app.verifier = std::make_shared<core::BundleVerifier>(keys, app.repository, app.store);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.sealer     = app.sealer;
  ctx.verifier   = app.verifier;
  ctx.repository = app.repository;
  ctx.store      = app.store;

  app.sealed_export_service = std::make_shared<service::SealedExportService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::SealedExportServer>(app.sealed_export_service));

  return app;
}

} // namespace sealer::factory
