#include "pg_pool.hpp"

namespace sealer::db::postgres {

namespace {

constexpr const char* kColumns =
    "bundle_id,tenant_id,export_type,source_id,file_count,total_bytes,storage_key,manifest_sha256,manifest_sig,"
    "signing_key_id,prev_bundle_hash,generated_by,generated_at,created_at_ms,chain_seq";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string columns = kColumns;

  conn.prepare("insert_sealed_export",
               "INSERT INTO sealed_exports(" + columns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15)");

  conn.prepare("get_sealed_export", "SELECT " + columns + " FROM sealed_exports WHERE bundle_id=$1");

  conn.prepare("latest_sealed_export",
               "SELECT " + columns + " FROM sealed_exports WHERE tenant_id=$1 ORDER BY chain_seq DESC LIMIT 1");

  conn.prepare("sealed_export_at", "SELECT " + columns + " FROM sealed_exports WHERE tenant_id=$1 AND chain_seq=$2");

  conn.prepare("list_sealed_exports",
               "SELECT " + columns +
                   " FROM sealed_exports WHERE tenant_id=$1 AND ($2::text IS NULL OR export_type=$2)"
                   " ORDER BY chain_seq DESC LIMIT $3 OFFSET $4");

  conn.prepare("list_chain", "SELECT " + columns + " FROM sealed_exports WHERE tenant_id=$1 ORDER BY chain_seq ASC");
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
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

void BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS sealed_exports (bundle_id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, export_type TEXT NOT NULL, source_id TEXT, "
          "file_count BIGINT NOT NULL, total_bytes BIGINT NOT NULL, storage_key TEXT NOT NULL, manifest_sha256 TEXT NOT NULL, manifest_sig TEXT NOT NULL, "
          "signing_key_id TEXT NOT NULL, prev_bundle_hash TEXT, generated_by TEXT NOT NULL, generated_at TEXT NOT NULL, created_at_ms BIGINT NOT NULL, "
          "chain_seq BIGINT NOT NULL CHECK (chain_seq > 0), UNIQUE (tenant_id, chain_seq));");
  tx.exec("CREATE UNIQUE INDEX IF NOT EXISTS sealed_exports_chain_link ON sealed_exports (tenant_id, COALESCE(prev_bundle_hash, ''));");
  tx.exec("CREATE INDEX IF NOT EXISTS sealed_exports_tenant_type ON sealed_exports (tenant_id, export_type, chain_seq);");
  tx.exec("CREATE OR REPLACE FUNCTION sealed_exports_append_only() RETURNS trigger LANGUAGE plpgsql AS "
          "$$ BEGIN RAISE EXCEPTION 'sealed_exports is append-only'; END; $$;");
  tx.exec("DROP TRIGGER IF EXISTS sealed_exports_append_only ON sealed_exports;");
  tx.exec("CREATE TRIGGER sealed_exports_append_only BEFORE UPDATE OR DELETE ON sealed_exports "
          "FOR EACH ROW EXECUTE FUNCTION sealed_exports_append_only();");

  tx.commit();
}

} // namespace sealer::db::postgres
