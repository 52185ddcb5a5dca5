#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace sealer::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // WAL lets readers proceed while a sealing transaction holds the write lock
  Exec("PRAGMA journal_mode=WAL;");

  // FULL: a committed ledger row must survive power loss
  Exec("PRAGMA synchronous=FULL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS sealed_exports (bundle_id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, export_type TEXT NOT NULL, source_id TEXT, "
      "file_count INTEGER NOT NULL, total_bytes INTEGER NOT NULL, storage_key TEXT NOT NULL, manifest_sha256 TEXT NOT NULL, manifest_sig TEXT NOT NULL, "
      "signing_key_id TEXT NOT NULL, prev_bundle_hash TEXT, generated_by TEXT NOT NULL, generated_at TEXT NOT NULL, created_at_ms INTEGER NOT NULL, "
      "chain_seq INTEGER NOT NULL CHECK (chain_seq > 0), UNIQUE (tenant_id, chain_seq));",
      "CREATE UNIQUE INDEX IF NOT EXISTS sealed_exports_chain_link ON sealed_exports (tenant_id, COALESCE(prev_bundle_hash, ''));",
      "CREATE INDEX IF NOT EXISTS sealed_exports_tenant_type ON sealed_exports (tenant_id, export_type, chain_seq);",
      "CREATE TRIGGER IF NOT EXISTS sealed_exports_no_update BEFORE UPDATE ON sealed_exports BEGIN SELECT RAISE(ABORT, 'sealed_exports is append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS sealed_exports_no_delete BEFORE DELETE ON sealed_exports BEGIN SELECT RAISE(ABORT, 'sealed_exports is append-only'); END;"};

  std::scoped_lock lock(db.TxMutex());
  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
  db.Exec("SELECT bundle_id,tenant_id,chain_seq,prev_bundle_hash,manifest_sha256 FROM sealed_exports LIMIT 1;");
}

} // namespace sealer::db::sqlite
