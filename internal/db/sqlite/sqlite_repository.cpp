#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <memory>
#include <stdexcept>

namespace sealer::db::sqlite {

using sealer::db::ErrorCode;
using sealer::db::Result;

namespace {

constexpr const char* kColumns =
    "bundle_id,tenant_id,export_type,source_id,file_count,total_bytes,storage_key,manifest_sha256,manifest_sig,"
    "signing_key_id,prev_bundle_hash,generated_by,generated_at,created_at_ms,chain_seq";

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StmtPtr(st, sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::SealedExportRecord ReadRow(sqlite3_stmt* st) {
  model::SealedExportRecord r;
  r.bundle_id        = ColText(st, 0);
  r.tenant_id        = ColText(st, 1);
  r.export_type      = ColText(st, 2);
  r.source_id        = ColOptionalText(st, 3);
  r.file_count       = ColU64(st, 4);
  r.total_bytes      = ColU64(st, 5);
  r.storage_key      = ColText(st, 6);
  r.manifest_sha256  = ColText(st, 7);
  r.manifest_sig     = ColText(st, 8);
  r.signing_key_id   = ColText(st, 9);
  r.prev_bundle_hash = ColOptionalText(st, 10);
  r.generated_by     = ColText(st, 11);
  r.generated_at     = ColText(st, 12);
  r.created_at_ms    = ColU64(st, 13);
  r.chain_seq        = ColU64(st, 14);
  return r;
}

std::vector<model::SealedExportRecord> ReadAll(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::SealedExportRecord> out;
  int                                    rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadRow(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

std::optional<model::SealedExportRecord> ReadOne(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return ReadRow(st);
}

} // namespace

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

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertSealedExport(Transaction& t, const model::SealedExportRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    const std::string sql = std::string("INSERT INTO sealed_exports(") + kColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    StmtPtr st(raw, sqlite3_finalize);

    BindText(st.get(), 1, r.bundle_id);
    BindText(st.get(), 2, r.tenant_id);
    BindText(st.get(), 3, r.export_type);
    BindOptionalText(st.get(), 4, r.source_id);
    BindU64(st.get(), 5, r.file_count);
    BindU64(st.get(), 6, r.total_bytes);
    BindText(st.get(), 7, r.storage_key);
    BindText(st.get(), 8, r.manifest_sha256);
    BindText(st.get(), 9, r.manifest_sig);
    BindText(st.get(), 10, r.signing_key_id);
    BindOptionalText(st.get(), 11, r.prev_bundle_hash);
    BindText(st.get(), 12, r.generated_by);
    BindText(st.get(), 13, r.generated_at);
    BindU64(st.get(), 14, r.created_at_ms);
    BindU64(st.get(), 15, r.chain_seq);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SealedExportRecord>
SqliteRepository::GetSealedExport(Transaction& t, const std::string& bundle_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, std::string("SELECT ") + kColumns + " FROM sealed_exports WHERE bundle_id=?;");
    BindText(st.get(), 1, bundle_id);
    return ReadOne(db, st.get());
}

std::optional<model::SealedExportRecord>
SqliteRepository::GetLatestSealedExport(Transaction& t, const std::string& tenant_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, std::string("SELECT ") + kColumns +
                               " FROM sealed_exports WHERE tenant_id=? ORDER BY chain_seq DESC LIMIT 1;");
    BindText(st.get(), 1, tenant_id);
    return ReadOne(db, st.get());
}

std::optional<model::SealedExportRecord>
SqliteRepository::GetSealedExportAt(Transaction& t, const std::string& tenant_id, uint64_t chain_seq) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, std::string("SELECT ") + kColumns + " FROM sealed_exports WHERE tenant_id=? AND chain_seq=?;");
    BindText(st.get(), 1, tenant_id);
    BindU64(st.get(), 2, chain_seq);
    return ReadOne(db, st.get());
}

std::vector<model::SealedExportRecord>
SqliteRepository::ListSealedExports(Transaction& t, const model::SealedExportFilter& filter) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, std::string("SELECT ") + kColumns +
                               " FROM sealed_exports WHERE tenant_id=?1 AND (?2 IS NULL OR export_type=?2)"
                               " ORDER BY chain_seq DESC LIMIT ?3 OFFSET ?4;");
    BindText(st.get(), 1, filter.tenant_id);
    BindOptionalText(st.get(), 2, filter.export_type);
    BindU64(st.get(), 3, filter.limit);
    BindU64(st.get(), 4, filter.offset);
    return ReadAll(db, st.get());
}

std::vector<model::SealedExportRecord>
SqliteRepository::ListChain(Transaction& t, const std::string& tenant_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, std::string("SELECT ") + kColumns + " FROM sealed_exports WHERE tenant_id=? ORDER BY chain_seq ASC;");
    BindText(st.get(), 1, tenant_id);
    return ReadAll(db, st.get());
}

} // namespace sealer::db::sqlite
