#include "pg_repository.hpp"

namespace sealer::db::postgres {

namespace {

std::optional<std::string> OptionalText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

model::SealedExportRecord ReadRow(const pqxx::row& row) {
  model::SealedExportRecord r;
  r.bundle_id        = row[0].c_str();
  r.tenant_id        = row[1].c_str();
  r.export_type      = row[2].c_str();
  r.source_id        = OptionalText(row[3]);
  r.file_count       = row[4].as<uint64_t>();
  r.total_bytes      = row[5].as<uint64_t>();
  r.storage_key      = row[6].c_str();
  r.manifest_sha256  = row[7].c_str();
  r.manifest_sig     = row[8].c_str();
  r.signing_key_id   = row[9].c_str();
  r.prev_bundle_hash = OptionalText(row[10]);
  r.generated_by     = row[11].c_str();
  r.generated_at     = row[12].c_str();
  r.created_at_ms    = row[13].as<uint64_t>();
  r.chain_seq        = row[14].as<uint64_t>();
  return r;
}

std::vector<model::SealedExportRecord> ReadAll(const pqxx::result& res) {
  std::vector<model::SealedExportRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRow(row));
  }
  return out;
}

std::optional<model::SealedExportRecord> ReadOne(const pqxx::result& res) {
  if (res.empty()) return std::nullopt;
  return ReadRow(res[0]);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) || dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertSealedExport(Transaction& t, const model::SealedExportRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_sealed_export", r.bundle_id, r.tenant_id, r.export_type, r.source_id,
                               static_cast<int64_t>(r.file_count), static_cast<int64_t>(r.total_bytes), r.storage_key,
                               r.manifest_sha256, r.manifest_sig, r.signing_key_id, r.prev_bundle_hash, r.generated_by,
                               r.generated_at, static_cast<int64_t>(r.created_at_ms), static_cast<int64_t>(r.chain_seq));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SealedExportRecord> PgRepository::GetSealedExport(Transaction& t, const std::string& bundle_id) {
  return ReadOne(TX(t).Work().exec_prepared("get_sealed_export", bundle_id));
}

std::optional<model::SealedExportRecord> PgRepository::GetLatestSealedExport(Transaction& t, const std::string& tenant_id) {
  return ReadOne(TX(t).Work().exec_prepared("latest_sealed_export", tenant_id));
}

std::optional<model::SealedExportRecord> PgRepository::GetSealedExportAt(Transaction& t, const std::string& tenant_id, uint64_t chain_seq) {
  return ReadOne(TX(t).Work().exec_prepared("sealed_export_at", tenant_id, static_cast<int64_t>(chain_seq)));
}

std::vector<model::SealedExportRecord> PgRepository::ListSealedExports(Transaction& t, const model::SealedExportFilter& filter) {
  return ReadAll(TX(t).Work().exec_prepared("list_sealed_exports", filter.tenant_id, filter.export_type,
                                            static_cast<int64_t>(filter.limit), static_cast<int64_t>(filter.offset)));
}

std::vector<model::SealedExportRecord> PgRepository::ListChain(Transaction& t, const std::string& tenant_id) {
  return ReadAll(TX(t).Work().exec_prepared("list_chain", tenant_id));
}

} // namespace sealer::db::postgres
