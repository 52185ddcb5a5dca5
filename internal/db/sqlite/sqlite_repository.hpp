#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace sealer::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSealedExport(Transaction&, const model::SealedExportRecord&) override;
  std::optional<model::SealedExportRecord> GetSealedExport(Transaction&, const std::string&) override;
  std::optional<model::SealedExportRecord> GetLatestSealedExport(Transaction&, const std::string&) override;
  std::optional<model::SealedExportRecord> GetSealedExportAt(Transaction&, const std::string&, uint64_t) override;
  std::vector<model::SealedExportRecord> ListSealedExports(Transaction&, const model::SealedExportFilter&) override;
  std::vector<model::SealedExportRecord> ListChain(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
