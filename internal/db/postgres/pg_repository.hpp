#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace sealer::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSealedExport(Transaction&, const model::SealedExportRecord&) override;
  std::optional<model::SealedExportRecord> GetSealedExport(Transaction&, const std::string&) override;
  std::optional<model::SealedExportRecord> GetLatestSealedExport(Transaction&, const std::string&) override;
  std::optional<model::SealedExportRecord> GetSealedExportAt(Transaction&, const std::string&, uint64_t) override;
  std::vector<model::SealedExportRecord> ListSealedExports(Transaction&, const model::SealedExportFilter&) override;
  std::vector<model::SealedExportRecord> ListChain(Transaction&, const std::string&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
