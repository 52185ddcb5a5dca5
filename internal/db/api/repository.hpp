#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/sealed_export_record.hpp"

namespace sealer::db {

/*
  Chain-of-custody ledger.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - The ledger is append-only: there is no update or delete
  - Per tenant, (chain_seq) and (prev_bundle_hash, null included) are
    unique; a second insert claiming either returns ConstraintViolation
    (or the memory backend's commit throws util::Conflict)

  Ordering: "latest" and newest-first listings are by chain_seq, which
  follows insertion order within a tenant.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Ledger
  // ---------------------------------------------------------------------

  virtual Result InsertSealedExport(Transaction&, const model::SealedExportRecord&) = 0;

  virtual std::optional<model::SealedExportRecord> GetSealedExport(Transaction&, const std::string& bundle_id) = 0;

  virtual std::optional<model::SealedExportRecord> GetLatestSealedExport(Transaction&, const std::string& tenant_id) = 0;

  virtual std::optional<model::SealedExportRecord> GetSealedExportAt(Transaction&, const std::string& tenant_id, uint64_t chain_seq) = 0;

  // Newest first, filtered and paginated.
  virtual std::vector<model::SealedExportRecord> ListSealedExports(Transaction&, const model::SealedExportFilter& filter) = 0;

  // Whole chain, oldest first.
  virtual std::vector<model::SealedExportRecord> ListChain(Transaction&, const std::string& tenant_id) = 0;
};

} // namespace sealer::db
