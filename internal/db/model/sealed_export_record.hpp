#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sealer::db::model {

/*
  One row of the chain-of-custody ledger.

  Rows are inserted once and never updated or deleted. Within a tenant,
  chain_seq runs 1, 2, 3, ... and prev_bundle_hash of row n equals
  manifest_sha256 of row n-1 (null for row 1).
*/
struct SealedExportRecord {
  std::string bundle_id;  // UUID, primary key
  std::string tenant_id;
  std::string export_type;
  std::optional<std::string> source_id;

  uint64_t file_count  = 0;
  uint64_t total_bytes = 0;  // archive size

  std::string storage_key;
  std::string manifest_sha256;
  std::string manifest_sig;
  std::string signing_key_id;
  std::optional<std::string> prev_bundle_hash;

  std::string generated_by;  // user id
  std::string generated_at;  // ISO-8601, as embedded in the manifest

  uint64_t created_at_ms = 0;
  uint64_t chain_seq     = 0;

  bool operator==(const SealedExportRecord&) const = default;
};

struct SealedExportFilter {
  std::string                tenant_id;
  std::optional<std::string> export_type;
  uint64_t                   limit  = 50;
  uint64_t                   offset = 0;
};

} // namespace sealer::db::model
