#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/crypto/key_ring.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/manifest/manifest.hpp"
#include "internal/storage/archive_store.hpp"

namespace sealer::runtime::config {
class RuntimeConfig;
}

namespace sealer::core {

struct SealRequest {
  std::string                       tenant_id;
  manifest::ExportType              export_type = manifest::ExportType::kInspectionReport;
  std::optional<std::string>        source_id;
  manifest::GeneratedBy             generated_by;
  std::vector<manifest::BundleFile> files;
};

struct SealedBundle {
  db::model::SealedExportRecord record;
  manifest::ExportManifest      manifest;
};

struct SealerOptions {
  std::string verify_base_url;
  std::string key_prefix                 = "sealed-exports";
  uint32_t    max_chain_conflict_retries = 3;
  uint32_t    hash_workers               = 1;
  uint64_t    max_bundle_bytes           = uint64_t{2} << 30;

  uint32_t                  upload_max_attempts = 5;
  std::chrono::milliseconds upload_initial_backoff{100};
  std::chrono::milliseconds upload_max_backoff{5000};

  static SealerOptions FromConfig(const sealer::runtime::config::RuntimeConfig& config);
};

/*
  Sealing orchestrator.

  Seal() runs: validate -> hash files -> read predecessor -> manifest ->
  canonicalize, digest, sign -> zip -> upload -> ledger insert.

  Per-tenant ordering:
    - seals for one tenant are serialized in-process by a tenant mutex
    - across processes the ledger rejects a second row claiming the same
      predecessor; the loser re-reads the chain head and re-seals under a
      fresh bundle id, up to max_chain_conflict_retries times

  Errors:
    util::InvalidArgument        bad request, nothing touched
    util::SigningKeyUnavailable  no active key
    util::StorageError           upload exhausted its retries, nothing persisted
    util::ChainConflict          lost the predecessor race on every attempt
    util::PersistenceError       archive stored but the ledger row was not written
*/
class BundleSealer {
 public:
  BundleSealer(std::shared_ptr<db::Repository> repository, storage::ArchiveStorePtr store, std::shared_ptr<const crypto::KeyRing> keys,
               SealerOptions options);

  SealedBundle Seal(const SealRequest& request);

  const SealerOptions& Options() const {
    return options_;
  }

  // Tenants with a seal in flight.
  size_t ActiveTenantCount() const;

 private:
  void ValidateRequest(const SealRequest& request) const;
  void Upload(const std::string& storage_key, const std::shared_ptr<arrow::Buffer>& archive, const storage::ObjectMetadata& metadata);
  void DiscardArchive(const std::string& storage_key, const std::string& bundle_id, const std::string& tenant_id);

  // Serializes seals per tenant. The map entry lives only while some seal for the tenant holds it.
  class TenantLock {
   public:
    TenantLock(BundleSealer& sealer, const std::string& tenant_id);
    ~TenantLock();

    TenantLock(const TenantLock&)            = delete;
    TenantLock& operator=(const TenantLock&) = delete;

   private:
    BundleSealer&                sealer_;
    std::string                  tenant_id_;
    std::shared_ptr<std::mutex>  mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  std::shared_ptr<db::Repository>        repository_;
  storage::ArchiveStorePtr               store_;
  std::shared_ptr<const crypto::KeyRing> keys_;
  SealerOptions                          options_;

  mutable std::mutex                                           tenant_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> tenant_mutexes_;
};

} // namespace sealer::core
