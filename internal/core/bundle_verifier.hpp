#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/crypto/key_ring.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/storage/archive_store.hpp"

namespace sealer::core {

enum class VerificationReason : uint8_t {
  kValid = 0,
  kMalformedArchive,
  kFileMissing,
  kUndeclaredFile,
  kFileHashMismatch,
  kUnknownKey,
  kSignatureInvalid,
  kChainMismatch,
  kBundleNotFound,
  kSourceUnavailable,
};

const char* ToString(VerificationReason reason);

struct VerificationResult {
  bool               valid  = false;
  VerificationReason reason = VerificationReason::kMalformedArchive;
  std::string        detail;

  // Populated once manifest.json parses.
  std::string                bundle_id;
  std::string                tenant_id;
  std::string                export_type;
  std::string                generated_at;
  std::string                signature_algorithm;
  std::string                signing_key_id;
  std::string                manifest_sha256;
  std::optional<std::string> prev_bundle_hash;
  uint64_t                   file_count = 0;

  // True when the bundle was found in the ledger and its links were checked.
  bool                    chain_checked = false;
  std::optional<uint64_t> chain_seq;
};

struct ChainReport {
  std::string                tenant_id;
  bool                       intact          = true;
  uint64_t                   bundles_checked = 0;
  std::optional<std::string> first_broken_bundle_id;
  VerificationReason         reason = VerificationReason::kValid;
  std::string                detail;
};

/*
  Re-validates sealed bundles.

  Archive checks run in a fixed order and stop at the first failure:
    1. zip structure, manifest.json and manifest.sig present, manifest parses
    2. every declared file present with the declared size and SHA-256
    3. no undeclared files
    4. signing key id resolves (unknown key is "cannot verify")
    5. signature matches the manifest bytes ("verification failed")
    6. ledger row digest, tenant and predecessor link, when a repository is set

  Failures are reported as results, never thrown.
*/
class BundleVerifier {
 public:
  explicit BundleVerifier(std::shared_ptr<const crypto::KeyRing> keys, std::shared_ptr<db::Repository> repository = nullptr,
                          storage::ArchiveStorePtr store = nullptr);

  VerificationResult VerifyArchive(std::string_view archive) const;

  // Looks the bundle up in the ledger and verifies its stored archive.
  // Requires a repository and a store.
  VerificationResult VerifyBundle(const std::string& bundle_id) const;

  // Walks the tenant's chain oldest first; verify_archives also re-verifies each stored archive.
  ChainReport VerifyChain(const std::string& tenant_id, bool verify_archives) const;

 private:
  void CheckChain(VerificationResult& result) const;

  std::shared_ptr<const crypto::KeyRing> keys_;
  std::shared_ptr<db::Repository>        repository_;
  storage::ArchiveStorePtr               store_;
};

} // namespace sealer::core
