#include "bundle_verifier.hpp"

#include <unordered_set>

#include "internal/archive/zip_archive.hpp"
#include "internal/crypto/content_hasher.hpp"
#include "internal/crypto/signer.hpp"
#include "internal/manifest/manifest_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace sealer::core {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

const char* ToString(VerificationReason reason) {
  switch (reason) {
    case VerificationReason::kValid:
      return "valid";
    case VerificationReason::kMalformedArchive:
      return "malformed_archive";
    case VerificationReason::kFileMissing:
      return "file_missing";
    case VerificationReason::kUndeclaredFile:
      return "undeclared_file";
    case VerificationReason::kFileHashMismatch:
      return "file_hash_mismatch";
    case VerificationReason::kUnknownKey:
      return "unknown_key";
    case VerificationReason::kSignatureInvalid:
      return "signature_invalid";
    case VerificationReason::kChainMismatch:
      return "chain_mismatch";
    case VerificationReason::kBundleNotFound:
      return "bundle_not_found";
    case VerificationReason::kSourceUnavailable:
      return "source_unavailable";
  }
  return "unknown";
}

namespace {

VerificationResult& Fail(VerificationResult& result, VerificationReason reason, std::string detail) {
  result.valid  = false;
  result.reason = reason;
  result.detail = std::move(detail);
  return result;
}

VerificationResult Finish(VerificationResult result) {
  observability::Metrics::Instance().RecordVerification(ToString(result.reason));
  return result;
}

} // namespace

BundleVerifier::BundleVerifier(std::shared_ptr<const crypto::KeyRing> keys, std::shared_ptr<db::Repository> repository,
                               storage::ArchiveStorePtr store)
    : keys_(std::move(keys)), repository_(std::move(repository)), store_(std::move(store)) {
  if (!keys_) {
    throw std::invalid_argument("bundle verifier requires a key ring");
  }
}

VerificationResult BundleVerifier::VerifyArchive(std::string_view archive_bytes) const {
  observability::SpanScope span("BundleVerifier/VerifyArchive");
  VerificationResult       result;

  archive::ArchiveContents contents;
  try {
    contents = archive::ReadArchive(archive_bytes);
  } catch (const archive::ArchiveFormatError& e) {
    return Finish(Fail(result, VerificationReason::kMalformedArchive, e.what()));
  } catch (const std::exception& e) {
    SEALER_LOG_WARN("archive could not be read", {StringField("error", e.what()), IntField("archive_bytes", static_cast<int64_t>(archive_bytes.size()))});
    return Finish(Fail(result, VerificationReason::kMalformedArchive, std::string("archive could not be read: ") + e.what()));
  }

  const auto* manifest_entry  = contents.Find(manifest::kManifestFileName);
  const auto* signature_entry = contents.Find(manifest::kSignatureFileName);
  if (!manifest_entry || !signature_entry) {
    return Finish(Fail(result, VerificationReason::kMalformedArchive, "archive lacks manifest.json or manifest.sig"));
  }
  if (!manifest_entry->crc_matches) {
    return Finish(Fail(result, VerificationReason::kMalformedArchive, "manifest.json fails its zip checksum"));
  }

  manifest::ExportManifest m;
  try {
    m = manifest::ManifestFromJson(manifest_entry->data);
  } catch (const manifest::ManifestFormatError& e) {
    return Finish(Fail(result, VerificationReason::kMalformedArchive, std::string("manifest.json: ") + e.what()));
  }

  result.bundle_id           = m.bundle_id;
  result.tenant_id           = m.tenant_id;
  result.export_type         = manifest::ToString(m.export_type);
  result.generated_at        = m.generated_at;
  result.signature_algorithm = m.signature_algorithm;
  result.signing_key_id      = m.signing_key_id;
  result.prev_bundle_hash    = m.prev_bundle_hash;
  result.file_count          = m.files.size();
  result.manifest_sha256     = crypto::Sha256Hex(manifest_entry->data);
  span.SetAttribute("bundle_id", m.bundle_id);

  std::unordered_set<std::string_view> declared;
  for (const auto& file : m.files) {
    declared.insert(file.path);
    const auto* entry = contents.Find(file.path);
    if (!entry) {
      return Finish(Fail(result, VerificationReason::kFileMissing, "declared file missing: " + file.path));
    }
    if (!entry->crc_matches || entry->data.size() != file.bytes || crypto::Sha256Hex(entry->data) != file.sha256) {
      return Finish(Fail(result, VerificationReason::kFileHashMismatch, "file content differs from manifest: " + file.path));
    }
  }

  for (const auto& entry : contents.entries) {
    if (entry.path == manifest::kManifestFileName || entry.path == manifest::kSignatureFileName) continue;
    if (!declared.contains(entry.path)) {
      return Finish(Fail(result, VerificationReason::kUndeclaredFile, "file not declared in manifest: " + entry.path));
    }
  }

  const auto key = keys_->Resolve(m.signing_key_id);
  if (!key) {
    return Finish(Fail(result, VerificationReason::kUnknownKey, "signing key id not known: " + m.signing_key_id));
  }
  if (m.signature_algorithm != manifest::kSignatureAlgorithm ||
      !crypto::Verify(manifest_entry->data, signature_entry->data, key->material)) {
    return Finish(Fail(result, VerificationReason::kSignatureInvalid, "manifest signature does not match"));
  }

  result.valid  = true;
  result.reason = VerificationReason::kValid;
  result.detail.clear();

  if (repository_) {
    CheckChain(result);
  }
  return Finish(std::move(result));
}

void BundleVerifier::CheckChain(VerificationResult& result) const {
  std::optional<db::model::SealedExportRecord> row;
  std::optional<std::string>                   expected_prev;
  bool                                         predecessor_missing = false;
  try {
    auto tx = repository_->Begin();
    row     = repository_->GetSealedExport(*tx, result.bundle_id);
    if (row && row->chain_seq > 1) {
      auto predecessor = repository_->GetSealedExportAt(*tx, row->tenant_id, row->chain_seq - 1);
      if (predecessor) {
        expected_prev = predecessor->manifest_sha256;
      } else {
        predecessor_missing = true;
      }
    }
    tx->Commit();
  } catch (const std::exception& e) {
    // The archive verdict stands; only the ledger comparison is skipped.
    SEALER_LOG_WARN("ledger unavailable for chain check", {StringField("bundle_id", result.bundle_id), StringField("tenant_id", result.tenant_id),
                                                           BoolField("chain_checked", false), StringField("error", e.what())});
    return;
  }
  if (!row) {
    return;
  }

  result.chain_checked = true;
  result.chain_seq     = row->chain_seq;

  if (row->manifest_sha256 != result.manifest_sha256) {
    Fail(result, VerificationReason::kChainMismatch, "manifest digest differs from the ledger record");
  } else if (row->tenant_id != result.tenant_id) {
    Fail(result, VerificationReason::kChainMismatch, "ledger records the bundle under another tenant");
  } else if (predecessor_missing) {
    Fail(result, VerificationReason::kChainMismatch, "ledger has no predecessor at chain_seq " + std::to_string(row->chain_seq - 1));
  } else if (result.prev_bundle_hash != expected_prev || row->prev_bundle_hash != expected_prev) {
    Fail(result, VerificationReason::kChainMismatch, "prev_bundle_hash does not match the ledger predecessor");
  }
}

VerificationResult BundleVerifier::VerifyBundle(const std::string& bundle_id) const {
  if (!repository_ || !store_) {
    throw std::logic_error("verify bundle: verifier has no ledger or archive store");
  }

  VerificationResult result;
  result.bundle_id = bundle_id;

  std::optional<db::model::SealedExportRecord> row;
  try {
    auto tx = repository_->Begin();
    row     = repository_->GetSealedExport(*tx, bundle_id);
    tx->Commit();
  } catch (const std::exception& e) {
    SEALER_LOG_ERROR("ledger lookup failed", {StringField("bundle_id", bundle_id), StringField("error", e.what())});
    return Finish(Fail(result, VerificationReason::kSourceUnavailable, std::string("ledger unavailable: ") + e.what()));
  }
  if (!row) {
    return Finish(Fail(result, VerificationReason::kBundleNotFound, "no ledger record for bundle " + bundle_id));
  }

  std::shared_ptr<arrow::Buffer> archive;
  try {
    archive = store_->Get(row->storage_key);
  } catch (const util::NotFound&) {
    SEALER_LOG_WARN("ledger record without archive", {StringField("bundle_id", bundle_id), StringField("tenant_id", row->tenant_id),
                                                      StringField("storage_key", row->storage_key)});
    result.tenant_id = row->tenant_id;
    return Finish(Fail(result, VerificationReason::kBundleNotFound, "archive missing from storage: " + row->storage_key));
  } catch (const std::exception& e) {
    SEALER_LOG_ERROR("archive fetch failed", {StringField("bundle_id", bundle_id), StringField("storage_key", row->storage_key),
                                              StringField("error", e.what())});
    result.tenant_id = row->tenant_id;
    return Finish(Fail(result, VerificationReason::kSourceUnavailable, std::string("archive store unavailable: ") + e.what()));
  }

  result = VerifyArchive(std::string_view(reinterpret_cast<const char*>(archive->data()), static_cast<size_t>(archive->size())));
  if (result.reason != VerificationReason::kMalformedArchive && result.bundle_id != bundle_id) {
    const auto found = result.bundle_id;
    Fail(result, VerificationReason::kChainMismatch, "stored archive belongs to bundle " + found);
  }
  return result;
}

ChainReport BundleVerifier::VerifyChain(const std::string& tenant_id, bool verify_archives) const {
  if (!repository_ || (verify_archives && !store_)) {
    throw std::logic_error("verify chain: verifier has no ledger or archive store");
  }
  observability::SpanScope span("BundleVerifier/VerifyChain");
  span.SetAttribute("tenant_id", tenant_id);

  ChainReport report;
  report.tenant_id = tenant_id;

  std::vector<db::model::SealedExportRecord> chain;
  {
    auto tx = repository_->Begin();
    chain   = repository_->ListChain(*tx, tenant_id);
    tx->Commit();
  }

  auto broken = [&report](const db::model::SealedExportRecord& row, VerificationReason reason, std::string detail) {
    report.intact                 = false;
    report.first_broken_bundle_id = row.bundle_id;
    report.reason                 = reason;
    report.detail                 = std::move(detail);
  };

  uint64_t                   expected_seq = 1;
  std::optional<std::string> expected_prev;
  for (const auto& row : chain) {
    ++report.bundles_checked;
    if (row.chain_seq != expected_seq) {
      broken(row, VerificationReason::kChainMismatch,
             "chain_seq " + std::to_string(row.chain_seq) + " where " + std::to_string(expected_seq) + " was expected");
      break;
    }
    if (row.prev_bundle_hash != expected_prev) {
      broken(row, VerificationReason::kChainMismatch, "prev_bundle_hash does not match the preceding bundle");
      break;
    }
    if (verify_archives) {
      auto result = VerifyBundle(row.bundle_id);
      if (!result.valid) {
        broken(row, result.reason, result.detail);
        break;
      }
    }
    expected_prev = row.manifest_sha256;
    ++expected_seq;
  }

  span.SetAttribute("bundles_checked", static_cast<int64_t>(report.bundles_checked));
  if (!report.intact) {
    SEALER_LOG_WARN("tenant chain broken", {StringField("tenant_id", tenant_id), StringField("bundle_id", *report.first_broken_bundle_id),
                                            StringField("reason", ToString(report.reason)), StringField("detail", report.detail)});
  }
  return report;
}

} // namespace sealer::core
