#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/archive/zip_archive.hpp"
#include "internal/core/bundle_sealer.hpp"
#include "internal/core/bundle_verifier.hpp"
#include "internal/crypto/content_hasher.hpp"
#include "internal/crypto/signer.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/manifest/manifest_builder.hpp"
#include "internal/manifest/manifest_codec.hpp"
#include "internal/storage/ram/ram_archive_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using sealer::core::BundleSealer;
using sealer::core::BundleVerifier;
using sealer::core::VerificationReason;
using sealer::crypto::KeyRing;
using sealer::crypto::SigningKey;
using sealer::db::memory::MemoryRepository;
using sealer::storage::RamArchiveStore;

const std::string kOldKey = "material-of-key-2024";
const std::string kNewKey = "material-of-key-2025";

std::shared_ptr<const KeyRing> Ring(std::optional<SigningKey> active, std::map<std::string, std::string> legacy = {}) {
  return std::make_shared<KeyRing>(std::move(active), std::move(legacy));
}

std::shared_ptr<const KeyRing> OldKeyRing() {
  return Ring(SigningKey{"k-2024", kOldKey});
}

sealer::core::SealRequest Request(const std::string& tenant_id = "acme") {
  sealer::core::SealRequest request;
  request.tenant_id    = tenant_id;
  request.export_type  = sealer::manifest::ExportType::kDefectExport;
  request.generated_by = {"user-7", "Dana Inspector"};
  request.files        = {{"report.pdf", "%PDF-1.4 abc", "application/pdf"},
                          {"defects.csv", "id,severity\n1,high\n", "text/csv"}};
  return request;
}

struct Environment {
  std::shared_ptr<MemoryRepository> repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<RamArchiveStore>  store = std::make_shared<RamArchiveStore>();
  std::shared_ptr<BundleSealer>     bundle_sealer;

  explicit Environment(std::shared_ptr<const KeyRing> keys = OldKeyRing()) {
    sealer::core::SealerOptions options;
    options.verify_base_url = "https://verify.example.com";
    bundle_sealer           = std::make_shared<BundleSealer>(repo, store, std::move(keys), options);
  }

  sealer::core::SealedBundle Seal(const std::string& tenant_id = "acme") {
    return bundle_sealer->Seal(Request(tenant_id));
  }

  std::string Archive(const sealer::core::SealedBundle& bundle) {
    return store->Get(bundle.record.storage_key)->ToString();
  }
};

// Every ledger call fails as if the database were down.
class UnreachableLedger final : public sealer::db::Repository {
 public:
  std::unique_ptr<sealer::db::Transaction> Begin() override {
    throw std::runtime_error("connection refused");
  }
  sealer::db::Result InsertSealedExport(sealer::db::Transaction&, const sealer::db::model::SealedExportRecord&) override {
    throw std::runtime_error("connection refused");
  }
  std::optional<sealer::db::model::SealedExportRecord> GetSealedExport(sealer::db::Transaction&, const std::string&) override {
    throw std::runtime_error("connection refused");
  }
  std::optional<sealer::db::model::SealedExportRecord> GetLatestSealedExport(sealer::db::Transaction&, const std::string&) override {
    throw std::runtime_error("connection refused");
  }
  std::optional<sealer::db::model::SealedExportRecord> GetSealedExportAt(sealer::db::Transaction&, const std::string&, uint64_t) override {
    throw std::runtime_error("connection refused");
  }
  std::vector<sealer::db::model::SealedExportRecord> ListSealedExports(sealer::db::Transaction&,
                                                                       const sealer::db::model::SealedExportFilter&) override {
    throw std::runtime_error("connection refused");
  }
  std::vector<sealer::db::model::SealedExportRecord> ListChain(sealer::db::Transaction&, const std::string&) override {
    throw std::runtime_error("connection refused");
  }
};

// Serves writes from RAM but fails every read with a transport error.
class ReadFailingStore final : public sealer::storage::ArchiveStore {
 public:
  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& data, const sealer::storage::ObjectMetadata& metadata) override {
    inner_.Put(key, data, metadata);
  }
  std::shared_ptr<arrow::Buffer> Get(const std::string&) override {
    throw sealer::util::StorageError("object store timed out");
  }
  std::optional<sealer::storage::ObjectInfo> Stat(const std::string& key) override {
    return inner_.Stat(key);
  }
  void Remove(const std::string& key) override {
    inner_.Remove(key);
  }

 private:
  RamArchiveStore inner_;
};

// Rebuilds an archive from a sealed bundle's manifest and signature with different payload files.
std::string Repack(const std::string& archive, const std::vector<sealer::manifest::BundleFile>& files) {
  const auto contents = sealer::archive::ReadArchive(archive);
  return sealer::archive::BuildArchive(files, contents.Find("manifest.json")->data, contents.Find("manifest.sig")->data);
}

void TestFreshBundleVerifies() {
  Environment env;
  const auto  bundle = env.Seal();

  BundleVerifier verifier(OldKeyRing(), env.repo, env.store);
  const auto     result = verifier.VerifyArchive(env.Archive(bundle));

  assert(result.valid);
  assert(result.reason == VerificationReason::kValid);
  assert(result.detail.empty());
  assert(result.bundle_id == bundle.record.bundle_id);
  assert(result.tenant_id == "acme");
  assert(result.export_type == "defect_export");
  assert(result.generated_at == bundle.manifest.generated_at);
  assert(result.signature_algorithm == "HMAC-SHA256");
  assert(result.signing_key_id == "k-2024");
  assert(result.manifest_sha256 == bundle.record.manifest_sha256);
  assert(!result.prev_bundle_hash);
  assert(result.file_count == 2);
  assert(result.chain_checked);
  assert(result.chain_seq == 1u);
}

void TestStandaloneVerificationSkipsLedger() {
  Environment env;
  const auto  bundle = env.Seal();

  BundleVerifier verifier(OldKeyRing());
  const auto     result = verifier.VerifyArchive(env.Archive(bundle));
  assert(result.valid);
  assert(!result.chain_checked);
  assert(!result.chain_seq);

  // A ledger that has never seen the bundle does not fail it either.
  BundleVerifier other_ledger(OldKeyRing(), std::make_shared<MemoryRepository>());
  const auto     unknown = other_ledger.VerifyArchive(env.Archive(bundle));
  assert(unknown.valid);
  assert(!unknown.chain_checked);
}

void TestFlippedByteIsFileHashMismatch() {
  Environment env;
  const auto  bundle  = env.Seal();
  auto        archive = env.Archive(bundle);

  const auto pos = archive.find("%PDF-1.4 abc");
  assert(pos != std::string::npos);
  archive[pos + 10] ^= 0x01;

  const auto result = BundleVerifier(OldKeyRing()).VerifyArchive(archive);
  assert(!result.valid);
  assert(result.reason == VerificationReason::kFileHashMismatch);
  assert(result.detail.find("report.pdf") != std::string::npos);
}

void TestReplacedFileIsFileHashMismatch() {
  Environment env;
  const auto  bundle = env.Seal();

  const auto repacked = Repack(env.Archive(bundle), {{"report.pdf", "%PDF-1.4 xyz", "application/pdf"},
                                                     {"defects.csv", "id,severity\n1,high\n", "text/csv"}});
  const auto result   = BundleVerifier(OldKeyRing()).VerifyArchive(repacked);
  assert(!result.valid);
  assert(result.reason == VerificationReason::kFileHashMismatch);
}

void TestMissingDeclaredFile() {
  Environment env;
  const auto  bundle = env.Seal();

  const auto repacked = Repack(env.Archive(bundle), {{"report.pdf", "%PDF-1.4 abc", "application/pdf"}});
  const auto result   = BundleVerifier(OldKeyRing()).VerifyArchive(repacked);
  assert(!result.valid);
  assert(result.reason == VerificationReason::kFileMissing);
  assert(result.detail.find("defects.csv") != std::string::npos);
}

void TestUndeclaredFile() {
  Environment env;
  const auto  bundle = env.Seal();

  const auto repacked = Repack(env.Archive(bundle), {{"report.pdf", "%PDF-1.4 abc", "application/pdf"},
                                                     {"defects.csv", "id,severity\n1,high\n", "text/csv"},
                                                     {"extra.txt", "slipped in", "text/plain"}});
  const auto result   = BundleVerifier(OldKeyRing()).VerifyArchive(repacked);
  assert(!result.valid);
  assert(result.reason == VerificationReason::kUndeclaredFile);
  assert(result.detail.find("extra.txt") != std::string::npos);
}

void TestForgedSignature() {
  Environment env;
  const auto  bundle   = env.Seal();
  const auto  contents = sealer::archive::ReadArchive(env.Archive(bundle));
  const auto& json     = contents.Find("manifest.json")->data;

  const auto wrong_key = sealer::archive::BuildArchive(Request().files, json, sealer::crypto::Sign(json, "not the key"));
  auto       result    = BundleVerifier(OldKeyRing()).VerifyArchive(wrong_key);
  assert(!result.valid);
  assert(result.reason == VerificationReason::kSignatureInvalid);

  // Editing the manifest without re-signing.
  auto edited = bundle.manifest;
  edited.tenant_id = "globex";
  const auto edited_archive = sealer::archive::BuildArchive(Request().files, sealer::manifest::CanonicalManifestJson(edited),
                                                            contents.Find("manifest.sig")->data);
  result = BundleVerifier(OldKeyRing()).VerifyArchive(edited_archive);
  assert(!result.valid);
  assert(result.reason == VerificationReason::kSignatureInvalid);
  assert(result.tenant_id == "globex");
}

void TestKeyRotation() {
  Environment env(OldKeyRing());
  const auto  bundle  = env.Seal();
  const auto  archive = env.Archive(bundle);

  // k-2024 retired but kept for verification.
  auto rotated = Ring(SigningKey{"k-2025", kNewKey}, {{"k-2024", kOldKey}});
  auto result  = BundleVerifier(rotated).VerifyArchive(archive);
  assert(result.valid);
  assert(result.signing_key_id == "k-2024");

  // k-2024 dropped from the legacy table: cannot verify, not a bad signature.
  auto dropped = Ring(SigningKey{"k-2025", kNewKey});
  result       = BundleVerifier(dropped).VerifyArchive(archive);
  assert(!result.valid);
  assert(result.reason == VerificationReason::kUnknownKey);

  // Same id, different material: the signature fails.
  auto replaced = Ring(SigningKey{"k-2024", kNewKey});
  result        = BundleVerifier(replaced).VerifyArchive(archive);
  assert(result.reason == VerificationReason::kSignatureInvalid);
}

void TestMalformedArchives() {
  BundleVerifier verifier(OldKeyRing());

  assert(verifier.VerifyArchive("").reason == VerificationReason::kMalformedArchive);
  assert(verifier.VerifyArchive("this is not a zip").reason == VerificationReason::kMalformedArchive);

  const auto bad_json = sealer::archive::BuildArchive(Request().files, "not json", "c2ln");
  const auto result   = verifier.VerifyArchive(bad_json);
  assert(!result.valid);
  assert(result.reason == VerificationReason::kMalformedArchive);
  assert(result.bundle_id.empty());
}

void TestOversizedDeclaredSizeIsMalformed() {
  const std::vector<sealer::manifest::BundleFile> files = {{"report.pdf", std::string(4096, 'x'), "application/pdf"}};
  auto archive = sealer::archive::BuildArchive(files, "{}", "sig");

  const auto central = archive.find(std::string("PK\x01\x02", 4));
  assert(central != std::string::npos);
  archive.replace(central + 24, 4, std::string("\xf0\xff\xff\xff", 4));

  const auto result = BundleVerifier(OldKeyRing()).VerifyArchive(archive);
  assert(!result.valid);
  assert(result.reason == VerificationReason::kMalformedArchive);
}

void TestUnreachableLedgerIsReportedNotThrown() {
  Environment env;
  const auto  bundle = env.Seal();

  BundleVerifier verifier(OldKeyRing(), std::make_shared<UnreachableLedger>(), env.store);

  // The archive itself still verifies; the ledger comparison is skipped.
  const auto offline = verifier.VerifyArchive(env.Archive(bundle));
  assert(offline.valid);
  assert(!offline.chain_checked);

  const auto by_id = verifier.VerifyBundle(bundle.record.bundle_id);
  assert(!by_id.valid);
  assert(by_id.reason == VerificationReason::kSourceUnavailable);
  assert(by_id.detail.find("connection refused") != std::string::npos);
}

void TestStoreReadFailureIsReportedNotThrown() {
  auto store = std::make_shared<ReadFailingStore>();
  auto repo  = std::make_shared<MemoryRepository>();
  auto keys  = OldKeyRing();

  sealer::core::SealerOptions options;
  options.verify_base_url = "https://verify.example.com";
  const auto bundle       = BundleSealer(repo, store, keys, options).Seal(Request());

  const auto result = BundleVerifier(keys, repo, store).VerifyBundle(bundle.record.bundle_id);
  assert(!result.valid);
  assert(result.reason == VerificationReason::kSourceUnavailable);
  assert(result.tenant_id == "acme");

  const auto report = BundleVerifier(keys, repo, store).VerifyChain("acme", /*verify_archives=*/true);
  assert(!report.intact);
  assert(report.reason == VerificationReason::kSourceUnavailable);
}

void TestLedgerDigestMismatch() {
  Environment env;
  const auto  bundle = env.Seal();

  // A second ledger records the same bundle id with another digest.
  auto other  = std::make_shared<MemoryRepository>();
  auto record = bundle.record;
  record.manifest_sha256 = std::string(64, 'f');
  {
    auto       tx       = other->Begin();
    const bool inserted = static_cast<bool>(other->InsertSealedExport(*tx, record));
    assert(inserted);
    tx->Commit();
  }

  const auto result = BundleVerifier(OldKeyRing(), other).VerifyArchive(env.Archive(bundle));
  assert(!result.valid);
  assert(result.reason == VerificationReason::kChainMismatch);
  assert(result.chain_checked);
}

// Signs a bundle by hand so its predecessor link can be wrong.
sealer::db::model::SealedExportRecord SealWithPredecessor(Environment& env, const std::optional<std::string>& prev, uint64_t chain_seq,
                                                          std::string* archive_out) {
  const auto files = Request().files;

  sealer::manifest::ManifestParams params;
  params.bundle_id        = sealer::util::ToString(sealer::util::GenerateUUID());
  params.tenant_id        = "acme";
  params.export_type      = sealer::manifest::ExportType::kDefectExport;
  params.generated_by     = {"user-7", "Dana Inspector"};
  params.signing_key_id   = "k-2024";
  params.prev_bundle_hash = prev;
  params.files            = sealer::crypto::HashFiles(files);
  params.verify_base_url  = "https://verify.example.com";

  const auto manifest = sealer::manifest::BuildManifest(params);
  const auto json     = sealer::manifest::CanonicalManifestJson(manifest);
  const auto sig      = sealer::crypto::Sign(json, kOldKey);
  *archive_out        = sealer::archive::BuildArchive(files, json, sig);

  sealer::db::model::SealedExportRecord record;
  record.bundle_id        = params.bundle_id;
  record.tenant_id        = "acme";
  record.export_type      = "defect_export";
  record.file_count       = files.size();
  record.total_bytes      = archive_out->size();
  record.storage_key      = "sealed-exports/acme/" + params.bundle_id + ".zip";
  record.manifest_sha256  = sealer::crypto::Sha256Hex(json);
  record.manifest_sig     = sig;
  record.signing_key_id   = "k-2024";
  record.prev_bundle_hash = prev;
  record.generated_by     = "user-7";
  record.generated_at     = manifest.generated_at;
  record.chain_seq        = chain_seq;

  auto       tx       = env.repo->Begin();
  const bool inserted = static_cast<bool>(env.repo->InsertSealedExport(*tx, record));
  assert(inserted);
  tx->Commit();
  env.store->Put(record.storage_key, arrow::Buffer::FromString(*archive_out), {});
  return record;
}

void TestBrokenPredecessorLink() {
  Environment env;
  const auto  first = env.Seal();

  std::string archive;
  const auto  forged = SealWithPredecessor(env, std::string(64, '0'), 2, &archive);

  BundleVerifier verifier(OldKeyRing(), env.repo, env.store);
  const auto     result = verifier.VerifyArchive(archive);
  assert(!result.valid);
  assert(result.reason == VerificationReason::kChainMismatch);
  assert(result.chain_seq == 2u);

  // The first bundle is untouched.
  assert(verifier.VerifyBundle(first.record.bundle_id).valid);

  const auto report = verifier.VerifyChain("acme", /*verify_archives=*/false);
  assert(!report.intact);
  assert(report.bundles_checked == 2);
  assert(report.first_broken_bundle_id == forged.bundle_id);
  assert(report.reason == VerificationReason::kChainMismatch);
}

void TestVerifyBundleLooksUpLedgerAndStore() {
  Environment env;
  const auto  bundle = env.Seal();

  BundleVerifier verifier(OldKeyRing(), env.repo, env.store);
  auto           result = verifier.VerifyBundle(bundle.record.bundle_id);
  assert(result.valid);
  assert(result.chain_checked);

  result = verifier.VerifyBundle("00000000-0000-4000-8000-000000000000");
  assert(!result.valid);
  assert(result.reason == VerificationReason::kBundleNotFound);

  env.store->Remove(bundle.record.storage_key);
  result = verifier.VerifyBundle(bundle.record.bundle_id);
  assert(!result.valid);
  assert(result.reason == VerificationReason::kBundleNotFound);
  assert(result.tenant_id == "acme");
}

void TestVerifyBundleRejectsSwappedArchive() {
  Environment env;
  const auto  first  = env.Seal();
  const auto  second = env.Seal();

  // Overwrite the second bundle's object with the first bundle's archive.
  env.store->Put(second.record.storage_key, env.store->Get(first.record.storage_key), {});

  const auto result = BundleVerifier(OldKeyRing(), env.repo, env.store).VerifyBundle(second.record.bundle_id);
  assert(!result.valid);
  assert(result.reason == VerificationReason::kChainMismatch);
}

void TestVerifyChainWalksEveryBundle() {
  Environment env;
  const auto  a = env.Seal();
  const auto  b = env.Seal();
  const auto  c = env.Seal();
  (void)env.Seal("globex");

  BundleVerifier verifier(OldKeyRing(), env.repo, env.store);

  auto report = verifier.VerifyChain("acme", /*verify_archives=*/true);
  assert(report.intact);
  assert(report.tenant_id == "acme");
  assert(report.bundles_checked == 3);
  assert(!report.first_broken_bundle_id);
  assert(report.reason == VerificationReason::kValid);

  report = verifier.VerifyChain("nobody", /*verify_archives=*/true);
  assert(report.intact);
  assert(report.bundles_checked == 0);

  // Tamper with the middle archive in storage.
  auto archive = env.Archive(b);
  archive[archive.find("%PDF-1.4 abc") + 10] ^= 0x01;
  env.store->Put(b.record.storage_key, arrow::Buffer::FromString(archive), {});

  report = verifier.VerifyChain("acme", /*verify_archives=*/false);
  assert(report.intact);

  report = verifier.VerifyChain("acme", /*verify_archives=*/true);
  assert(!report.intact);
  assert(report.first_broken_bundle_id == b.record.bundle_id);
  assert(report.reason == VerificationReason::kFileHashMismatch);
  assert(report.bundles_checked == 2);
  (void)a;
  (void)c;
}

void TestMisconfiguredVerifierThrows() {
  BundleVerifier verifier(OldKeyRing());

  bool threw = false;
  try {
    (void)verifier.VerifyBundle("b-1");
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);

  BundleVerifier ledger_only(OldKeyRing(), std::make_shared<MemoryRepository>());
  threw = false;
  try {
    (void)ledger_only.VerifyChain("acme", /*verify_archives=*/true);
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(ledger_only.VerifyChain("acme", /*verify_archives=*/false).intact);
}

void TestReasonNames() {
  assert(std::string(ToString(VerificationReason::kValid)) == "valid");
  assert(std::string(ToString(VerificationReason::kFileHashMismatch)) == "file_hash_mismatch");
  assert(std::string(ToString(VerificationReason::kUnknownKey)) == "unknown_key");
  assert(std::string(ToString(VerificationReason::kSignatureInvalid)) == "signature_invalid");
  assert(std::string(ToString(VerificationReason::kSourceUnavailable)) == "source_unavailable");
}

} // namespace

int main() {
  TestFreshBundleVerifies();
  TestStandaloneVerificationSkipsLedger();
  TestFlippedByteIsFileHashMismatch();
  TestReplacedFileIsFileHashMismatch();
  TestMissingDeclaredFile();
  TestUndeclaredFile();
  TestForgedSignature();
  TestKeyRotation();
  TestMalformedArchives();
  TestOversizedDeclaredSizeIsMalformed();
  TestUnreachableLedgerIsReportedNotThrown();
  TestStoreReadFailureIsReportedNotThrown();
  TestLedgerDigestMismatch();
  TestBrokenPredecessorLink();
  TestVerifyBundleLooksUpLedgerAndStore();
  TestVerifyBundleRejectsSwappedArchive();
  TestVerifyChainWalksEveryBundle();
  TestMisconfiguredVerifierThrows();
  TestReasonNames();

  std::cout << "export_sealer_unit_bundle_verifier: pass\n";
  return 0;
}
