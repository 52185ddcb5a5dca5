#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/archive/zip_archive.hpp"
#include "internal/core/bundle_sealer.hpp"
#include "internal/crypto/content_hasher.hpp"
#include "internal/crypto/signer.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/manifest/manifest_codec.hpp"
#include "internal/storage/ram/ram_archive_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using sealer::core::BundleSealer;
using sealer::core::SealerOptions;
using sealer::core::SealRequest;
using sealer::db::memory::MemoryRepository;
using sealer::storage::RamArchiveStore;

constexpr const char* kKeyMaterial = "test-signing-secret";

std::shared_ptr<const sealer::crypto::KeyRing> TestKeys() {
  return std::make_shared<sealer::crypto::KeyRing>(sealer::crypto::SigningKey{"k-2025", kKeyMaterial},
                                                   std::map<std::string, std::string>{});
}

SealerOptions TestOptions() {
  SealerOptions options;
  options.verify_base_url        = "https://verify.example.com";
  options.upload_initial_backoff = std::chrono::milliseconds(1);
  options.upload_max_backoff     = std::chrono::milliseconds(4);
  return options;
}

SealRequest ReportRequest(const std::string& tenant_id = "acme") {
  SealRequest request;
  request.tenant_id    = tenant_id;
  request.export_type  = sealer::manifest::ExportType::kInspectionReport;
  request.generated_by = {"user-7", "Dana Inspector"};
  request.files        = {{"report.pdf", "%PDF-1.4 abc", "application/pdf"}};
  return request;
}

std::vector<sealer::db::model::SealedExportRecord> Chain(MemoryRepository& repo, const std::string& tenant_id) {
  auto tx    = repo.Begin();
  auto chain = repo.ListChain(*tx, tenant_id);
  tx->Commit();
  return chain;
}

sealer::db::model::SealedExportRecord CompetingRecord(MemoryRepository& repo, const std::string& tenant_id) {
  auto tx   = repo.Begin();
  auto head = repo.GetLatestSealedExport(*tx, tenant_id);
  tx->Commit();

  sealer::db::model::SealedExportRecord r;
  r.bundle_id        = sealer::util::ToString(sealer::util::GenerateUUID());
  r.tenant_id        = tenant_id;
  r.export_type      = "inspection_report";
  r.file_count       = 1;
  r.total_bytes      = 1;
  r.storage_key      = "elsewhere/" + tenant_id + "/" + r.bundle_id + ".zip";
  r.manifest_sha256  = sealer::crypto::Sha256Hex(r.bundle_id);
  r.manifest_sig     = "sig";
  r.signing_key_id   = "k-2025";
  r.prev_bundle_hash = head ? std::optional<std::string>(head->manifest_sha256) : std::nullopt;
  r.generated_by     = "rival";
  r.generated_at     = "2024-05-01T09:30:00.000Z";
  r.chain_seq        = head ? head->chain_seq + 1 : 1;
  return r;
}

// Delegates to a MemoryRepository; hooks let a test interfere with inserts.
class InterceptingRepository final : public sealer::db::Repository {
 public:
  explicit InterceptingRepository(std::shared_ptr<MemoryRepository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<sealer::db::Transaction> Begin() override {
    return inner_->Begin();
  }

  sealer::db::Result InsertSealedExport(sealer::db::Transaction& tx, const sealer::db::model::SealedExportRecord& r) override {
    ++insert_calls;
    if (fail_inserts) {
      return sealer::db::Result::Err(sealer::db::ErrorCode::IOError, "disk full");
    }
    if (races_remaining > 0) {
      --races_remaining;
      // A rival commits the same chain slot after this transaction took its snapshot.
      auto rival = inner_->Begin();
      auto ok    = inner_->InsertSealedExport(*rival, CompetingRecord(*inner_, r.tenant_id));
      assert(ok);
      rival->Commit();
    }
    return inner_->InsertSealedExport(tx, r);
  }

  std::optional<sealer::db::model::SealedExportRecord> GetSealedExport(sealer::db::Transaction& tx, const std::string& id) override {
    return inner_->GetSealedExport(tx, id);
  }

  std::optional<sealer::db::model::SealedExportRecord> GetLatestSealedExport(sealer::db::Transaction& tx, const std::string& tenant) override {
    return inner_->GetLatestSealedExport(tx, tenant);
  }

  std::optional<sealer::db::model::SealedExportRecord> GetSealedExportAt(sealer::db::Transaction& tx, const std::string& tenant,
                                                                         uint64_t seq) override {
    return inner_->GetSealedExportAt(tx, tenant, seq);
  }

  std::vector<sealer::db::model::SealedExportRecord> ListSealedExports(sealer::db::Transaction& tx,
                                                                       const sealer::db::model::SealedExportFilter& filter) override {
    return inner_->ListSealedExports(tx, filter);
  }

  std::vector<sealer::db::model::SealedExportRecord> ListChain(sealer::db::Transaction& tx, const std::string& tenant) override {
    return inner_->ListChain(tx, tenant);
  }

  bool fail_inserts    = false;
  int  races_remaining = 0;
  int  insert_calls    = 0;

 private:
  std::shared_ptr<MemoryRepository> inner_;
};

// Fails the first `failures` uploads with a transient error.
class FlakyStore final : public sealer::storage::ArchiveStore {
 public:
  explicit FlakyStore(int failures) : failures_(failures) {
  }

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, const sealer::storage::ObjectMetadata& metadata) override {
    ++put_calls;
    if (failures_ > 0) {
      --failures_;
      throw std::runtime_error("connection reset by peer");
    }
    inner.Put(key, buffer, metadata);
  }

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override {
    return inner.Get(key);
  }

  std::optional<sealer::storage::ObjectInfo> Stat(const std::string& key) override {
    return inner.Stat(key);
  }

  void Remove(const std::string& key) override {
    inner.Remove(key);
  }

  RamArchiveStore inner;
  int             put_calls = 0;

 private:
  int failures_;
};

void TestScenarioFirstAndSecondSeal() {
  auto         repo  = std::make_shared<MemoryRepository>();
  auto         store = std::make_shared<RamArchiveStore>();
  BundleSealer bundle_sealer(repo, store, TestKeys(), TestOptions());

  const auto first = bundle_sealer.Seal(ReportRequest());

  assert(sealer::util::IsUUIDString(first.record.bundle_id));
  assert(!first.manifest.prev_bundle_hash);
  assert(!first.record.prev_bundle_hash);
  assert(first.record.chain_seq == 1);
  assert(first.manifest.files.size() == 1);
  assert(first.manifest.files[0].path == "report.pdf");
  assert(first.manifest.files[0].bytes == 12);
  assert(first.manifest.files[0].sha256 == sealer::crypto::Sha256Hex("%PDF-1.4 abc"));
  assert(first.manifest.signing_key_id == "k-2025");
  assert(first.manifest.verify_url == "https://verify.example.com/api/v1/verify/" + first.record.bundle_id);

  const auto manifest_json = sealer::manifest::CanonicalManifestJson(first.manifest);
  assert(first.record.manifest_sha256 == sealer::crypto::Sha256Hex(manifest_json));
  assert(first.record.manifest_sig == sealer::crypto::Sign(manifest_json, kKeyMaterial));
  assert(first.record.storage_key == "sealed-exports/acme/" + first.record.bundle_id + ".zip");
  assert(first.record.generated_by == "user-7");
  assert(first.record.generated_at == first.manifest.generated_at);

  // The stored archive carries the exact signed bytes.
  const auto archive  = store->Get(first.record.storage_key);
  assert(first.record.total_bytes == static_cast<uint64_t>(archive->size()));
  const auto contents = sealer::archive::ReadArchive(archive->ToString());
  assert(contents.Find("report.pdf")->data == "%PDF-1.4 abc");
  assert(contents.Find("manifest.json")->data == manifest_json);
  assert(contents.Find("manifest.sig")->data == first.record.manifest_sig);

  const auto info = store->Stat(first.record.storage_key);
  assert(info->metadata.at("content-type") == "application/zip");
  assert(info->metadata.at("bundle-id") == first.record.bundle_id);
  assert(info->metadata.at("tenant-id") == "acme");

  const auto second = bundle_sealer.Seal(ReportRequest());
  assert(second.manifest.prev_bundle_hash == first.record.manifest_sha256);
  assert(second.record.prev_bundle_hash == first.record.manifest_sha256);
  assert(second.record.chain_seq == 2);
  assert(second.record.bundle_id != first.record.bundle_id);

  const auto chain = Chain(*repo, "acme");
  assert(chain.size() == 2);
  assert(chain[0] == first.record);
  assert(chain[1] == second.record);
}

void TestTenantsChainIndependently() {
  auto         repo  = std::make_shared<MemoryRepository>();
  BundleSealer bundle_sealer(repo, std::make_shared<RamArchiveStore>(), TestKeys(), TestOptions());

  const auto a = bundle_sealer.Seal(ReportRequest("acme"));
  const auto b = bundle_sealer.Seal(ReportRequest("globex"));
  assert(a.record.chain_seq == 1);
  assert(b.record.chain_seq == 1);
  assert(!b.record.prev_bundle_hash);
}

void TestTenantLocksAreReleasedAfterSealing() {
  BundleSealer bundle_sealer(std::make_shared<MemoryRepository>(), std::make_shared<RamArchiveStore>(), TestKeys(), TestOptions());
  for (int i = 0; i < 20; ++i) {
    (void)bundle_sealer.Seal(ReportRequest("tenant-" + std::to_string(i)));
  }
  assert(bundle_sealer.ActiveTenantCount() == 0);
}

void TestParallelHashingMatchesSerial() {
  auto options         = TestOptions();
  options.hash_workers = 4;
  BundleSealer bundle_sealer(std::make_shared<MemoryRepository>(), std::make_shared<RamArchiveStore>(), TestKeys(), options);

  auto request = ReportRequest();
  request.source_id = "inspection-42";
  for (int i = 0; i < 6; ++i) {
    request.files.push_back({"photos/p" + std::to_string(i) + ".jpg", std::string(1000 + i, static_cast<char>('a' + i)), "image/jpeg"});
  }

  const auto sealed = bundle_sealer.Seal(request);
  assert(sealed.manifest.files.size() == 7);
  assert(sealed.manifest.source_id == "inspection-42");
  assert(sealed.record.source_id == "inspection-42");
  for (size_t i = 0; i < request.files.size(); ++i) {
    assert(sealed.manifest.files[i].path == request.files[i].path);
    assert(sealed.manifest.files[i].sha256 == sealer::crypto::Sha256Hex(request.files[i].data));
  }
}

void TestInvalidRequestsTouchNothing() {
  auto repo  = std::make_shared<MemoryRepository>();
  auto store = std::make_shared<RamArchiveStore>();

  auto options             = TestOptions();
  options.max_bundle_bytes = 64;
  BundleSealer bundle_sealer(repo, store, TestKeys(), options);

  auto expect_invalid = [&bundle_sealer](const SealRequest& request) {
    bool threw = false;
    try {
      (void)bundle_sealer.Seal(request);
    } catch (const sealer::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  };

  auto no_files = ReportRequest();
  no_files.files.clear();
  expect_invalid(no_files);

  expect_invalid(ReportRequest(""));
  expect_invalid(ReportRequest("../other"));

  auto duplicate = ReportRequest();
  duplicate.files.push_back(duplicate.files[0]);
  expect_invalid(duplicate);

  auto reserved = ReportRequest();
  reserved.files[0].path = "manifest.json";
  expect_invalid(reserved);

  auto traversal = ReportRequest();
  traversal.files[0].path = "../report.pdf";
  expect_invalid(traversal);

  auto no_user = ReportRequest();
  no_user.generated_by.user_id.clear();
  expect_invalid(no_user);

  auto no_content_type = ReportRequest();
  no_content_type.files[0].content_type.clear();
  expect_invalid(no_content_type);

  auto empty_source = ReportRequest();
  empty_source.source_id = "";
  expect_invalid(empty_source);

  auto too_big = ReportRequest();
  too_big.files[0].data = std::string(65, 'x');
  expect_invalid(too_big);

  assert(store->Size() == 0);
  assert(Chain(*repo, "acme").empty());
}

void TestMissingSigningKeyFailsBeforeStorage() {
  auto         store = std::make_shared<RamArchiveStore>();
  auto         keys  = std::make_shared<sealer::crypto::KeyRing>(std::nullopt, std::map<std::string, std::string>{{"old", "x"}});
  BundleSealer bundle_sealer(std::make_shared<MemoryRepository>(), store, keys, TestOptions());

  bool threw = false;
  try {
    (void)bundle_sealer.Seal(ReportRequest());
  } catch (const sealer::util::SigningKeyUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(store->Size() == 0);
}

void TestTransientUploadFailuresAreRetried() {
  auto         repo  = std::make_shared<MemoryRepository>();
  auto         store = std::make_shared<FlakyStore>(2);
  BundleSealer bundle_sealer(repo, store, TestKeys(), TestOptions());

  const auto sealed = bundle_sealer.Seal(ReportRequest());
  assert(store->put_calls == 3);
  assert(store->inner.Stat(sealed.record.storage_key));
  assert(Chain(*repo, "acme").size() == 1);
}

void TestExhaustedUploadPersistsNothing() {
  auto repo                    = std::make_shared<MemoryRepository>();
  auto store                   = std::make_shared<FlakyStore>(100);
  auto options                 = TestOptions();
  options.upload_max_attempts  = 3;
  BundleSealer bundle_sealer(repo, store, TestKeys(), options);

  bool threw = false;
  try {
    (void)bundle_sealer.Seal(ReportRequest());
  } catch (const sealer::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  assert(store->put_calls == 3);
  assert(store->inner.Size() == 0);
  assert(Chain(*repo, "acme").empty());
}

void TestLedgerFailureReportsOrphanedKey() {
  auto memory         = std::make_shared<MemoryRepository>();
  auto repo           = std::make_shared<InterceptingRepository>(memory);
  auto store          = std::make_shared<RamArchiveStore>();
  repo->fail_inserts  = true;
  BundleSealer bundle_sealer(repo, store, TestKeys(), TestOptions());

  std::string orphan;
  try {
    (void)bundle_sealer.Seal(ReportRequest());
  } catch (const sealer::util::PersistenceError& e) {
    orphan = e.orphaned_storage_key();
  }
  assert(!orphan.empty());
  assert(repo->insert_calls == 1);
  // The archive stays for reconciliation.
  assert(store->Stat(orphan));
  assert(Chain(*memory, "acme").empty());
}

void TestLostChainRaceResealsOnFreshHead() {
  auto memory           = std::make_shared<MemoryRepository>();
  auto repo             = std::make_shared<InterceptingRepository>(memory);
  auto store            = std::make_shared<RamArchiveStore>();
  repo->races_remaining = 1;
  BundleSealer bundle_sealer(repo, store, TestKeys(), TestOptions());

  const auto sealed = bundle_sealer.Seal(ReportRequest());
  const auto chain  = Chain(*memory, "acme");

  assert(repo->insert_calls == 2);
  assert(chain.size() == 2);
  assert(chain[0].generated_by == "rival");
  assert(sealed.record.chain_seq == 2);
  assert(sealed.record.prev_bundle_hash == chain[0].manifest_sha256);
  assert(sealed.manifest.prev_bundle_hash == chain[0].manifest_sha256);
  // The losing attempt's archive was cleaned up.
  assert(store->Size() == 1);
  assert(store->Stat(sealed.record.storage_key));
}

void TestChainConflictAfterRetriesExhausted() {
  auto memory           = std::make_shared<MemoryRepository>();
  auto repo             = std::make_shared<InterceptingRepository>(memory);
  auto store            = std::make_shared<RamArchiveStore>();
  repo->races_remaining = 1000;

  auto options                       = TestOptions();
  options.max_chain_conflict_retries = 2;
  BundleSealer bundle_sealer(repo, store, TestKeys(), options);

  bool threw = false;
  try {
    (void)bundle_sealer.Seal(ReportRequest());
  } catch (const sealer::util::ChainConflict&) {
    threw = true;
  }
  assert(threw);
  assert(repo->insert_calls == 3);
  assert(store->Size() == 0);
  for (const auto& row : Chain(*memory, "acme")) {
    assert(row.generated_by == "rival");
  }
}

void TestConcurrentSealersNeverFork() {
  auto memory = std::make_shared<MemoryRepository>();
  auto store  = std::make_shared<RamArchiveStore>();

  auto options                       = TestOptions();
  options.max_chain_conflict_retries = 1000;

  // Two sealers model two service instances: no shared tenant mutex.
  auto sealer_a = std::make_shared<BundleSealer>(memory, store, TestKeys(), options);
  auto sealer_b = std::make_shared<BundleSealer>(memory, store, TestKeys(), options);

  constexpr int kThreadsPerSealer = 2;
  constexpr int kSealsPerThread   = 5;

  std::atomic<int>         failures{0};
  std::vector<std::thread> threads;
  for (const auto& bundle_sealer : {sealer_a, sealer_b}) {
    for (int t = 0; t < kThreadsPerSealer; ++t) {
      threads.emplace_back([bundle_sealer, &failures] {
        for (int i = 0; i < kSealsPerThread; ++i) {
          try {
            (void)bundle_sealer->Seal(ReportRequest());
          } catch (const std::exception&) {
            ++failures;
          }
        }
      });
    }
  }
  for (auto& thread : threads) {
    thread.join();
  }
  assert(failures == 0);

  const auto chain = Chain(*memory, "acme");
  assert(chain.size() == 2 * kThreadsPerSealer * kSealsPerThread);

  std::set<std::optional<std::string>> predecessors;
  std::optional<std::string>           expected_prev;
  for (size_t i = 0; i < chain.size(); ++i) {
    assert(chain[i].chain_seq == i + 1);
    assert(chain[i].prev_bundle_hash == expected_prev);
    assert(predecessors.insert(chain[i].prev_bundle_hash).second);
    expected_prev = chain[i].manifest_sha256;
  }
  assert(store->Size() == chain.size());
  assert(sealer_a->ActiveTenantCount() == 0);
  assert(sealer_b->ActiveTenantCount() == 0);
}

void TestNullDependenciesRejected() {
  bool threw = false;
  try {
    BundleSealer bundle_sealer(nullptr, std::make_shared<RamArchiveStore>(), TestKeys(), TestOptions());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScenarioFirstAndSecondSeal();
  TestTenantsChainIndependently();
  TestTenantLocksAreReleasedAfterSealing();
  TestParallelHashingMatchesSerial();
  TestInvalidRequestsTouchNothing();
  TestMissingSigningKeyFailsBeforeStorage();
  TestTransientUploadFailuresAreRetried();
  TestExhaustedUploadPersistsNothing();
  TestLedgerFailureReportsOrphanedKey();
  TestLostChainRaceResealsOnFreshHead();
  TestChainConflictAfterRetriesExhausted();
  TestConcurrentSealersNeverFork();
  TestNullDependenciesRejected();

  std::cout << "export_sealer_unit_bundle_sealer: pass\n";
  return 0;
}
