#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/bundle_sealer.hpp"
#include "internal/core/bundle_verifier.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/sealed_export_server.hpp"
#include "internal/service/sealed_export_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/ram/ram_archive_store.hpp"
#include "sealer/v1.hpp"

namespace {

// Rejects every upload.
class UnreachableStore final : public sealer::storage::ArchiveStore {
 public:
  void Put(const std::string&, const std::shared_ptr<arrow::Buffer>&, const sealer::storage::ObjectMetadata&) override {
    throw std::runtime_error("endpoint unreachable");
  }
  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override {
    throw sealer::util::NotFound("archive not found: " + key);
  }
  std::optional<sealer::storage::ObjectInfo> Stat(const std::string&) override {
    return std::nullopt;
  }
  void Remove(const std::string&) override {
  }
};

sealer::service::ServiceContext BuildServiceContext(std::optional<sealer::crypto::SigningKey> active = sealer::crypto::SigningKey{"k1", "secret"},
                                                    sealer::storage::ArchiveStorePtr           store  = nullptr) {
  if (!store) {
    store = std::make_shared<sealer::storage::RamArchiveStore>();
  }
  auto keys = std::make_shared<sealer::crypto::KeyRing>(std::move(active), std::map<std::string, std::string>{});
  auto repo = std::make_shared<sealer::db::memory::MemoryRepository>();

  sealer::core::SealerOptions options;
  options.verify_base_url        = "https://verify.example.com";
  options.upload_max_attempts    = 2;
  options.upload_initial_backoff = std::chrono::milliseconds(1);

  sealer::service::ServiceContext ctx;
  ctx.sealer     = std::make_shared<sealer::core::BundleSealer>(repo, store, keys, options);
  ctx.verifier   = std::make_shared<sealer::core::BundleVerifier>(keys, repo, store);
  ctx.repository = repo;
  ctx.store      = store;
  return ctx;
}

sealer::grpc::SealedExportServer BuildServer(sealer::service::ServiceContext ctx) {
  return sealer::grpc::SealedExportServer(std::make_shared<sealer::service::SealedExportService>(std::move(ctx)));
}

sealer::v1::SealRequest ValidSealRequest() {
  sealer::v1::SealRequest req;
  req.set_tenant_id("acme");
  req.set_export_type(sealer::v1::EXPORT_TYPE_PDF_REPORT);
  req.mutable_generated_by()->set_user_id("user-1");
  auto* file = req.add_files();
  file->set_path("report.pdf");
  file->set_data("%PDF-1.4 abc");
  file->set_content_type("application/pdf");
  return req;
}

void TestErrorTypesMapToStatusCodes() {
  using sealer::grpc::ToStatus;
  assert(ToStatus(sealer::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(std::invalid_argument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(sealer::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(sealer::util::SigningKeyUnavailable("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(sealer::util::StorageError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(sealer::util::ChainConflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(sealer::util::Conflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(sealer::util::PersistenceError("x", "k")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_message() == "boom");
}

void TestSealWithoutExportTypeReturnsInvalidArgument() {
  auto server = BuildServer(BuildServiceContext());

  auto req = ValidSealRequest();
  req.set_export_type(sealer::v1::EXPORT_TYPE_UNSPECIFIED);
  sealer::v1::SealResponse resp;
  ::grpc::ServerContext    grpc_ctx;

  const auto status = server.Seal(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestSealWithoutFilesReturnsInvalidArgument() {
  auto server = BuildServer(BuildServiceContext());

  auto req = ValidSealRequest();
  req.clear_files();
  sealer::v1::SealResponse resp;
  ::grpc::ServerContext    grpc_ctx;

  const auto status = server.Seal(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestSealWithoutSigningKeyReturnsFailedPrecondition() {
  auto server = BuildServer(BuildServiceContext(std::nullopt));

  auto                     req = ValidSealRequest();
  sealer::v1::SealResponse resp;
  ::grpc::ServerContext    grpc_ctx;

  const auto status = server.Seal(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestSealWithUnreachableStorageReturnsUnavailable() {
  auto server = BuildServer(BuildServiceContext(sealer::crypto::SigningKey{"k1", "secret"}, std::make_shared<UnreachableStore>()));

  auto                     req = ValidSealRequest();
  sealer::v1::SealResponse resp;
  ::grpc::ServerContext    grpc_ctx;

  const auto status = server.Seal(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
}

void TestDownloadMissingBundleReturnsNotFound() {
  auto server = BuildServer(BuildServiceContext());

  sealer::v1::DownloadRequest req;
  req.set_bundle_id("00000000-0000-4000-8000-000000000000");
  sealer::v1::DownloadResponse resp;
  ::grpc::ServerContext        grpc_ctx;

  const auto status = server.Download(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestMissingIdentifiersReturnInvalidArgument() {
  auto server = BuildServer(BuildServiceContext());

  {
    sealer::v1::VerifyRequest      req;
    sealer::v1::VerificationResult resp;
    ::grpc::ServerContext          grpc_ctx;
    assert(server.Verify(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
  {
    sealer::v1::ListSealedExportsRequest  req;
    sealer::v1::ListSealedExportsResponse resp;
    ::grpc::ServerContext                 grpc_ctx;
    assert(server.ListSealedExports(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
  {
    sealer::v1::VerifyChainRequest  req;
    sealer::v1::VerifyChainResponse resp;
    ::grpc::ServerContext           grpc_ctx;
    assert(server.VerifyChain(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
}

void TestFailedVerificationIsNotAnRpcError() {
  auto server = BuildServer(BuildServiceContext());

  sealer::v1::VerifyArchiveRequest req;
  req.set_archive("not a zip");
  sealer::v1::VerificationResult resp;
  ::grpc::ServerContext          grpc_ctx;

  const auto status = server.VerifyArchive(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.valid());
  assert(resp.reason() == sealer::v1::VERIFICATION_REASON_MALFORMED_ARCHIVE);

  sealer::v1::VerifyRequest verify_req;
  verify_req.set_bundle_id("00000000-0000-4000-8000-000000000000");
  sealer::v1::VerificationResult verify_resp;
  ::grpc::ServerContext          verify_ctx;
  assert(server.Verify(&verify_ctx, &verify_req, &verify_resp).ok());
  assert(verify_resp.reason() == sealer::v1::VERIFICATION_REASON_BUNDLE_NOT_FOUND);
}

} // namespace

int main() {
  TestErrorTypesMapToStatusCodes();
  TestSealWithoutExportTypeReturnsInvalidArgument();
  TestSealWithoutFilesReturnsInvalidArgument();
  TestSealWithoutSigningKeyReturnsFailedPrecondition();
  TestSealWithUnreachableStorageReturnsUnavailable();
  TestDownloadMissingBundleReturnsNotFound();
  TestMissingIdentifiersReturnInvalidArgument();
  TestFailedVerificationIsNotAnRpcError();

  std::cout << "export_sealer_unit_grpc_status: pass\n";
  return 0;
}
