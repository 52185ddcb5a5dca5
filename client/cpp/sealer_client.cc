#include "client/cpp/sealer_client.h"

#include <string>
#include <string_view>

#include <arrow/status.h>
#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/channel_arguments.h>

namespace sealer::client {

namespace {

// Archives travel inline; keep in step with the server's message limit.
constexpr int kMaxMessageBytes = 512 * 1024 * 1024;

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  switch (status.error_code()) {
    case grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
    case grpc::StatusCode::INVALID_ARGUMENT:
    case grpc::StatusCode::FAILED_PRECONDITION:
      return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
    default:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
  }
}

std::unique_ptr<grpc::ClientContext> MakeContext() {
  return std::make_unique<grpc::ClientContext>();
}

} // namespace

std::shared_ptr<grpc::Channel> CreateSealerChannel(const std::string& address) {
  grpc::ChannelArguments args;
  args.SetMaxReceiveMessageSize(kMaxMessageBytes);
  args.SetMaxSendMessageSize(kMaxMessageBytes);
  return grpc::CreateCustomChannel(address, grpc::InsecureChannelCredentials(), args);
}

SealerClient::SealerClient(std::shared_ptr<grpc::Channel> channel) : stub_(sealer::v1::SealedExportService::NewStub(std::move(channel))) {
}

arrow::Result<SealerClient::SealedArchive> SealerClient::Seal(const sealer::v1::SealRequest& request) const {
  auto                     ctx = MakeContext();
  sealer::v1::SealResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Seal(ctx.get(), request, &resp), "Seal"));

  SealedArchive out;
  out.sealed_export = resp.sealed_export();
  // A null archive with include_archive set means the server could not read it back; use Download.
  if (request.include_archive() && !resp.archive_omitted()) {
    out.archive = arrow::Buffer::FromString(std::move(*resp.mutable_archive()));
  }
  return out;
}

arrow::Result<SealerClient::SealedArchive> SealerClient::Download(const std::string& bundle_id) const {
  auto                        ctx = MakeContext();
  sealer::v1::DownloadRequest req;
  req.set_bundle_id(bundle_id);
  sealer::v1::DownloadResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Download(ctx.get(), req, &resp), "Download"));

  SealedArchive out;
  out.sealed_export = resp.sealed_export();
  out.archive       = arrow::Buffer::FromString(std::move(*resp.mutable_archive()));
  return out;
}

arrow::Result<std::vector<sealer::v1::SealedExport>> SealerClient::List(const std::string& tenant_id, sealer::v1::ExportType export_type,
                                                                        uint32_t limit, uint32_t offset) const {
  auto                                 ctx = MakeContext();
  sealer::v1::ListSealedExportsRequest req;
  req.set_tenant_id(tenant_id);
  req.set_export_type(export_type);
  req.set_limit(limit);
  req.set_offset(offset);
  sealer::v1::ListSealedExportsResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->ListSealedExports(ctx.get(), req, &resp), "ListSealedExports"));

  return std::vector<sealer::v1::SealedExport>(resp.sealed_exports().begin(), resp.sealed_exports().end());
}

arrow::Result<sealer::v1::VerificationResult> SealerClient::Verify(const std::string& bundle_id) const {
  auto                      ctx = MakeContext();
  sealer::v1::VerifyRequest req;
  req.set_bundle_id(bundle_id);
  sealer::v1::VerificationResult resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Verify(ctx.get(), req, &resp), "Verify"));
  return resp;
}

arrow::Result<sealer::v1::VerificationResult> SealerClient::VerifyArchive(const std::shared_ptr<arrow::Buffer>& archive) const {
  if (!archive) {
    return arrow::Status::Invalid("VerifyArchive: archive buffer is null");
  }
  if (archive->size() > kMaxMessageBytes) {
    return arrow::Status::Invalid("VerifyArchive: archive larger than the RPC message limit");
  }

  auto                             ctx = MakeContext();
  sealer::v1::VerifyArchiveRequest req;
  req.set_archive(archive->ToString());
  sealer::v1::VerificationResult resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->VerifyArchive(ctx.get(), req, &resp), "VerifyArchive"));
  return resp;
}

arrow::Result<sealer::v1::VerifyChainResponse> SealerClient::VerifyChain(const std::string& tenant_id, bool verify_archives) const {
  auto                           ctx = MakeContext();
  sealer::v1::VerifyChainRequest req;
  req.set_tenant_id(tenant_id);
  req.set_verify_archives(verify_archives);
  sealer::v1::VerifyChainResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->VerifyChain(ctx.get(), req, &resp), "VerifyChain"));
  return resp;
}

} // namespace sealer::client
