#include "sealed_export_server.hpp"
#include "grpc_error.hpp"

namespace sealer::grpc {

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

SealedExportServer::SealedExportServer(std::shared_ptr<sealer::service::SealedExportService> svc)
    : service_(std::move(svc)) {}

::grpc::Status SealedExportServer::Seal(::grpc::ServerContext*,
                                        const sealer::v1::SealRequest* req,
                                        sealer::v1::SealResponse* resp) {
  return Handle([&] { *resp = service_->Seal(*req); });
}

::grpc::Status SealedExportServer::Download(::grpc::ServerContext*,
                                            const sealer::v1::DownloadRequest* req,
                                            sealer::v1::DownloadResponse* resp) {
  return Handle([&] { *resp = service_->Download(*req); });
}

::grpc::Status SealedExportServer::ListSealedExports(::grpc::ServerContext*,
                                                     const sealer::v1::ListSealedExportsRequest* req,
                                                     sealer::v1::ListSealedExportsResponse* resp) {
  return Handle([&] { *resp = service_->ListSealedExports(*req); });
}

::grpc::Status SealedExportServer::Verify(::grpc::ServerContext*,
                                          const sealer::v1::VerifyRequest* req,
                                          sealer::v1::VerificationResult* resp) {
  return Handle([&] { *resp = service_->Verify(*req); });
}

::grpc::Status SealedExportServer::VerifyArchive(::grpc::ServerContext*,
                                                 const sealer::v1::VerifyArchiveRequest* req,
                                                 sealer::v1::VerificationResult* resp) {
  return Handle([&] { *resp = service_->VerifyArchive(*req); });
}

::grpc::Status SealedExportServer::VerifyChain(::grpc::ServerContext*,
                                               const sealer::v1::VerifyChainRequest* req,
                                               sealer::v1::VerifyChainResponse* resp) {
  return Handle([&] { *resp = service_->VerifyChain(*req); });
}

}
