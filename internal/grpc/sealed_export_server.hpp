#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/sealed_export_service.hpp"
#include "sealer/v1.hpp"

namespace sealer::grpc {

class SealedExportServer final : public sealer::v1::SealedExportService::Service {
public:
  explicit SealedExportServer(std::shared_ptr<sealer::service::SealedExportService> svc);

  ::grpc::Status Seal(::grpc::ServerContext* ctx,
                      const sealer::v1::SealRequest* req,
                      sealer::v1::SealResponse* resp) override;

  ::grpc::Status Download(::grpc::ServerContext* ctx,
                          const sealer::v1::DownloadRequest* req,
                          sealer::v1::DownloadResponse* resp) override;

  ::grpc::Status ListSealedExports(::grpc::ServerContext* ctx,
                                   const sealer::v1::ListSealedExportsRequest* req,
                                   sealer::v1::ListSealedExportsResponse* resp) override;

  ::grpc::Status Verify(::grpc::ServerContext* ctx,
                        const sealer::v1::VerifyRequest* req,
                        sealer::v1::VerificationResult* resp) override;

  ::grpc::Status VerifyArchive(::grpc::ServerContext* ctx,
                               const sealer::v1::VerifyArchiveRequest* req,
                               sealer::v1::VerificationResult* resp) override;

  ::grpc::Status VerifyChain(::grpc::ServerContext* ctx,
                             const sealer::v1::VerifyChainRequest* req,
                             sealer::v1::VerifyChainResponse* resp) override;

private:
  std::shared_ptr<sealer::service::SealedExportService> service_;
};

}
