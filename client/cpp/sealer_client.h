#pragma once

#include <arrow/buffer.h>
#include <arrow/result.h>
#include <grpcpp/channel.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sealer/v1.hpp"

namespace sealer::client {

/*
  Typed client for SealedExportService.

  gRPC failures come back as arrow::Status: NOT_FOUND as KeyError,
  INVALID_ARGUMENT and FAILED_PRECONDITION as Invalid, everything else
  as IOError carrying the server message.
*/
class SealerClient {
 public:
  struct SealedArchive {
    sealer::v1::SealedExport       sealed_export;
    std::shared_ptr<arrow::Buffer> archive;
  };

  explicit SealerClient(std::shared_ptr<grpc::Channel> channel);

  arrow::Result<SealedArchive> Seal(const sealer::v1::SealRequest& request) const;

  arrow::Result<SealedArchive> Download(const std::string& bundle_id) const;

  arrow::Result<std::vector<sealer::v1::SealedExport>> List(const std::string& tenant_id,
                                                            sealer::v1::ExportType export_type = sealer::v1::EXPORT_TYPE_UNSPECIFIED,
                                                            uint32_t limit = 0, uint32_t offset = 0) const;

  arrow::Result<sealer::v1::VerificationResult> Verify(const std::string& bundle_id) const;

  arrow::Result<sealer::v1::VerificationResult> VerifyArchive(const std::shared_ptr<arrow::Buffer>& archive) const;

  arrow::Result<sealer::v1::VerifyChainResponse> VerifyChain(const std::string& tenant_id, bool verify_archives) const;

 private:
  std::unique_ptr<sealer::v1::SealedExportService::Stub> stub_;
};

// Insecure channel with the message size limits sealed archives need.
std::shared_ptr<grpc::Channel> CreateSealerChannel(const std::string& address);

} // namespace sealer::client
