#pragma once

#include "service_context.hpp"
#include "sealer/v1.hpp"

namespace sealer::service {

inline constexpr uint32_t kDefaultListLimit = 50;
inline constexpr uint32_t kMaxListLimit     = 100;

/*
  RPC-shaped facade over the sealer, the verifier and the ledger.

  Converts wire messages to core types and back; every call is traced
  and counted. Domain errors propagate as util exceptions.
*/
class SealedExportService {
public:
  explicit SealedExportService(ServiceContext ctx);

  sealer::v1::SealResponse Seal(const sealer::v1::SealRequest& req);

  sealer::v1::DownloadResponse Download(const sealer::v1::DownloadRequest& req);

  sealer::v1::ListSealedExportsResponse ListSealedExports(const sealer::v1::ListSealedExportsRequest& req);

  sealer::v1::VerificationResult Verify(const sealer::v1::VerifyRequest& req);

  sealer::v1::VerificationResult VerifyArchive(const sealer::v1::VerifyArchiveRequest& req);

  sealer::v1::VerifyChainResponse VerifyChain(const sealer::v1::VerifyChainRequest& req);

private:
  ServiceContext ctx_;
};

}
