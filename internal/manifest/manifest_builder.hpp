#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "manifest.hpp"

namespace sealer::manifest {

struct ManifestParams {
  std::string                    bundle_id;
  std::string                    tenant_id;
  ExportType                     export_type = ExportType::kInspectionReport;
  std::optional<std::string>     source_id;
  GeneratedBy                    generated_by;
  std::string                    signing_key_id;
  std::optional<std::string>     prev_bundle_hash;
  std::vector<ManifestFileEntry> files;
  std::string                    verify_base_url;
};

// "{base}/api/v1/verify/{bundle_id}", with any trailing '/' on base dropped.
std::string VerifyUrl(const std::string& verify_base_url, const std::string& bundle_id);

// Pure assembly; touches no storage. Throws util::InvalidArgument on an empty file list.
ExportManifest BuildManifest(const ManifestParams& params, util::TimePoint generated_at);
ExportManifest BuildManifest(const ManifestParams& params);

} // namespace sealer::manifest
