#include "manifest_builder.hpp"

#include "internal/util/errors.hpp"

namespace sealer::manifest {

std::string VerifyUrl(const std::string& verify_base_url, const std::string& bundle_id) {
  std::string base = verify_base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/api/v1/verify/" + bundle_id;
}

ExportManifest BuildManifest(const ManifestParams& params, util::TimePoint generated_at) {
  if (params.files.empty()) {
    throw util::InvalidArgument("a manifest must list at least one file");
  }

  ExportManifest m;
  m.version             = kManifestVersion;
  m.bundle_id           = params.bundle_id;
  m.generated_at        = util::ToIso8601(generated_at);
  m.generated_by        = params.generated_by;
  m.tenant_id           = params.tenant_id;
  m.export_type         = params.export_type;
  m.source_id           = params.source_id;
  m.signature_algorithm = kSignatureAlgorithm;
  m.signing_key_id      = params.signing_key_id;
  m.verify_url          = VerifyUrl(params.verify_base_url, params.bundle_id);
  m.prev_bundle_hash    = params.prev_bundle_hash;
  m.files               = params.files;
  return m;
}

ExportManifest BuildManifest(const ManifestParams& params) {
  return BuildManifest(params, util::Now());
}

} // namespace sealer::manifest
