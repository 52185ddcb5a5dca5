#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "export_type.hpp"

namespace sealer::manifest {

/*
  Signed bundle description.

  Field names mirror the JSON wire shape one to one. An ExportManifest is
  assembled once by BuildManifest, canonicalized, hashed and signed; it is
  never edited afterwards.
*/

inline constexpr int64_t     kManifestVersion    = 1;
inline constexpr const char* kSignatureAlgorithm = "HMAC-SHA256";
inline constexpr const char* kManifestFileName   = "manifest.json";
inline constexpr const char* kSignatureFileName  = "manifest.sig";

// A file handed in for sealing. Bytes are held as a std::string like protobuf bytes fields.
struct BundleFile {
  std::string path;
  std::string data;
  std::string content_type;
};

struct ManifestFileEntry {
  std::string path;
  std::string sha256;
  uint64_t    bytes = 0;
  std::string content_type;

  bool operator==(const ManifestFileEntry&) const = default;
};

struct GeneratedBy {
  std::string user_id;
  std::string display_name;

  bool operator==(const GeneratedBy&) const = default;
};

struct ExportManifest {
  int64_t                    version = kManifestVersion;
  std::string                bundle_id;
  std::string                generated_at;
  GeneratedBy                generated_by;
  std::string                tenant_id;
  ExportType                 export_type = ExportType::kInspectionReport;
  std::optional<std::string> source_id;
  std::string                signature_algorithm = kSignatureAlgorithm;
  std::string                signing_key_id;
  std::string                verify_url;
  std::optional<std::string> prev_bundle_hash;
  std::vector<ManifestFileEntry> files;

  bool operator==(const ExportManifest&) const = default;
};

} // namespace sealer::manifest
