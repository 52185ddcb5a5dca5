#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

#include <vector>

namespace sealer::storage::common {

namespace config = sealer::runtime::config;

std::shared_ptr<const arrow::KeyValueMetadata> ToKeyValueMetadata(const ObjectMetadata& metadata) {
  if (metadata.empty()) {
    return {};
  }
  std::vector<std::string> keys;
  std::vector<std::string> values;
  keys.reserve(metadata.size());
  values.reserve(metadata.size());
  for (const auto& [key, value] : metadata) {
    keys.push_back(key);
    values.push_back(value);
  }
  return arrow::KeyValueMetadata::Make(std::move(keys), std::move(values));
}

ObjectMetadata FromKeyValueMetadata(const std::shared_ptr<const arrow::KeyValueMetadata>& metadata) {
  ObjectMetadata out;
  if (!metadata) {
    return out;
  }
  for (int64_t i = 0; i < metadata->size(); ++i) {
    out.emplace(metadata->key(i), metadata->value(i));
  }
  return out;
}

namespace {

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveS3(const config::StorageConfig& cfg) {
  ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());

  std::string resolved_path;
  ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::S3Options::FromUri(cfg.root_path(), &resolved_path));

  const auto& s3 = cfg.s3();
  if (!s3.region().empty()) options.region = s3.region();
  if (!s3.endpoint_override().empty()) options.endpoint_override = s3.endpoint_override();
  if (!s3.scheme().empty()) options.scheme = s3.scheme();
  if (s3.connect_timeout_s() > 0) options.connect_timeout = s3.connect_timeout_s();
  if (s3.request_timeout_s() > 0) options.request_timeout = s3.request_timeout_s();
  options.allow_bucket_creation = s3.allow_bucket_creation();
  if (!s3.access_key().empty()) {
    options.ConfigureAccessKey(s3.access_key(), s3.secret_key(), s3.session_token());
  }

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
  return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const config::StorageConfig& cfg) {
  std::string resolved_path = cfg.root_path();

  switch (cfg.filesystem()) {
    case config::FILE_SYSTEM_LOCAL:
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()), resolved_path);
    case config::FILE_SYSTEM_S3:
      return ResolveS3(cfg);
    case config::FILE_SYSTEM_MEMORY:
      return arrow::Status::Invalid("memory storage has no Arrow filesystem");
    case config::FILE_SYSTEM_UNSPECIFIED:
    default: {
      if (resolved_path.rfind("s3://", 0) == 0) {
        return ResolveS3(cfg);
      }
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(resolved_path, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }
  }
}

void FinalizeFileSystems() {
  if (arrow::fs::IsS3Initialized()) {
    Unwrap(arrow::fs::FinalizeS3());
  }
}

} // namespace sealer::storage::common
