#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/util/key_value_metadata.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/storage/archive_store.hpp"

namespace sealer::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

std::shared_ptr<const arrow::KeyValueMetadata> ToKeyValueMetadata(const ObjectMetadata& metadata);
ObjectMetadata                                 FromKeyValueMetadata(const std::shared_ptr<const arrow::KeyValueMetadata>& metadata);

/*
  Resolve the archive filesystem and the root path inside it.

  FILE_SYSTEM_LOCAL        plain directory
  FILE_SYSTEM_S3           s3://bucket/prefix, S3Options from config
  FILE_SYSTEM_UNSPECIFIED  inferred from the URI scheme, or a local path
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const sealer::runtime::config::StorageConfig& config);

// Release process-wide filesystem state (S3 SDK) at shutdown.
void FinalizeFileSystems();

} // namespace sealer::storage::common
