#pragma once

#include <memory>
#include <string>

#include <arrow/filesystem/filesystem.h>
#include <arrow/buffer.h>

#include "internal/storage/archive_store.hpp"

namespace sealer::storage {

/*
  Archive store over an Arrow filesystem (local disk, S3 / MinIO).

  Characteristics:
    - whole-object writes
    - local writes go to a temporary file and are renamed into place
    - object stores are atomic per PUT
*/

class ObjectArchiveStore final : public ArchiveStore {
public:
  ObjectArchiveStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, const ObjectMetadata& metadata) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;

  std::optional<ObjectInfo> Stat(const std::string& key) override;

  void Remove(const std::string& key) override;

private:
  std::string ObjectPath(const std::string& key) const;
  bool IsLocal() const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string root_path_;
};

}
