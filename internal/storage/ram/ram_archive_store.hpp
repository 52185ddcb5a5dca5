#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include "internal/storage/archive_store.hpp"

namespace sealer::storage {

/*
  In-memory archive store.

  Buffers are kept as-is; Get returns the stored buffer without copying.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamArchiveStore final : public ArchiveStore {
public:
  RamArchiveStore() = default;
  ~RamArchiveStore() override = default;

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, const ObjectMetadata& metadata) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;

  std::optional<ObjectInfo> Stat(const std::string& key) override;

  void Remove(const std::string& key) override;

  std::size_t Size() const;

private:
  struct Entry {
    std::shared_ptr<arrow::Buffer> buffer;
    ObjectMetadata metadata;
  };

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Entry> objects_;
};

} // namespace sealer::storage
