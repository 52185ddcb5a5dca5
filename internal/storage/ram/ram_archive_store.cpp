#include "ram_archive_store.hpp"

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace sealer::storage {

void RamArchiveStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, const ObjectMetadata& metadata) {
  common::ValidateStorageKey(key);
  std::unique_lock lock(mutex_);
  objects_[key] = Entry{buffer, metadata};
}

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamArchiveStore::Get(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = objects_.find(key);
  if (it == objects_.end()) throw util::NotFound("archive not found: " + key);

  return it->second.buffer;
}

std::optional<ObjectInfo> RamArchiveStore::Stat(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = objects_.find(key);
  if (it == objects_.end()) return std::nullopt;

  return ObjectInfo{static_cast<uint64_t>(it->second.buffer->size()), it->second.metadata};
}

void RamArchiveStore::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);
  objects_.erase(key);
}

std::size_t RamArchiveStore::Size() const {
  std::shared_lock lock(mutex_);
  return objects_.size();
}

} // namespace sealer::storage
