#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace sealer::storage {

using ObjectMetadata = std::map<std::string, std::string>;

struct ObjectInfo {
  uint64_t       size_bytes = 0;
  ObjectMetadata metadata;
};

/*
  Sealed archive object store.

  Archives are opaque Arrow buffers addressed by a storage key of the form
  "{prefix}/{tenant_id}/{bundle_id}.zip". Keys are written once.

  Implementations:
    RAM     → in-process map, for tests and dry runs
    OBJECT  → Arrow filesystem (local disk, S3 / MinIO)

  Errors:
    Get on a missing key throws util::NotFound.
    Backend failures throw std::runtime_error.
*/

class ArchiveStore {
 public:
  virtual ~ArchiveStore() = default;

  // ------------------------------------------------------------------
  // Put
  // ------------------------------------------------------------------
  /*
    Store the full archive under key. A reader never observes a partial
    object: either the previous state or the complete buffer.

    Metadata is attached where the backend supports it.
  */
  virtual void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, const ObjectMetadata& metadata) = 0;

  // ------------------------------------------------------------------
  // Get
  // ------------------------------------------------------------------
  virtual std::shared_ptr<arrow::Buffer> Get(const std::string& key) = 0;

  // ------------------------------------------------------------------
  // Stat
  // ------------------------------------------------------------------
  virtual std::optional<ObjectInfo> Stat(const std::string& key) = 0;

  // ------------------------------------------------------------------
  // Remove
  // ------------------------------------------------------------------
  /*
    Only used to clean up an archive whose ledger row lost a chain race.
    Removing a missing key is not an error.
  */
  virtual void Remove(const std::string& key) = 0;
};

using ArchiveStorePtr = std::shared_ptr<ArchiveStore>;

} // namespace sealer::storage
