#pragma once

#include "archive_store.hpp"
#include "config/config.pb.h"

namespace sealer::storage {

/*
  Builds the archive store from configuration.

      auto store = StorageFactory::Build(config.storage());
      store->Put(key, buffer, metadata);
*/

class StorageFactory {
public:
  static ArchiveStorePtr Build(const sealer::runtime::config::StorageConfig& cfg);
};

} // namespace sealer::storage
