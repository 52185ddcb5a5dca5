#include "storage_factory.hpp"

#include "common/arrow_utils.hpp"
#include "object/object_archive_store.hpp"
#include "ram/ram_archive_store.hpp"

namespace sealer::storage {

ArchiveStorePtr StorageFactory::Build(const sealer::runtime::config::StorageConfig& cfg) {
  if (cfg.filesystem() == sealer::runtime::config::FILE_SYSTEM_MEMORY) {
    return std::make_shared<RamArchiveStore>();
  }

  auto [fs, root] = common::Unwrap(common::ResolveFileSystem(cfg));
  return std::make_shared<ObjectArchiveStore>(std::move(fs), std::move(root));
}

} // namespace sealer::storage
