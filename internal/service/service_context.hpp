#pragma once

#include <memory>

namespace sealer::core {
class BundleSealer;
class BundleVerifier;
}
namespace sealer::db { class Repository; }
namespace sealer::storage { class ArchiveStore; }

namespace sealer::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<sealer::core::BundleSealer> sealer;
  std::shared_ptr<sealer::core::BundleVerifier> verifier;
  std::shared_ptr<sealer::db::Repository> repository;
  std::shared_ptr<sealer::storage::ArchiveStore> store;
};

}
