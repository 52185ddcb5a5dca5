#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/core/bundle_sealer.hpp"
#include "internal/core/bundle_verifier.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/sealed_export_service.hpp"
#include "internal/storage/archive_store.hpp"

namespace sealer::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>       repository;
  storage::ArchiveStorePtr              store;
  std::shared_ptr<const crypto::KeyRing> keys;

  std::shared_ptr<core::BundleSealer>   sealer;
  std::shared_ptr<core::BundleVerifier> verifier;

  std::shared_ptr<service::SealedExportService> sealed_export_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend from runtime config.

  This is the composition root of the application and the only place
  that knows concrete DB and storage types.
*/
std::shared_ptr<db::Repository> BuildRepository(const sealer::runtime::config::RuntimeConfig& config);

Application Build(const sealer::runtime::config::RuntimeConfig& config);

} // namespace sealer::factory
