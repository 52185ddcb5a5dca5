#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace sealer::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSealedExport(Transaction&, const model::SealedExportRecord&) override;
  std::optional<model::SealedExportRecord> GetSealedExport(Transaction&, const std::string&) override;
  std::optional<model::SealedExportRecord> GetLatestSealedExport(Transaction&, const std::string&) override;
  std::optional<model::SealedExportRecord> GetSealedExportAt(Transaction&, const std::string&, uint64_t) override;
  std::vector<model::SealedExportRecord> ListSealedExports(Transaction&, const model::SealedExportFilter&) override;
  std::vector<model::SealedExportRecord> ListChain(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::SealedExportRecord> exports;
    // tenant -> chain_seq -> bundle_id
    std::unordered_map<std::string, std::map<uint64_t, std::string>> chains;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
