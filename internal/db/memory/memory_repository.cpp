#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace sealer::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertSealedExport(Transaction& t, const model::SealedExportRecord& r) {
  if (TX(t).View().exports.contains(r.bundle_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "bundle_id already recorded: " + r.bundle_id);
  }

  auto chain_it = TX(t).View().chains.find(r.tenant_id);
  if (chain_it != TX(t).View().chains.end()) {
    const auto& chain = chain_it->second;
    if (chain.contains(r.chain_seq)) {
      return Result::Err(ErrorCode::ConstraintViolation, "chain_seq already taken for tenant " + r.tenant_id);
    }
    for (const auto& [_, bundle_id] : chain) {
      if (TX(t).View().exports.at(bundle_id).prev_bundle_hash == r.prev_bundle_hash) {
        return Result::Err(ErrorCode::ConstraintViolation, "predecessor already claimed for tenant " + r.tenant_id);
      }
    }
  }

  auto& s = TX(t).Mutable();
  s.exports[r.bundle_id]                = r;
  s.chains[r.tenant_id][r.chain_seq] = r.bundle_id;
  return Result::Ok();
}

std::optional<model::SealedExportRecord> MemoryRepository::GetSealedExport(Transaction& t, const std::string& bundle_id) {
  const auto& s  = TX(t).View();
  auto        it = s.exports.find(bundle_id);
  if (it == s.exports.end()) return std::nullopt;
  return it->second;
}

std::optional<model::SealedExportRecord> MemoryRepository::GetLatestSealedExport(Transaction& t, const std::string& tenant_id) {
  const auto& s  = TX(t).View();
  auto        it = s.chains.find(tenant_id);
  if (it == s.chains.end() || it->second.empty()) return std::nullopt;
  return s.exports.at(it->second.rbegin()->second);
}

std::optional<model::SealedExportRecord> MemoryRepository::GetSealedExportAt(Transaction& t, const std::string& tenant_id,
                                                                             uint64_t chain_seq) {
  const auto& s  = TX(t).View();
  auto        it = s.chains.find(tenant_id);
  if (it == s.chains.end()) return std::nullopt;
  auto seq_it = it->second.find(chain_seq);
  if (seq_it == it->second.end()) return std::nullopt;
  return s.exports.at(seq_it->second);
}

std::vector<model::SealedExportRecord> MemoryRepository::ListSealedExports(Transaction& t, const model::SealedExportFilter& filter) {
  const auto&                            s = TX(t).View();
  std::vector<model::SealedExportRecord> out;

  auto it = s.chains.find(filter.tenant_id);
  if (it == s.chains.end()) return out;

  uint64_t skipped = 0;
  for (auto seq_it = it->second.rbegin(); seq_it != it->second.rend() && out.size() < filter.limit; ++seq_it) {
    const auto& record = s.exports.at(seq_it->second);
    if (filter.export_type && record.export_type != *filter.export_type) continue;
    if (skipped < filter.offset) {
      ++skipped;
      continue;
    }
    out.push_back(record);
  }
  return out;
}

std::vector<model::SealedExportRecord> MemoryRepository::ListChain(Transaction& t, const std::string& tenant_id) {
  const auto&                            s = TX(t).View();
  std::vector<model::SealedExportRecord> out;

  auto it = s.chains.find(tenant_id);
  if (it == s.chains.end()) return out;

  out.reserve(it->second.size());
  for (const auto& [_, bundle_id] : it->second) {
    out.push_back(s.exports.at(bundle_id));
  }
  return out;
}

} // namespace sealer::db::memory
