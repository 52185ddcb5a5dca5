#include "bundle_sealer.hpp"

#include <algorithm>
#include <thread>
#include <unordered_set>

#include "config/config.pb.h"
#include "internal/archive/zip_archive.hpp"
#include "internal/crypto/content_hasher.hpp"
#include "internal/crypto/signer.hpp"
#include "internal/manifest/manifest_builder.hpp"
#include "internal/manifest/manifest_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace sealer::core {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kMaxSourceIdLength = 256;
constexpr std::size_t kMaxUserIdLength   = 256;

bool HasControlCharacter(std::string_view s) {
  return std::any_of(s.begin(), s.end(), [](char c) { return static_cast<unsigned char>(c) < 0x20 || c == 0x7f; });
}

} // namespace

SealerOptions SealerOptions::FromConfig(const sealer::runtime::config::RuntimeConfig& config) {
  SealerOptions options;
  const auto&   sealing = config.sealing();
  const auto&   storage = config.storage();

  options.verify_base_url = sealing.verify_base_url();
  if (!storage.key_prefix().empty()) options.key_prefix = storage.key_prefix();
  if (sealing.max_chain_conflict_retries() > 0) options.max_chain_conflict_retries = sealing.max_chain_conflict_retries();
  if (sealing.hash_workers() > 0) options.hash_workers = sealing.hash_workers();
  if (sealing.max_bundle_bytes() > 0) options.max_bundle_bytes = sealing.max_bundle_bytes();

  const auto& retry = storage.upload_retry();
  if (retry.max_attempts() > 0) options.upload_max_attempts = retry.max_attempts();
  if (retry.initial_backoff_ms() > 0) options.upload_initial_backoff = std::chrono::milliseconds(retry.initial_backoff_ms());
  if (retry.max_backoff_ms() > 0) options.upload_max_backoff = std::chrono::milliseconds(retry.max_backoff_ms());
  return options;
}

BundleSealer::BundleSealer(std::shared_ptr<db::Repository> repository, storage::ArchiveStorePtr store,
                           std::shared_ptr<const crypto::KeyRing> keys, SealerOptions options)
    : repository_(std::move(repository)), store_(std::move(store)), keys_(std::move(keys)), options_(std::move(options)) {
  if (!repository_ || !store_ || !keys_) {
    throw std::invalid_argument("bundle sealer requires a repository, an archive store and a key ring");
  }
}

BundleSealer::TenantLock::TenantLock(BundleSealer& sealer, const std::string& tenant_id) : sealer_(sealer), tenant_id_(tenant_id) {
  {
    std::lock_guard<std::mutex> guard(sealer_.tenant_mutexes_guard_);
    auto&                       slot = sealer_.tenant_mutexes_[tenant_id_];
    if (!slot) {
      slot = std::make_shared<std::mutex>();
    }
    mutex_ = slot;
  }
  lock_ = std::unique_lock<std::mutex>(*mutex_);
}

BundleSealer::TenantLock::~TenantLock() {
  lock_.unlock();
  std::lock_guard<std::mutex> guard(sealer_.tenant_mutexes_guard_);
  mutex_.reset();
  // Copies are only handed out under the guard, so a lone map reference means nobody is waiting.
  auto it = sealer_.tenant_mutexes_.find(tenant_id_);
  if (it != sealer_.tenant_mutexes_.end() && it->second.use_count() == 1) {
    sealer_.tenant_mutexes_.erase(it);
  }
}

size_t BundleSealer::ActiveTenantCount() const {
  std::lock_guard<std::mutex> guard(tenant_mutexes_guard_);
  return tenant_mutexes_.size();
}

void BundleSealer::ValidateRequest(const SealRequest& request) const {
  if (!storage::common::IsValidTenantId(request.tenant_id)) {
    throw util::InvalidArgument("seal: tenant id must be 1-128 characters of [A-Za-z0-9._-]");
  }
  if (request.source_id) {
    if (request.source_id->empty() || request.source_id->size() > kMaxSourceIdLength || HasControlCharacter(*request.source_id)) {
      throw util::InvalidArgument("seal: source id must be 1-256 printable characters when present");
    }
  }
  if (request.generated_by.user_id.empty() || request.generated_by.user_id.size() > kMaxUserIdLength) {
    throw util::InvalidArgument("seal: generated_by.user_id is required");
  }
  if (request.files.empty()) {
    throw util::InvalidArgument("seal: at least one file is required");
  }

  std::unordered_set<std::string_view> seen;
  uint64_t                             total = 0;
  for (const auto& file : request.files) {
    if (auto problem = archive::CheckEntryPath(file.path)) {
      throw util::InvalidArgument("seal: file path '" + file.path + "': " + *problem);
    }
    if (!seen.insert(file.path).second) {
      throw util::InvalidArgument("seal: duplicate file path '" + file.path + "'");
    }
    if (file.content_type.empty()) {
      throw util::InvalidArgument("seal: file '" + file.path + "' has no content type");
    }
    total += file.data.size();
  }
  if (total > options_.max_bundle_bytes) {
    throw util::InvalidArgument("seal: files exceed the maximum bundle size");
  }
}

void BundleSealer::Upload(const std::string& storage_key, const std::shared_ptr<arrow::Buffer>& archive,
                          const storage::ObjectMetadata& metadata) {
  auto     backoff  = options_.upload_initial_backoff;
  uint32_t attempts = 0;

  while (true) {
    ++attempts;
    try {
      store_->Put(storage_key, archive, metadata);
      observability::Metrics::Instance().ObserveUploadAttempts(attempts);
      return;
    } catch (const std::invalid_argument&) {
      throw;
    } catch (const std::exception& e) {
      if (attempts >= options_.upload_max_attempts) {
        observability::Metrics::Instance().ObserveUploadAttempts(attempts);
        throw util::StorageError("seal: archive upload failed after " + std::to_string(attempts) + " attempts: " + e.what());
      }
      SEALER_LOG_WARN("archive upload failed; retrying", {StringField("storage_key", storage_key), IntField("attempt", attempts),
                                                          IntField("backoff_ms", backoff.count()), StringField("error", e.what())});
    }

    std::this_thread::sleep_for(backoff);
    backoff = std::min(backoff * 2, options_.upload_max_backoff);
  }
}

void BundleSealer::DiscardArchive(const std::string& storage_key, const std::string& bundle_id, const std::string& tenant_id) {
  try {
    store_->Remove(storage_key);
  } catch (const std::exception& e) {
    SEALER_LOG_WARN("orphaned archive left in storage", {StringField("bundle_id", bundle_id), StringField("tenant_id", tenant_id),
                                                         StringField("storage_key", storage_key), StringField("error", e.what())});
  }
}

SealedBundle BundleSealer::Seal(const SealRequest& request) {
  observability::SpanScope span("BundleSealer/Seal");
  span.SetAttribute("tenant_id", request.tenant_id);
  span.SetAttribute("export_type", manifest::ToString(request.export_type));

  ValidateRequest(request);
  const auto signing_key = keys_->ActiveKey();

  // Every digest is known before the chain head is read.
  const auto entries = crypto::HashFiles(request.files, options_.hash_workers);
  span.AddEvent("files_hashed");

  TenantLock tenant_lock(*this, request.tenant_id);

  const uint32_t max_attempts = options_.max_chain_conflict_retries + 1;
  for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    std::optional<db::model::SealedExportRecord> head;
    {
      auto tx = repository_->Begin();
      head    = repository_->GetLatestSealedExport(*tx, request.tenant_id);
      tx->Commit();
    }

    manifest::ManifestParams params;
    params.bundle_id        = util::ToString(util::GenerateUUID());
    params.tenant_id        = request.tenant_id;
    params.export_type      = request.export_type;
    params.source_id        = request.source_id;
    params.generated_by     = request.generated_by;
    params.signing_key_id   = signing_key.id;
    params.prev_bundle_hash = head ? std::optional<std::string>(head->manifest_sha256) : std::nullopt;
    params.files            = entries;
    params.verify_base_url  = options_.verify_base_url;

    const auto now             = util::Now();
    auto       sealed_manifest = manifest::BuildManifest(params, now);
    const auto manifest_json   = manifest::CanonicalManifestJson(sealed_manifest);
    const auto manifest_sha256 = crypto::Sha256Hex(manifest_json);
    const auto manifest_sig    = crypto::Sign(manifest_json, signing_key.material);

    auto archive_bytes = archive::BuildArchive(request.files, manifest_json, manifest_sig, now);
    if (archive_bytes.size() > options_.max_bundle_bytes) {
      throw util::InvalidArgument("seal: archive exceeds the maximum bundle size");
    }
    const auto total_bytes = static_cast<uint64_t>(archive_bytes.size());
    auto       archive     = arrow::Buffer::FromString(std::move(archive_bytes));

    const auto storage_key = storage::common::StorageKey(options_.key_prefix, request.tenant_id, params.bundle_id);
    Upload(storage_key, archive,
           {{"content-type", "application/zip"},
            {"bundle-id", params.bundle_id},
            {"export-type", std::string(manifest::ToString(request.export_type))},
            {"tenant-id", request.tenant_id}});
    span.AddEvent("archive_stored");

    db::model::SealedExportRecord record;
    record.bundle_id        = params.bundle_id;
    record.tenant_id        = request.tenant_id;
    record.export_type      = manifest::ToString(request.export_type);
    record.source_id        = request.source_id;
    record.file_count       = request.files.size();
    record.total_bytes      = total_bytes;
    record.storage_key      = storage_key;
    record.manifest_sha256  = manifest_sha256;
    record.manifest_sig     = manifest_sig;
    record.signing_key_id   = signing_key.id;
    record.prev_bundle_hash = params.prev_bundle_hash;
    record.generated_by     = request.generated_by.user_id;
    record.generated_at     = sealed_manifest.generated_at;
    record.created_at_ms    = util::ToUnixMillis(now);
    record.chain_seq        = head ? head->chain_seq + 1 : 1;

    db::Result insert;
    try {
      auto tx = repository_->Begin();
      insert  = repository_->InsertSealedExport(*tx, record);
      if (insert) {
        tx->Commit();
      }
    } catch (const util::Conflict& e) {
      insert = db::Result::Err(db::ErrorCode::Conflict, e.what());
    } catch (const std::exception& e) {
      insert = db::Result::Err(db::ErrorCode::InternalError, e.what());
    }

    if (insert) {
      span.SetAttribute("bundle_id", record.bundle_id);
      span.SetAttribute("chain_seq", static_cast<int64_t>(record.chain_seq));
      SEALER_LOG_INFO("bundle sealed", {StringField("bundle_id", record.bundle_id), StringField("tenant_id", record.tenant_id),
                                        StringField("export_type", record.export_type), StringField("storage_key", storage_key),
                                        IntField("chain_seq", static_cast<int64_t>(record.chain_seq)),
                                        IntField("file_count", static_cast<int64_t>(record.file_count)),
                                        IntField("total_bytes", static_cast<int64_t>(record.total_bytes))});
      return SealedBundle{std::move(record), std::move(sealed_manifest)};
    }

    if (!db::IsRetryable(insert.code)) {
      SEALER_LOG_ERROR("ledger insert failed; archive orphaned", {StringField("bundle_id", record.bundle_id),
                                                                  StringField("tenant_id", record.tenant_id),
                                                                  StringField("storage_key", storage_key),
                                                                  StringField("error_code", db::ToString(insert.code)),
                                                                  StringField("error", insert.message)});
      span.RecordException(insert.message);
      throw util::PersistenceError("seal: ledger insert failed: " + insert.message, storage_key);
    }

    observability::Metrics::Instance().RecordChainConflict();
    SEALER_LOG_WARN("chain head moved during seal; resealing", {StringField("bundle_id", record.bundle_id),
                                                               StringField("tenant_id", record.tenant_id),
                                                               StringField("storage_key", storage_key), IntField("attempt", attempt),
                                                               StringField("error", insert.message)});
    DiscardArchive(storage_key, record.bundle_id, record.tenant_id);
  }

  span.RecordException("chain conflict retries exhausted");
  throw util::ChainConflict("seal: tenant chain kept advancing; gave up after " + std::to_string(max_attempts) + " attempts");
}

} // namespace sealer::core
