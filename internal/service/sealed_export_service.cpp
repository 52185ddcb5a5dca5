#include "sealed_export_service.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <type_traits>

#include "internal/core/bundle_sealer.hpp"
#include "internal/core/bundle_verifier.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/manifest/manifest_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/archive_store.hpp"
#include "internal/util/errors.hpp"

namespace sealer::service {

using namespace sealer::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_key, std::string_view subject, Fn&& fn) {
  sealer::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute(subject_key, subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    sealer::observability::Metrics::Instance().RecordRequest(route, success);
    sealer::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    auto result = fn();
    finish(true);
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SEALER_LOG_ERROR("RPC failed", {sealer::observability::StringField("route", route), sealer::observability::StringField("error", ex.what()),
                                    sealer::observability::StringField(subject_key, subject)});
    finish(false);
    throw;
  }
}

// Wire and core enums share numbering.
manifest::ExportType FromProto(ExportType type) {
  switch (type) {
    case EXPORT_TYPE_INSPECTION_REPORT:
      return manifest::ExportType::kInspectionReport;
    case EXPORT_TYPE_PDF_REPORT:
      return manifest::ExportType::kPdfReport;
    case EXPORT_TYPE_DEFECT_EXPORT:
      return manifest::ExportType::kDefectExport;
    case EXPORT_TYPE_CLAIMS_PACK:
      return manifest::ExportType::kClaimsPack;
    default:
      throw util::InvalidArgument("export_type is required and must be a registered export type");
  }
}

ExportType ToProto(std::string_view export_type) {
  const auto parsed = manifest::ParseExportType(export_type);
  return parsed ? static_cast<ExportType>(*parsed) : EXPORT_TYPE_UNSPECIFIED;
}

VerificationReason ToProto(core::VerificationReason reason) {
  switch (reason) {
    case core::VerificationReason::kValid:
      return VERIFICATION_REASON_VALID;
    case core::VerificationReason::kMalformedArchive:
      return VERIFICATION_REASON_MALFORMED_ARCHIVE;
    case core::VerificationReason::kFileMissing:
      return VERIFICATION_REASON_FILE_MISSING;
    case core::VerificationReason::kUndeclaredFile:
      return VERIFICATION_REASON_UNDECLARED_FILE;
    case core::VerificationReason::kFileHashMismatch:
      return VERIFICATION_REASON_FILE_HASH_MISMATCH;
    case core::VerificationReason::kUnknownKey:
      return VERIFICATION_REASON_UNKNOWN_KEY;
    case core::VerificationReason::kSignatureInvalid:
      return VERIFICATION_REASON_SIGNATURE_INVALID;
    case core::VerificationReason::kChainMismatch:
      return VERIFICATION_REASON_CHAIN_MISMATCH;
    case core::VerificationReason::kBundleNotFound:
      return VERIFICATION_REASON_BUNDLE_NOT_FOUND;
    case core::VerificationReason::kSourceUnavailable:
      return VERIFICATION_REASON_SOURCE_UNAVAILABLE;
  }
  return VERIFICATION_REASON_UNSPECIFIED;
}

SealedExport ToProto(const db::model::SealedExportRecord& r, const std::string& verify_base_url) {
  SealedExport out;
  out.set_bundle_id(r.bundle_id);
  out.set_tenant_id(r.tenant_id);
  out.set_export_type(ToProto(r.export_type));
  if (r.source_id) out.set_source_id(*r.source_id);
  out.set_file_count(r.file_count);
  out.set_total_bytes(r.total_bytes);
  out.set_storage_key(r.storage_key);
  out.set_manifest_sha256(r.manifest_sha256);
  out.set_manifest_sig(r.manifest_sig);
  out.set_signing_key_id(r.signing_key_id);
  if (r.prev_bundle_hash) out.set_prev_bundle_hash(*r.prev_bundle_hash);
  out.set_generated_by(r.generated_by);
  out.set_generated_at(r.generated_at);
  out.set_created_at_ms(r.created_at_ms);
  out.set_chain_seq(r.chain_seq);
  out.set_verify_url(manifest::VerifyUrl(verify_base_url, r.bundle_id));
  return out;
}

sealer::v1::VerificationResult ToProto(const core::VerificationResult& r) {
  sealer::v1::VerificationResult out;
  out.set_valid(r.valid);
  out.set_reason(ToProto(r.reason));
  out.set_detail(r.detail);
  out.set_bundle_id(r.bundle_id);
  out.set_tenant_id(r.tenant_id);
  out.set_export_type(ToProto(r.export_type));
  out.set_generated_at(r.generated_at);
  out.set_file_count(r.file_count);
  out.set_signature_algorithm(r.signature_algorithm);
  out.set_signing_key_id(r.signing_key_id);
  out.set_manifest_sha256(r.manifest_sha256);
  if (r.prev_bundle_hash) out.set_prev_bundle_hash(*r.prev_bundle_hash);
  out.set_chain_checked(r.chain_checked);
  out.set_chain_seq(r.chain_seq.value_or(0));
  return out;
}

std::string BufferToString(const std::shared_ptr<arrow::Buffer>& buffer) {
  return buffer->ToString();
}

} // namespace

SealedExportService::SealedExportService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.sealer || !ctx_.verifier || !ctx_.repository || !ctx_.store) {
    throw std::invalid_argument("sealed export service: incomplete service context");
  }
}

SealResponse SealedExportService::Seal(const SealRequest& req) {
  return ObserveRpc("SealedExportService.Seal", "tenant_id", req.tenant_id(), [&] {
    core::SealRequest request;
    request.tenant_id   = req.tenant_id();
    request.export_type = FromProto(req.export_type());
    if (req.has_source_id()) request.source_id = req.source_id();
    request.generated_by.user_id      = req.generated_by().user_id();
    request.generated_by.display_name = req.generated_by().display_name();
    request.files.reserve(static_cast<size_t>(req.files_size()));
    for (const auto& file : req.files()) {
      request.files.push_back({file.path(), file.data(), file.content_type()});
    }

    auto sealed = ctx_.sealer->Seal(request);

    SealResponse resp;
    *resp.mutable_sealed_export() = ToProto(sealed.record, ctx_.sealer->Options().verify_base_url);
    if (!req.include_archive()) {
      return resp;
    }
    // The bundle is already committed; failing here would make a retrying client seal it twice.
    try {
      resp.set_archive(BufferToString(ctx_.store->Get(sealed.record.storage_key)));
    } catch (const std::exception& e) {
      SEALER_LOG_WARN("sealed archive read-back failed",
                      {sealer::observability::StringField("bundle_id", sealed.record.bundle_id),
                       sealer::observability::StringField("storage_key", sealed.record.storage_key),
                       sealer::observability::BoolField("include_archive", true), sealer::observability::StringField("error", e.what())});
      resp.set_archive_omitted(true);
    }
    return resp;
  });
}

DownloadResponse SealedExportService::Download(const DownloadRequest& req) {
  return ObserveRpc("SealedExportService.Download", "bundle_id", req.bundle_id(), [&] {
    if (req.bundle_id().empty()) {
      throw util::InvalidArgument("download: bundle_id is required");
    }

    std::optional<db::model::SealedExportRecord> row;
    {
      auto tx = ctx_.repository->Begin();
      row     = ctx_.repository->GetSealedExport(*tx, req.bundle_id());
      tx->Commit();
    }
    if (!row) {
      throw util::NotFound("download: no sealed export with bundle_id " + req.bundle_id());
    }

    DownloadResponse resp;
    *resp.mutable_sealed_export() = ToProto(*row, ctx_.sealer->Options().verify_base_url);
    resp.set_archive(BufferToString(ctx_.store->Get(row->storage_key)));
    resp.set_file_name(row->bundle_id + ".zip");
    return resp;
  });
}

ListSealedExportsResponse SealedExportService::ListSealedExports(const ListSealedExportsRequest& req) {
  return ObserveRpc("SealedExportService.ListSealedExports", "tenant_id", req.tenant_id(), [&] {
    if (req.tenant_id().empty()) {
      throw util::InvalidArgument("list sealed exports: tenant_id is required");
    }

    db::model::SealedExportFilter filter;
    filter.tenant_id = req.tenant_id();
    if (req.export_type() != EXPORT_TYPE_UNSPECIFIED) {
      filter.export_type = std::string(manifest::ToString(FromProto(req.export_type())));
    }
    filter.limit  = req.limit() == 0 ? kDefaultListLimit : std::min(req.limit(), kMaxListLimit);
    filter.offset = req.offset();

    std::vector<db::model::SealedExportRecord> rows;
    {
      auto tx = ctx_.repository->Begin();
      rows    = ctx_.repository->ListSealedExports(*tx, filter);
      tx->Commit();
    }

    ListSealedExportsResponse resp;
    for (const auto& row : rows) {
      *resp.add_sealed_exports() = ToProto(row, ctx_.sealer->Options().verify_base_url);
    }
    return resp;
  });
}

sealer::v1::VerificationResult SealedExportService::Verify(const VerifyRequest& req) {
  return ObserveRpc("SealedExportService.Verify", "bundle_id", req.bundle_id(), [&] {
    if (req.bundle_id().empty()) {
      throw util::InvalidArgument("verify: bundle_id is required");
    }
    return ToProto(ctx_.verifier->VerifyBundle(req.bundle_id()));
  });
}

sealer::v1::VerificationResult SealedExportService::VerifyArchive(const VerifyArchiveRequest& req) {
  return ObserveRpc("SealedExportService.VerifyArchive", "archive_bytes", std::to_string(req.archive().size()),
                    [&] { return ToProto(ctx_.verifier->VerifyArchive(req.archive())); });
}

VerifyChainResponse SealedExportService::VerifyChain(const VerifyChainRequest& req) {
  return ObserveRpc("SealedExportService.VerifyChain", "tenant_id", req.tenant_id(), [&] {
    if (req.tenant_id().empty()) {
      throw util::InvalidArgument("verify chain: tenant_id is required");
    }

    const auto report = ctx_.verifier->VerifyChain(req.tenant_id(), req.verify_archives());

    VerifyChainResponse resp;
    resp.set_tenant_id(report.tenant_id);
    resp.set_intact(report.intact);
    resp.set_bundles_checked(report.bundles_checked);
    if (report.first_broken_bundle_id) resp.set_first_broken_bundle_id(*report.first_broken_bundle_id);
    resp.set_reason(ToProto(report.reason));
    resp.set_detail(report.detail);
    return resp;
  });
}

}
