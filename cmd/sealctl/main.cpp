#include <arrow/io/file.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "client/cpp/sealer_client.h"
#include "internal/manifest/export_type.hpp"

using namespace sealer::v1;
using sealer::client::SealerClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  sealctl <addr> seal <tenant> <export_type> <user_id> <file>... [--source <id>] [--name <display>] [--out <zip>]\n"
            << "  sealctl <addr> download <bundle_id> [out.zip]\n"
            << "  sealctl <addr> list <tenant> [export_type] [limit] [offset]\n"
            << "  sealctl <addr> verify <bundle_id>\n"
            << "  sealctl <addr> verify-file <archive.zip>\n"
            << "  sealctl <addr> chain <tenant> [--archives]\n"
            << "\n"
            << "export_type: inspection_report | pdf_report | defect_export | claims_pack\n";
}

static std::optional<ExportType> ParseType(const std::string& value) {
  const auto parsed = sealer::manifest::ParseExportType(value);
  if (!parsed) return std::nullopt;
  return static_cast<ExportType>(*parsed);
}

static std::string ContentTypeFor(const std::string& path) {
  const auto dot = path.find_last_of('.');
  const auto ext = dot == std::string::npos ? std::string() : path.substr(dot + 1);
  if (ext == "pdf") return "application/pdf";
  if (ext == "json") return "application/json";
  if (ext == "csv") return "text/csv";
  if (ext == "txt") return "text/plain";
  if (ext == "png") return "image/png";
  if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
  if (ext == "zip") return "application/zip";
  return "application/octet-stream";
}

static std::string BaseName(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

static bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

static bool WriteFile(const std::string& path, const std::shared_ptr<arrow::Buffer>& buffer) {
  auto file = arrow::io::FileOutputStream::Open(path);
  if (!file.ok()) {
    std::cerr << file.status().ToString() << "\n";
    return false;
  }
  auto status = (*file)->Write(buffer);
  if (status.ok()) status = (*file)->Close();
  if (!status.ok()) {
    std::cerr << status.ToString() << "\n";
    return false;
  }
  return true;
}

static void PrintExport(const SealedExport& e) {
  std::cout << "bundle_id=" << e.bundle_id() << " tenant=" << e.tenant_id() << " seq=" << e.chain_seq()
            << " type=" << ExportType_Name(e.export_type()) << " files=" << e.file_count() << " bytes=" << e.total_bytes()
            << " sha256=" << e.manifest_sha256() << " prev=" << (e.has_prev_bundle_hash() ? e.prev_bundle_hash() : "null")
            << " generated_at=" << e.generated_at() << "\n";
}

static int PrintVerification(const VerificationResult& r) {
  std::cout << "valid=" << (r.valid() ? "true" : "false") << " reason=" << VerificationReason_Name(r.reason())
            << " bundle_id=" << r.bundle_id() << " key=" << r.signing_key_id()
            << " chain_checked=" << (r.chain_checked() ? "true" : "false");
  if (!r.detail().empty()) std::cout << " detail=\"" << r.detail() << "\"";
  std::cout << "\n";
  return r.valid() ? 0 : 3;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  SealerClient client(sealer::client::CreateSealerChannel(addr));

  // ------------------------------------------------------------

  if (cmd == "seal") {
    if (argc < 7) {
      Usage();
      return 1;
    }

    const auto type = ParseType(argv[4]);
    if (!type) {
      std::cerr << "unsupported export type: " << argv[4] << "\n";
      return 1;
    }

    SealRequest req;
    req.set_tenant_id(argv[3]);
    req.set_export_type(*type);
    req.mutable_generated_by()->set_user_id(argv[5]);

    std::string out_path;
    for (int i = 6; i < argc; ++i) {
      const std::string arg = argv[i];
      if ((arg == "--source" || arg == "--name" || arg == "--out") && i + 1 < argc) {
        const std::string value = argv[++i];
        if (arg == "--source") req.set_source_id(value);
        if (arg == "--name") req.mutable_generated_by()->set_display_name(value);
        if (arg == "--out") out_path = value;
        continue;
      }

      auto* file = req.add_files();
      if (!ReadFile(arg, file->mutable_data())) {
        std::cerr << "cannot read " << arg << "\n";
        return 1;
      }
      file->set_path(BaseName(arg));
      file->set_content_type(ContentTypeFor(arg));
    }
    req.set_include_archive(!out_path.empty());

    auto sealed = client.Seal(req);
    if (!sealed.ok()) {
      std::cerr << sealed.status().ToString() << "\n";
      return 2;
    }

    PrintExport(sealed->sealed_export);
    std::cout << "verify_url=" << sealed->sealed_export.verify_url() << "\n";
    if (out_path.empty()) {
      return 0;
    }
    auto archive = sealed->archive;
    if (!archive) {
      auto downloaded = client.Download(sealed->sealed_export.bundle_id());
      if (!downloaded.ok()) {
        std::cerr << "sealed, but the archive could not be fetched: " << downloaded.status().ToString() << "\n";
        return 2;
      }
      archive = downloaded->archive;
    }
    if (!WriteFile(out_path, archive)) {
      return 2;
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "download") {
    if (argc < 4) return 1;

    auto downloaded = client.Download(argv[3]);
    if (!downloaded.ok()) {
      std::cerr << downloaded.status().ToString() << "\n";
      return 2;
    }

    const std::string out_path = argc >= 5 ? argv[4] : std::string(argv[3]) + ".zip";
    if (!WriteFile(out_path, downloaded->archive)) {
      return 2;
    }
    std::cout << "wrote " << out_path << " (" << downloaded->archive->size() << " bytes)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    if (argc < 4) return 1;

    ExportType type = EXPORT_TYPE_UNSPECIFIED;
    if (argc >= 5) {
      auto parsed = ParseType(argv[4]);
      if (!parsed) {
        std::cerr << "unsupported export type: " << argv[4] << "\n";
        return 1;
      }
      type = *parsed;
    }
    const uint32_t limit  = argc >= 6 ? static_cast<uint32_t>(std::stoul(argv[5])) : 0;
    const uint32_t offset = argc >= 7 ? static_cast<uint32_t>(std::stoul(argv[6])) : 0;

    auto listed = client.List(argv[3], type, limit, offset);
    if (!listed.ok()) {
      std::cerr << listed.status().ToString() << "\n";
      return 2;
    }
    for (const auto& e : *listed) {
      PrintExport(e);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "verify") {
    if (argc < 4) return 1;

    auto result = client.Verify(argv[3]);
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }
    return PrintVerification(*result);
  }

  // ------------------------------------------------------------

  if (cmd == "verify-file") {
    if (argc < 4) return 1;

    std::string bytes;
    if (!ReadFile(argv[3], &bytes)) {
      std::cerr << "cannot read " << argv[3] << "\n";
      return 1;
    }

    auto result = client.VerifyArchive(arrow::Buffer::FromString(std::move(bytes)));
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }
    return PrintVerification(*result);
  }

  // ------------------------------------------------------------

  if (cmd == "chain") {
    if (argc < 4) return 1;

    const bool verify_archives = argc >= 5 && std::string(argv[4]) == "--archives";

    auto report = client.VerifyChain(argv[3], verify_archives);
    if (!report.ok()) {
      std::cerr << report.status().ToString() << "\n";
      return 2;
    }

    std::cout << "tenant=" << report->tenant_id() << " intact=" << (report->intact() ? "true" : "false")
              << " bundles_checked=" << report->bundles_checked();
    if (!report->intact()) {
      std::cout << " first_broken=" << report->first_broken_bundle_id() << " reason=" << VerificationReason_Name(report->reason())
                << " detail=\"" << report->detail() << "\"";
    }
    std::cout << "\n";
    return report->intact() ? 0 : 3;
  }

  Usage();
  return 1;
}
