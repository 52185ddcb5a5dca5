#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/sealer_client.h"

int main(int argc, char** argv) {
  // Allow overriding the service endpoint for remote or containerized runs.
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";
  const std::string tenant = argc > 2 ? argv[2] : "example-tenant";

  sealer::client::SealerClient client(sealer::client::CreateSealerChannel(target));

  // Seal a small two-file report and ask for the archive bytes back.
  sealer::v1::SealRequest req;
  req.set_tenant_id(tenant);
  req.set_export_type(sealer::v1::EXPORT_TYPE_INSPECTION_REPORT);
  req.set_source_id("inspection-42");
  req.mutable_generated_by()->set_user_id("user-1");
  req.mutable_generated_by()->set_display_name("Example Inspector");
  req.set_include_archive(true);

  auto* report = req.add_files();
  report->set_path("report.pdf");
  report->set_data("%PDF-1.4 ...");
  report->set_content_type("application/pdf");

  auto* photos = req.add_files();
  photos->set_path("photos/index.json");
  photos->set_data(R"({"photos":[]})");
  photos->set_content_type("application/json");

  auto sealed = client.Seal(req);
  if (!sealed.ok()) {
    std::cerr << "Seal failed: " << sealed.status().ToString() << '\n';
    return 1;
  }

  const auto& record = sealed->sealed_export;
  std::cout << "Sealed bundle " << record.bundle_id() << " seq=" << record.chain_seq() << " sha256=" << record.manifest_sha256() << '\n'
            << "  prev=" << (record.has_prev_bundle_hash() ? record.prev_bundle_hash() : "null") << '\n'
            << "  verify at " << record.verify_url() << '\n';

  // Verify the returned bytes as an offline holder of the zip would.
  auto offline = client.VerifyArchive(sealed->archive);
  if (!offline.ok()) {
    std::cerr << "VerifyArchive failed: " << offline.status().ToString() << '\n';
    return 1;
  }
  std::cout << "Archive verification: " << sealer::v1::VerificationReason_Name(offline->reason()) << '\n';

  auto chain = client.VerifyChain(tenant, /*verify_archives=*/true);
  if (!chain.ok()) {
    std::cerr << "VerifyChain failed: " << chain.status().ToString() << '\n';
    return 1;
  }
  std::cout << "Chain intact=" << (chain->intact() ? "true" : "false") << " bundles=" << chain->bundles_checked() << '\n';

  return chain->intact() && offline->valid() ? 0 : 2;
}
