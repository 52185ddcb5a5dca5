#include <arrow/buffer.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "client/cpp/sealer_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"

namespace {

const char* kConfig = R"(server:
  bind_address: "127.0.0.1:0"
database:
  memory: {}
storage:
  filesystem: FILE_SYSTEM_MEMORY
signing:
  active_key_id: "k-2025"
  active_key_hex: "7365616c65722d726f756e642d74726970"
sealing:
  verify_base_url: "https://verify.example.com"
logging:
  level: warn
)";

sealer::v1::SealRequest MakeSealRequest(const std::string& body) {
  sealer::v1::SealRequest req;
  req.set_tenant_id("acme");
  req.set_export_type(sealer::v1::EXPORT_TYPE_DEFECT_EXPORT);
  req.mutable_generated_by()->set_user_id("user-1");
  req.set_include_archive(true);

  auto* csv = req.add_files();
  csv->set_path("defects.csv");
  csv->set_data(body);
  csv->set_content_type("text/csv");
  return req;
}

void TestSealDownloadAndVerifyOverGrpc(sealer::client::SealerClient& client) {
  auto first = client.Seal(MakeSealRequest("id,severity\n1,high\n"));
  assert(first.ok());
  assert(first->sealed_export.chain_seq() == 1);
  assert(first->archive && first->archive->size() > 0);

  auto second = client.Seal(MakeSealRequest("id,severity\n2,low\n"));
  assert(second.ok());
  assert(second->sealed_export.prev_bundle_hash() == first->sealed_export.manifest_sha256());

  auto downloaded = client.Download(second->sealed_export.bundle_id());
  assert(downloaded.ok());
  assert(downloaded->archive->Equals(*second->archive));

  auto listed = client.List("acme");
  assert(listed.ok());
  assert(listed->size() == 2);
  assert((*listed)[0].bundle_id() == second->sealed_export.bundle_id());

  auto verified = client.Verify(first->sealed_export.bundle_id());
  assert(verified.ok());
  assert(verified->valid());
  assert(verified->chain_checked());

  auto uploaded = client.VerifyArchive(second->archive);
  assert(uploaded.ok());
  assert(uploaded->valid());
  assert(uploaded->chain_seq() == 2);

  auto chain = client.VerifyChain("acme", true);
  assert(chain.ok());
  assert(chain->intact());
  assert(chain->bundles_checked() == 2);
}

void TestErrorsSurfaceAsStatuses(sealer::client::SealerClient& client) {
  auto missing = client.Download("00000000-0000-4000-8000-000000000000");
  assert(!missing.ok());
  assert(missing.status().IsKeyError());

  auto request = MakeSealRequest("x");
  request.set_export_type(sealer::v1::EXPORT_TYPE_UNSPECIFIED);
  auto rejected = client.Seal(request);
  assert(!rejected.ok());
  assert(rejected.status().IsInvalid());

  auto tampered = client.VerifyArchive(arrow::Buffer::FromString("PK\x03\x04 truncated"));
  assert(tampered.ok());
  assert(!tampered->valid());
  assert(tampered->reason() == sealer::v1::VERIFICATION_REASON_MALFORMED_ARCHIVE);
}

} // namespace

int main() {
  auto config = sealer::config::ConfigLoader::LoadFromYamlString(kConfig);
  sealer::config::ConfigLoader::Validate(config);

  auto app = sealer::factory::Build(config);

  sealer::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
  server.Start();
  assert(server.BoundPort() > 0);

  sealer::client::SealerClient client(sealer::client::CreateSealerChannel("127.0.0.1:" + std::to_string(server.BoundPort())));

  TestSealDownloadAndVerifyOverGrpc(client);
  TestErrorsSurfaceAsStatuses(client);

  server.Stop();

  std::cout << "export_sealer_integration_grpc_round_trip: pass\n";
  return 0;
}
