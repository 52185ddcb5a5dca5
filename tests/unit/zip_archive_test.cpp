#include "internal/archive/zip_archive.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

using sealer::archive::ArchiveFormatError;
using sealer::archive::BuildArchive;
using sealer::archive::CheckEntryPath;
using sealer::archive::ReadArchive;

std::vector<sealer::manifest::BundleFile> SampleFiles() {
  return {
      {"report.pdf", "%PDF-1.4 test", "application/pdf"},
      {"photos/index.json", std::string(4096, 'x'), "application/json"},
      {"empty.txt", "", "text/plain"},
  };
}

void TestEntriesInOrderWithManifestLast() {
  const auto archive  = BuildArchive(SampleFiles(), R"({"k":1})", "c2ln");
  const auto contents = ReadArchive(archive);

  assert(contents.entries.size() == 5);
  assert(contents.entries[0].path == "report.pdf");
  assert(contents.entries[1].path == "photos/index.json");
  assert(contents.entries[2].path == "empty.txt");
  assert(contents.entries[3].path == "manifest.json");
  assert(contents.entries[4].path == "manifest.sig");

  assert(contents.Find("report.pdf")->data == "%PDF-1.4 test");
  assert(contents.Find("photos/index.json")->data == std::string(4096, 'x'));
  assert(contents.Find("empty.txt")->data.empty());
  assert(contents.Find("manifest.json")->data == R"({"k":1})");
  assert(contents.Find("manifest.sig")->data == "c2ln");
  assert(contents.Find("missing") == nullptr);

  for (const auto& entry : contents.entries) {
    assert(entry.crc_matches);
  }
}

void TestCompressibleEntriesShrink() {
  const auto archive = BuildArchive(SampleFiles(), "{}", "sig");
  // 4 KiB of one byte deflates to almost nothing.
  assert(archive.size() < 2048);
}

void TestArchiveStartsWithLocalHeader() {
  const auto archive = BuildArchive(SampleFiles(), "{}", "sig");
  assert(archive.substr(0, 4) == std::string("PK\x03\x04", 4));
}

void TestAlteredStoredBytesFlagCrc() {
  auto       archive = BuildArchive(SampleFiles(), "{}", "sig");
  const auto pos     = archive.find("%PDF-1.4 test");
  assert(pos != std::string::npos);
  archive[pos + 9] = 'T';

  const auto contents = ReadArchive(archive);
  const auto* entry   = contents.Find("report.pdf");
  assert(entry != nullptr);
  assert(entry->data == "%PDF-1.4 Test");
  assert(!entry->crc_matches);
  assert(contents.Find("manifest.json")->crc_matches);
}

void TestStructuralDamageThrows() {
  auto expect_error = [](const std::string& bytes) {
    bool threw = false;
    try {
      (void)ReadArchive(bytes);
    } catch (const ArchiveFormatError&) {
      threw = true;
    }
    assert(threw);
  };

  expect_error("");
  expect_error("definitely not a zip archive at all");

  const auto archive = BuildArchive(SampleFiles(), "{}", "sig");
  expect_error(archive.substr(0, archive.size() / 2));
  expect_error(archive.substr(0, archive.size() - 1));

  auto bad_central = archive;
  const auto central = bad_central.find(std::string("PK\x01\x02", 4));
  assert(central != std::string::npos);
  bad_central[central + 2] = 0x7f;
  expect_error(bad_central);
}

// Overwrites the uncompressed size of the first central directory entry.
void PatchFirstDeclaredSize(std::string& archive, uint32_t size) {
  const auto pos = archive.find(std::string("PK\x01\x02", 4));
  assert(pos != std::string::npos);
  for (int i = 0; i < 4; ++i) {
    archive[pos + 24 + i] = static_cast<char>((size >> (8 * i)) & 0xFF);
  }
}

bool ReadFails(const std::string& archive) {
  try {
    (void)ReadArchive(archive);
  } catch (const ArchiveFormatError&) {
    return true;
  }
  return false;
}

void TestDeclaredSizeMustMatchInflatedOutput() {
  const std::vector<sealer::manifest::BundleFile> files = {{"report.pdf", std::string(4096, 'x'), "application/pdf"}};
  const auto                                      archive = BuildArchive(files, "{}", "sig");

  auto huge = archive;
  PatchFirstDeclaredSize(huge, 0xfffffff0u);
  assert(ReadFails(huge));

  auto shorter = archive;
  PatchFirstDeclaredSize(shorter, 100);
  assert(ReadFails(shorter));

  auto longer = archive;
  PatchFirstDeclaredSize(longer, 4097);
  assert(ReadFails(longer));

  assert(ReadArchive(archive).Find("report.pdf")->data.size() == 4096);
}

void TestEntryPathRules() {
  assert(!CheckEntryPath("report.pdf"));
  assert(!CheckEntryPath("photos/2024/img-1.jpg"));
  assert(!CheckEntryPath("..data"));

  assert(CheckEntryPath(""));
  assert(CheckEntryPath("/etc/passwd"));
  assert(CheckEntryPath("a\\b"));
  assert(CheckEntryPath("a//b"));
  assert(CheckEntryPath("a/"));
  assert(CheckEntryPath("../escape"));
  assert(CheckEntryPath("a/./b"));
  assert(CheckEntryPath("manifest.json"));
  assert(CheckEntryPath("manifest.sig"));
  assert(CheckEntryPath(std::string("a\0b", 3)));
}

void TestModifiedTimeDoesNotAffectContents() {
  const auto a = ReadArchive(BuildArchive(SampleFiles(), "{}", "sig", sealer::util::FromUnixMillis(0)));
  const auto b = ReadArchive(BuildArchive(SampleFiles(), "{}", "sig", sealer::util::FromUnixMillis(1714555800000ULL)));
  assert(a.entries.size() == b.entries.size());
  for (size_t i = 0; i < a.entries.size(); ++i) {
    assert(a.entries[i].path == b.entries[i].path);
    assert(a.entries[i].data == b.entries[i].data);
  }
}

} // namespace

int main() {
  TestEntriesInOrderWithManifestLast();
  TestCompressibleEntriesShrink();
  TestArchiveStartsWithLocalHeader();
  TestAlteredStoredBytesFlagCrc();
  TestStructuralDamageThrows();
  TestDeclaredSizeMustMatchInflatedOutput();
  TestEntryPathRules();
  TestModifiedTimeDoesNotAffectContents();

  std::cout << "export_sealer_unit_zip_archive: pass\n";
  return 0;
}
