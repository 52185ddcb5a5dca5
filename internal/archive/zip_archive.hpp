#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "internal/manifest/manifest.hpp"
#include "internal/util/time.hpp"

namespace sealer::archive {

/*
  Zip container for sealed bundles.

  Writes a plain PKZIP 2.0 archive (no zip64, no encryption) so any stock
  unzip tool can list and extract it. Entries are raw deflate at level 6, or
  stored when deflate does not help. Entry order: source files as given,
  then manifest.json, then manifest.sig.
*/

class ArchiveFormatError : public std::runtime_error {
 public:
  explicit ArchiveFormatError(const std::string& msg) : std::runtime_error(msg) {
  }
};

struct ArchiveEntry {
  std::string path;
  std::string data;
  bool        crc_matches = true;
};

struct ArchiveContents {
  std::vector<ArchiveEntry> entries;

  const ArchiveEntry* Find(std::string_view path) const;
};

// Returns a description of what is wrong with path as a bundle entry name, or nullopt.
// Rejects empty, absolute, backslash, "." / ".." segments and the reserved manifest names.
std::optional<std::string> CheckEntryPath(std::string_view path);

// manifest_json must be the canonical bytes; they are stored verbatim.
std::string BuildArchive(const std::vector<manifest::BundleFile>& files, std::string_view manifest_json,
                         std::string_view signature, util::TimePoint modified_at = util::TimePoint{});

// Throws ArchiveFormatError on structural damage. A CRC mismatch is not structural:
// it is flagged on the entry so content checks can name the altered file.
ArchiveContents ReadArchive(std::string_view archive);

} // namespace sealer::archive
