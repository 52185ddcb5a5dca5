#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "internal/manifest/manifest.hpp"

namespace sealer::crypto {

// SHA-256 of bytes as 64 lowercase hex characters.
std::string Sha256Hex(std::string_view bytes);

/*
  Hashes every file into a manifest entry, preserving input order.

  With workers > 1 the files are split across that many threads. The call
  returns only once every digest is known.
*/
std::vector<manifest::ManifestFileEntry> HashFiles(const std::vector<manifest::BundleFile>& files,
                                                   std::size_t                              workers = 1);

} // namespace sealer::crypto
