#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "manifest.hpp"

namespace sealer::manifest {

class ManifestFormatError : public std::runtime_error {
 public:
  explicit ManifestFormatError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Manifest <-> JSON object tree. Optional fields always materialize as null.
google::protobuf::Value ToValue(const ExportManifest& manifest);
ExportManifest          FromValue(const google::protobuf::Value& value);

// Canonical bytes; the input to hashing and signing.
std::string CanonicalManifestJson(const ExportManifest& manifest);

// Parses manifest.json as found in an archive. Throws ManifestFormatError.
ExportManifest ManifestFromJson(std::string_view json);

} // namespace sealer::manifest
