#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

namespace sealer::manifest {

/*
  Canonical JSON encoder.

  Output is the only byte form that may be hashed or signed:
   - no insignificant whitespace
   - object keys sorted by UTF-8 byte order, recursively
   - arrays keep their order
   - numbers formatted like ECMAScript Number.prototype.toString
   - strings escaped like JSON.stringify

  Null values must already be present in the tree; nothing is dropped.
  Throws std::invalid_argument on NaN/Infinity or an unset Value.
*/
std::string Canonicalize(const google::protobuf::Value& value);

// Exposed for tests.
std::string FormatNumber(double value);
std::string QuoteString(const std::string& value);

} // namespace sealer::manifest
