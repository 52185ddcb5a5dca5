#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace sealer::util {

/*
  UUID helpers

  Bundle ids are RFC4122 version 4 UUIDs drawn from the OpenSSL CSPRNG and
  always rendered lowercase with dashes.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(std::string_view str);

// True for the canonical 36 character dashed form, any version.
bool IsUUIDString(std::string_view str);

} // namespace sealer::util
