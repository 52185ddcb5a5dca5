#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sealer::crypto {

// HMAC-SHA256 over bytes, base64 encoded. key is raw key material.
std::string Sign(std::string_view bytes, std::string_view key);

// Recomputes the MAC and compares in constant time. A signature that does not
// decode as base64 is reported as a mismatch.
bool Verify(std::string_view bytes, std::string_view signature, std::string_view key);

std::string                Base64Encode(std::string_view bytes);
std::optional<std::string> Base64Decode(std::string_view text);

std::optional<std::string> HexDecode(std::string_view hex);

} // namespace sealer::crypto
