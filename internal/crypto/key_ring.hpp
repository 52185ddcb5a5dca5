#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace sealer::crypto {

struct SigningKey {
  std::string id;
  std::string material;  // raw bytes, never logged
};

/*
  Signing key lookup with rotation support.

  One active key seals new bundles. Retired keys stay in the legacy table
  so bundles they signed keep verifying. Resolution checks the active key
  first, then the legacy table.
*/
class KeyRing {
 public:
  KeyRing() = default;
  KeyRing(std::optional<SigningKey> active, std::map<std::string, std::string> legacy);

  // Keys arrive hex encoded from config; environment variables take precedence:
  //   SEALER_SIGNING_KEY_ID, SEALER_SIGNING_KEY, SEALER_SIGNING_KEYS_LEGACY (JSON object).
  // Throws std::invalid_argument on malformed hex or legacy JSON.
  static KeyRing FromConfig(const sealer::runtime::config::SigningConfig& config);

  std::optional<SigningKey> Resolve(std::string_view key_id) const;

  // Key used for sealing. Throws util::SigningKeyUnavailable when none is configured.
  SigningKey ActiveKey() const;

  bool HasActiveKey() const {
    return active_.has_value();
  }

  size_t LegacyKeyCount() const {
    return legacy_.size();
  }

 private:
  std::optional<SigningKey>          active_;
  std::map<std::string, std::string> legacy_;
};

} // namespace sealer::crypto
