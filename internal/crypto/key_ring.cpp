#include "key_ring.hpp"

#include <cstdlib>
#include <stdexcept>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "signer.hpp"

namespace sealer::crypto {

namespace {

std::optional<std::string> Env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::string DecodeKey(const std::string& key_id, const std::string& hex) {
  auto material = HexDecode(hex);
  if (!material || material->empty()) {
    throw std::invalid_argument("signing key '" + key_id + "' is not a non-empty hex string");
  }
  return *material;
}

std::map<std::string, std::string> ParseLegacyJson(const std::string& json) {
  google::protobuf::Struct parsed;
  const auto               status = google::protobuf::util::JsonStringToMessage(json, &parsed);
  if (!status.ok()) {
    throw std::invalid_argument("SEALER_SIGNING_KEYS_LEGACY is not a JSON object: " + std::string(status.message()));
  }

  std::map<std::string, std::string> keys;
  for (const auto& [id, value] : parsed.fields()) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) {
      throw std::invalid_argument("legacy signing key '" + id + "' must be a hex string");
    }
    keys.emplace(id, value.string_value());
  }
  return keys;
}

} // namespace

KeyRing::KeyRing(std::optional<SigningKey> active, std::map<std::string, std::string> legacy)
    : active_(std::move(active)), legacy_(std::move(legacy)) {
}

KeyRing KeyRing::FromConfig(const sealer::runtime::config::SigningConfig& config) {
  std::string active_id  = Env("SEALER_SIGNING_KEY_ID").value_or(config.active_key_id());
  std::string active_hex = Env("SEALER_SIGNING_KEY").value_or(config.active_key_hex());

  std::map<std::string, std::string> legacy_hex(config.legacy_keys_hex().begin(), config.legacy_keys_hex().end());
  if (auto json = Env("SEALER_SIGNING_KEYS_LEGACY")) {
    legacy_hex = ParseLegacyJson(*json);
  }

  std::optional<SigningKey> active;
  if (!active_hex.empty()) {
    if (active_id.empty()) {
      throw std::invalid_argument("active signing key configured without a key id");
    }
    active = SigningKey{active_id, DecodeKey(active_id, active_hex)};
  }

  std::map<std::string, std::string> legacy;
  for (const auto& [id, hex] : legacy_hex) {
    legacy.emplace(id, DecodeKey(id, hex));
  }

  return KeyRing(std::move(active), std::move(legacy));
}

std::optional<SigningKey> KeyRing::Resolve(std::string_view key_id) const {
  if (active_ && active_->id == key_id) {
    return active_;
  }
  auto it = legacy_.find(std::string(key_id));
  if (it == legacy_.end()) {
    return std::nullopt;
  }
  return SigningKey{it->first, it->second};
}

SigningKey KeyRing::ActiveKey() const {
  if (!active_) {
    throw util::SigningKeyUnavailable("no active signing key configured");
  }
  return *active_;
}

} // namespace sealer::crypto
