#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sealer::storage::common {

inline constexpr std::string_view kDefaultKeyPrefix = "sealed-exports";
inline constexpr std::size_t      kMaxTenantIdLength = 128;

inline bool IsValidTenantId(std::string_view tenant_id) {
  if (tenant_id.empty() || tenant_id.size() > kMaxTenantIdLength) return false;
  if (tenant_id == "." || tenant_id == "..") return false;
  for (char c : tenant_id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    if (!ok) return false;
  }
  return true;
}

inline void ValidateStorageKey(const std::string& key) {
  if (key.empty()) {
    throw std::invalid_argument("storage key must not be empty");
  }
  if (key.front() == '/' || key.back() == '/') {
    throw std::invalid_argument("storage key must be relative");
  }
  std::string_view rest = key;
  while (!rest.empty()) {
    const auto       slash   = rest.find('/');
    std::string_view segment = rest.substr(0, slash);
    if (segment.empty() || segment == "." || segment == "..") {
      throw std::invalid_argument("storage key contains an invalid segment: " + key);
    }
    if (segment.find('\\') != std::string_view::npos || segment.find('\0') != std::string_view::npos) {
      throw std::invalid_argument("storage key contains invalid character: " + key);
    }
    rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash + 1);
  }
}

/*
  Storage key layout:

      <prefix>/<tenant_id>/<bundle_id>.zip
*/
inline std::string StorageKey(std::string_view prefix, const std::string& tenant_id, const std::string& bundle_id) {
  if (!IsValidTenantId(tenant_id)) {
    throw std::invalid_argument("tenant id is not usable in a storage key: " + tenant_id);
  }
  std::string p(prefix.empty() ? kDefaultKeyPrefix : prefix);
  while (!p.empty() && p.back() == '/') p.pop_back();

  std::string key = p.empty() ? std::string() : p + "/";
  key += tenant_id + "/" + bundle_id + ".zip";
  ValidateStorageKey(key);
  return key;
}

} // namespace sealer::storage::common
