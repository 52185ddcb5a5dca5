#include "uuid.hpp"

#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sealer::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

UUID GenerateUUID() {
  UUID id{};
  if (RAND_bytes(id.data(), static_cast<int>(id.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed while generating bundle id");
  }

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

bool IsUUIDString(std::string_view str) {
  if (str.size() != 36) return false;
  for (size_t i = 0; i < str.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (str[i] != '-') return false;
      continue;
    }
    if (HexNibble(str[i]) < 0) return false;
  }
  return true;
}

UUID FromString(std::string_view str) {
  if (!IsUUIDString(str)) throw std::invalid_argument("Invalid UUID string: " + std::string(str));

  UUID   id{};
  size_t out = 0;
  for (size_t i = 0; i < str.size(); i += 2) {
    if (str[i] == '-') ++i;
    id[out++] = static_cast<uint8_t>((HexNibble(str[i]) << 4) | HexNibble(str[i + 1]));
  }
  return id;
}

} // namespace sealer::util
