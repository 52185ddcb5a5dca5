#include "canonical_json.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace sealer::manifest {

namespace {

void AppendValue(const google::protobuf::Value& value, std::string& out);

void AppendStruct(const google::protobuf::Struct& object, std::string& out) {
  std::vector<const std::string*> keys;
  keys.reserve(static_cast<size_t>(object.fields_size()));
  for (const auto& [key, _] : object.fields()) {
    keys.push_back(&key);
  }
  std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

  out.push_back('{');
  bool first = true;
  for (const std::string* key : keys) {
    if (!first) out.push_back(',');
    first = false;
    out += QuoteString(*key);
    out.push_back(':');
    AppendValue(object.fields().at(*key), out);
  }
  out.push_back('}');
}

void AppendValue(const google::protobuf::Value& value, std::string& out) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
      out += "null";
      return;
    case google::protobuf::Value::kBoolValue:
      out += value.bool_value() ? "true" : "false";
      return;
    case google::protobuf::Value::kNumberValue:
      out += FormatNumber(value.number_value());
      return;
    case google::protobuf::Value::kStringValue:
      out += QuoteString(value.string_value());
      return;
    case google::protobuf::Value::kListValue: {
      out.push_back('[');
      bool first = true;
      for (const auto& item : value.list_value().values()) {
        if (!first) out.push_back(',');
        first = false;
        AppendValue(item, out);
      }
      out.push_back(']');
      return;
    }
    case google::protobuf::Value::kStructValue:
      AppendStruct(value.struct_value(), out);
      return;
    case google::protobuf::Value::KIND_NOT_SET:
      break;
  }
  throw std::invalid_argument("canonical json: value has no kind set");
}

} // namespace

std::string FormatNumber(double value) {
  if (!std::isfinite(value)) {
    throw std::invalid_argument("canonical json: non-finite number");
  }
  if (value == 0) {
    return "0";  // also covers -0
  }

  // Shortest round-trip digits, then laid out by the ECMAScript rules.
  char buf[64];
  auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
  if (ec != std::errc()) {
    throw std::invalid_argument("canonical json: number formatting failed");
  }
  std::string_view sci(buf, static_cast<size_t>(end - buf));

  std::string out;
  if (sci.front() == '-') {
    out.push_back('-');
    sci.remove_prefix(1);
  }

  const size_t e_pos = sci.find('e');
  std::string  digits;
  for (char c : sci.substr(0, e_pos)) {
    if (c != '.') digits.push_back(c);
  }
  int exponent = 0;
  std::from_chars(sci.data() + e_pos + 1 + (sci[e_pos + 1] == '+' ? 1 : 0), sci.data() + sci.size(), exponent);

  const int k = static_cast<int>(digits.size());
  const int n = exponent + 1;

  if (k <= n && n <= 21) {
    out += digits;
    out.append(static_cast<size_t>(n - k), '0');
  } else if (0 < n && n <= 21) {
    out += digits.substr(0, static_cast<size_t>(n));
    out.push_back('.');
    out += digits.substr(static_cast<size_t>(n));
  } else if (-6 < n && n <= 0) {
    out += "0.";
    out.append(static_cast<size_t>(-n), '0');
    out += digits;
  } else {
    out.push_back(digits[0]);
    if (k > 1) {
      out.push_back('.');
      out += digits.substr(1);
    }
    out.push_back('e');
    out.push_back(n - 1 < 0 ? '-' : '+');
    out += std::to_string(std::abs(n - 1));
  }
  return out;
}

std::string QuoteString(const std::string& value) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (char ch : value) {
    const auto c = static_cast<unsigned char>(ch);
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          out += "\\u00";
          out.push_back(kHex[c >> 4]);
          out.push_back(kHex[c & 0x0F]);
        } else {
          out.push_back(ch);
        }
    }
  }
  out.push_back('"');
  return out;
}

std::string Canonicalize(const google::protobuf::Value& value) {
  std::string out;
  AppendValue(value, out);
  return out;
}

} // namespace sealer::manifest
