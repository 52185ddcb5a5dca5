#include "manifest_codec.hpp"

#include <cmath>

#include <google/protobuf/util/json_util.h>

#include "canonical_json.hpp"

namespace sealer::manifest {

namespace {

google::protobuf::Value String(const std::string& s) {
  google::protobuf::Value v;
  v.set_string_value(s);
  return v;
}

google::protobuf::Value Number(double d) {
  google::protobuf::Value v;
  v.set_number_value(d);
  return v;
}

google::protobuf::Value Null() {
  google::protobuf::Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

google::protobuf::Value OptionalString(const std::optional<std::string>& s) {
  return s ? String(*s) : Null();
}

const google::protobuf::Value& Field(const google::protobuf::Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end()) {
    throw ManifestFormatError("manifest field missing: " + key);
  }
  return it->second;
}

std::string StringField(const google::protobuf::Struct& object, const std::string& key) {
  const auto& v = Field(object, key);
  if (v.kind_case() != google::protobuf::Value::kStringValue) {
    throw ManifestFormatError("manifest field is not a string: " + key);
  }
  return v.string_value();
}

std::optional<std::string> OptionalStringField(const google::protobuf::Struct& object, const std::string& key) {
  const auto& v = Field(object, key);
  if (v.kind_case() == google::protobuf::Value::kNullValue) {
    return std::nullopt;
  }
  if (v.kind_case() != google::protobuf::Value::kStringValue) {
    throw ManifestFormatError("manifest field is not a string or null: " + key);
  }
  return v.string_value();
}

uint64_t UnsignedField(const google::protobuf::Struct& object, const std::string& key) {
  const auto& v = Field(object, key);
  if (v.kind_case() != google::protobuf::Value::kNumberValue) {
    throw ManifestFormatError("manifest field is not a number: " + key);
  }
  const double d = v.number_value();
  if (!std::isfinite(d) || d < 0 || std::trunc(d) != d || d > 9007199254740992.0) {
    throw ManifestFormatError("manifest field is not a non-negative integer: " + key);
  }
  return static_cast<uint64_t>(d);
}

const google::protobuf::Struct& ObjectField(const google::protobuf::Struct& object, const std::string& key) {
  const auto& v = Field(object, key);
  if (v.kind_case() != google::protobuf::Value::kStructValue) {
    throw ManifestFormatError("manifest field is not an object: " + key);
  }
  return v.struct_value();
}

} // namespace

google::protobuf::Value ToValue(const ExportManifest& manifest) {
  google::protobuf::Value root;
  auto&                   fields = *root.mutable_struct_value()->mutable_fields();

  fields["version"]      = Number(static_cast<double>(manifest.version));
  fields["bundle_id"]    = String(manifest.bundle_id);
  fields["generated_at"] = String(manifest.generated_at);

  auto& by = *fields["generated_by"].mutable_struct_value()->mutable_fields();
  by["user_id"]      = String(manifest.generated_by.user_id);
  by["display_name"] = String(manifest.generated_by.display_name);

  fields["tenant_id"]           = String(manifest.tenant_id);
  fields["export_type"]         = String(std::string(ToString(manifest.export_type)));
  fields["source_id"]           = OptionalString(manifest.source_id);
  fields["signature_algorithm"] = String(manifest.signature_algorithm);
  fields["signing_key_id"]      = String(manifest.signing_key_id);
  fields["verify_url"]          = String(manifest.verify_url);
  fields["prev_bundle_hash"]    = OptionalString(manifest.prev_bundle_hash);

  auto* files = fields["files"].mutable_list_value();
  for (const auto& entry : manifest.files) {
    auto& f = *files->add_values()->mutable_struct_value()->mutable_fields();
    f["path"]         = String(entry.path);
    f["sha256"]       = String(entry.sha256);
    f["bytes"]        = Number(static_cast<double>(entry.bytes));
    f["content_type"] = String(entry.content_type);
  }

  return root;
}

ExportManifest FromValue(const google::protobuf::Value& value) {
  if (value.kind_case() != google::protobuf::Value::kStructValue) {
    throw ManifestFormatError("manifest is not a JSON object");
  }
  const auto& root = value.struct_value();

  ExportManifest m;
  m.version = static_cast<int64_t>(UnsignedField(root, "version"));
  if (m.version != kManifestVersion) {
    throw ManifestFormatError("unsupported manifest version: " + std::to_string(m.version));
  }
  m.bundle_id    = StringField(root, "bundle_id");
  m.generated_at = StringField(root, "generated_at");

  const auto& by            = ObjectField(root, "generated_by");
  m.generated_by.user_id      = StringField(by, "user_id");
  m.generated_by.display_name = StringField(by, "display_name");

  m.tenant_id = StringField(root, "tenant_id");
  const auto export_type = ParseExportType(StringField(root, "export_type"));
  if (!export_type) {
    throw ManifestFormatError("unknown export_type in manifest");
  }
  m.export_type         = *export_type;
  m.source_id           = OptionalStringField(root, "source_id");
  m.signature_algorithm = StringField(root, "signature_algorithm");
  m.signing_key_id      = StringField(root, "signing_key_id");
  m.verify_url          = StringField(root, "verify_url");
  m.prev_bundle_hash    = OptionalStringField(root, "prev_bundle_hash");

  const auto& files = Field(root, "files");
  if (files.kind_case() != google::protobuf::Value::kListValue) {
    throw ManifestFormatError("manifest field is not an array: files");
  }
  for (const auto& item : files.list_value().values()) {
    if (item.kind_case() != google::protobuf::Value::kStructValue) {
      throw ManifestFormatError("manifest file entry is not an object");
    }
    const auto&       f = item.struct_value();
    ManifestFileEntry entry;
    entry.path         = StringField(f, "path");
    entry.sha256       = StringField(f, "sha256");
    entry.bytes        = UnsignedField(f, "bytes");
    entry.content_type = StringField(f, "content_type");
    m.files.push_back(std::move(entry));
  }
  if (m.files.empty()) {
    throw ManifestFormatError("manifest lists no files");
  }

  return m;
}

std::string CanonicalManifestJson(const ExportManifest& manifest) {
  return Canonicalize(ToValue(manifest));
}

ExportManifest ManifestFromJson(std::string_view json) {
  google::protobuf::Value value;
  const auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &value);
  if (!status.ok()) {
    throw ManifestFormatError("manifest.json is not valid JSON: " + std::string(status.message()));
  }
  return FromValue(value);
}

} // namespace sealer::manifest
