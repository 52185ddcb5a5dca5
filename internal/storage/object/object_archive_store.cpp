#include "object_archive_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace sealer::storage {

using namespace sealer::storage::common;

ObjectArchiveStore::ObjectArchiveStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
}

/*
  Object layout:

      <root_path>/<key>
*/
std::string ObjectArchiveStore::ObjectPath(const std::string& key) const {
  ValidateStorageKey(key);
  if (root_path_.empty()) {
    return key;
  }
  if (root_path_.back() == '/') {
    return root_path_ + key;
  }
  return root_path_ + "/" + key;
}

bool ObjectArchiveStore::IsLocal() const {
  return fs_->type_name() == "local";
}

void ObjectArchiveStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, const ObjectMetadata& metadata) {
  const auto path = ObjectPath(key);
  const auto dir  = path.substr(0, path.find_last_of('/'));
  if (dir != path) {
    Unwrap(fs_->CreateDir(dir, /*recursive=*/true));
  }

  if (!IsLocal()) {
    auto out = Unwrap(fs_->OpenOutputStream(path, ToKeyValueMetadata(metadata)));
    Unwrap(out->Write(buffer->data(), buffer->size()));
    Unwrap(out->Close());
    return;
  }

  const auto tmp = path + ".tmp-" + util::ToString(util::GenerateUUID());
  try {
    auto out = Unwrap(fs_->OpenOutputStream(tmp));
    Unwrap(out->Write(buffer->data(), buffer->size()));
    Unwrap(out->Close());
    Unwrap(fs_->Move(tmp, path));
  } catch (const std::exception&) {
    auto status = fs_->DeleteFile(tmp);
    if (!status.ok()) {
      SEALER_LOG_WARN("temporary archive cleanup failed", {observability::StringField("path", tmp),
                                                           observability::StringField("error", status.ToString())});
    }
    throw;
  }
}

/*
  Download full object
*/
std::shared_ptr<arrow::Buffer> ObjectArchiveStore::Get(const std::string& key) {
  const auto path = ObjectPath(key);
  auto       info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() != arrow::fs::FileType::File) {
    throw util::NotFound("archive not found: " + key);
  }
  return ReadAll(Unwrap(fs_->OpenInputFile(info)));
}

std::optional<ObjectInfo> ObjectArchiveStore::Stat(const std::string& key) {
  const auto path = ObjectPath(key);
  auto       info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() != arrow::fs::FileType::File) {
    return std::nullopt;
  }

  ObjectInfo out;
  out.size_bytes = static_cast<uint64_t>(info.size());
  auto input     = Unwrap(fs_->OpenInputStream(info));
  out.metadata   = FromKeyValueMetadata(Unwrap(input->ReadMetadata()));
  Unwrap(input->Close());
  return out;
}

void ObjectArchiveStore::Remove(const std::string& key) {
  const auto path = ObjectPath(key);
  auto       info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() == arrow::fs::FileType::NotFound) {
    return;
  }
  Unwrap(fs_->DeleteFile(path));
}

} // namespace sealer::storage
