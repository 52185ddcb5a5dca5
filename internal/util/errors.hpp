#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sealer::util {

/*
  Central error types.

  These get translated later to gRPC status codes. Verification failures
  are not errors and never travel through here.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// No usable key to seal with. Distinct from a verifier that cannot resolve a key id.
class SigningKeyUnavailable : public std::runtime_error {
 public:
  explicit SigningKeyUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Archive upload failed after all retries; nothing was persisted.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Ledger write failed after the archive was stored.
class PersistenceError : public std::runtime_error {
 public:
  PersistenceError(const std::string& msg, std::string orphaned_storage_key)
      : std::runtime_error(msg), orphaned_storage_key_(std::move(orphaned_storage_key)) {
  }

  const std::string& orphaned_storage_key() const noexcept {
    return orphaned_storage_key_;
  }

 private:
  std::string orphaned_storage_key_;
};

// Another seal for the same tenant kept winning the predecessor slot.
class ChainConflict : public std::runtime_error {
 public:
  explicit ChainConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic transaction lost against a concurrent commit.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace sealer::util
