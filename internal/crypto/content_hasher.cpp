#include "content_hasher.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <future>
#include <memory>
#include <stdexcept>

namespace sealer::crypto {

namespace {

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string ToHex(const unsigned char* data, unsigned int len) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(static_cast<size_t>(len) * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(kHex[data[i] >> 4]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

manifest::ManifestFileEntry HashOne(const manifest::BundleFile& file) {
  return manifest::ManifestFileEntry{
      .path = file.path, .sha256 = Sha256Hex(file.data), .bytes = file.data.size(), .content_type = file.content_type};
}

} // namespace

std::string Sha256Hex(std::string_view bytes) {
  MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  return ToHex(digest, digest_len);
}

std::vector<manifest::ManifestFileEntry> HashFiles(const std::vector<manifest::BundleFile>& files,
                                                   std::size_t                              workers) {
  std::vector<manifest::ManifestFileEntry> entries(files.size());

  workers = std::clamp<std::size_t>(workers, 1, std::max<std::size_t>(files.size(), 1));
  if (workers == 1) {
    for (size_t i = 0; i < files.size(); ++i) {
      entries[i] = HashOne(files[i]);
    }
    return entries;
  }

  // Strided split; each slot is written by exactly one worker.
  std::vector<std::future<void>> pending;
  pending.reserve(workers);
  for (size_t w = 0; w < workers; ++w) {
    pending.push_back(std::async(std::launch::async, [&, w] {
      for (size_t i = w; i < files.size(); i += workers) {
        entries[i] = HashOne(files[i]);
      }
    }));
  }
  for (auto& f : pending) {
    f.get();
  }
  return entries;
}

} // namespace sealer::crypto
